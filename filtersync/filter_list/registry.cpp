/*!
 * @file
 * @brief In-memory registry of filter lists.
 */

#include <filtersync/filter_list/registry.hpp>

#include <filtersync/exception.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace filtersync::filter_list
{

registry_t::registry_t( std::chrono::milliseconds update_period )
	:	m_update_period{ update_period }
{}

void
registry_t::ensure_unique(
	std::string_view name,
	std::string_view url ) const
{
	std::lock_guard< std::mutex > lock{ m_lock };

	if( find_conflict( name, url ) != m_entries.end() )
		throw duplicate_error_t{
				fmt::format( "filter with name '{}' or URL '{}' already exists",
						name, url )
			};
}

void
registry_t::insert( filter_entry_t entry )
{
	std::lock_guard< std::mutex > lock{ m_lock };

	if( find_conflict( entry.m_name, entry.m_url ) != m_entries.end() )
		throw duplicate_error_t{
				fmt::format( "filter with name '{}' or URL '{}' already exists",
						entry.m_name, entry.m_url )
			};

	if( find_by_id( entry.m_id ) != m_entries.end() )
		throw duplicate_error_t{
				fmt::format( "filter with id {} already exists", entry.m_id )
			};

	m_entries.push_back( std::move(entry) );
}

std::optional< filter_entry_t >
registry_t::remove( std::string_view url )
{
	std::optional< filter_entry_t > result;

	std::lock_guard< std::mutex > lock{ m_lock };

	const auto it = std::find_if( m_entries.begin(), m_entries.end(),
			[url]( const filter_entry_t & e ) { return e.m_url == url; } );
	if( it != m_entries.end() )
	{
		result = std::move(*it);
		m_entries.erase( it );
	}

	return result;
}

std::optional< filter_entry_t >
registry_t::select_due( time_point_t now )
{
	std::lock_guard< std::mutex > lock{ m_lock };

	for( auto & e : m_entries )
	{
		if( e.m_enabled && e.m_next_update <= now )
		{
			// The next attempt is reserved right now, before the download.
			e.m_next_update = now +
					std::chrono::duration_cast< clock_t::duration >(
							m_update_period );
			return e;
		}
	}

	return std::nullopt;
}

bool
registry_t::stage( const staged_update_t & update )
{
	std::lock_guard< std::mutex > lock{ m_lock };

	const auto it = find_by_id( update.m_id );
	if( it == m_entries.end() )
		return false;

	it->m_pending_id = update.m_staged_id;
	it->m_rule_count = update.m_rule_count;
	it->m_last_updated = update.m_updated_at;

	return true;
}

std::vector< pending_update_t >
registry_t::pending_updates() const
{
	std::vector< pending_update_t > result;

	std::lock_guard< std::mutex > lock{ m_lock };

	for( const auto & e : m_entries )
	{
		if( e.has_pending_update() && e.m_pending_id != e.m_id )
			result.push_back( pending_update_t{
					e.m_id, e.m_pending_id, e.m_url } );
	}

	return result;
}

bool
registry_t::complete_pending( filter_id_t id, filter_id_t staged_id )
{
	std::lock_guard< std::mutex > lock{ m_lock };

	const auto it = find_by_id( id );
	if( it == m_entries.end() || it->m_pending_id != staged_id )
		return false;

	it->m_pending_id = no_pending_id;

	return true;
}

registry_t::entry_container_t
registry_t::snapshot() const
{
	std::lock_guard< std::mutex > lock{ m_lock };

	return m_entries;
}

std::optional< filter_entry_t >
registry_t::find( std::string_view url ) const
{
	std::lock_guard< std::mutex > lock{ m_lock };

	const auto it = std::find_if( m_entries.begin(), m_entries.end(),
			[url]( const filter_entry_t & e ) { return e.m_url == url; } );
	if( it != m_entries.end() )
		return *it;

	return std::nullopt;
}

std::size_t
registry_t::size() const
{
	std::lock_guard< std::mutex > lock{ m_lock };

	return m_entries.size();
}

registry_t::entry_container_t::const_iterator
registry_t::find_conflict(
	std::string_view name,
	std::string_view url ) const noexcept
{
	return std::find_if( m_entries.begin(), m_entries.end(),
			[name, url]( const filter_entry_t & e ) {
				return e.m_name == name || e.m_url == url;
			} );
}

registry_t::entry_container_t::iterator
registry_t::find_by_id( filter_id_t id ) noexcept
{
	return std::find_if( m_entries.begin(), m_entries.end(),
			[id]( const filter_entry_t & e ) { return e.m_id == id; } );
}

} /* namespace filtersync::filter_list */

