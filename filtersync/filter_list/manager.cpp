/*!
 * @file
 * @brief Adding and removing of filter lists.
 */

#include <filtersync/filter_list/manager.hpp>
#include <filtersync/filter_list/rule_counter.hpp>

#include <filtersync/logging/wrap_logging.hpp>

#include <filtersync/exception.hpp>

#include <fmt/std.h>

namespace filtersync::filter_list
{

manager_t::manager_t(
	registry_t & registry,
	const storage_t & storage,
	downloader_t & downloader,
	id_source_t & ids )
	:	m_registry{ registry }
	,	m_storage{ storage }
	,	m_downloader{ downloader }
	,	m_ids{ ids }
{}

filter_entry_t
manager_t::add( new_filter_t candidate )
{
	m_registry.ensure_unique( candidate.m_name, candidate.m_url );

	filter_entry_t entry;
	entry.m_id = m_ids.next();
	entry.m_enabled = true;
	entry.m_name = std::move(candidate.m_name);
	entry.m_url = std::move(candidate.m_url);

	try
	{
		entry.m_rule_count = m_downloader.download_to(
				entry.m_url, entry.m_id );
	}
	catch( const std::exception & x )
	{
		::filtersync::logging::direct_mode::debug(
				[&]( auto & logger, auto level )
				{
					logger.log( level, "manager: filter {} isn't added: {}",
							entry.m_url, x.what() );
				} );
		throw;
	}

	entry.m_last_updated = clock_t::now();
	entry.m_next_update = entry.m_last_updated +
			std::chrono::duration_cast< clock_t::duration >(
					m_registry.update_period() );

	try
	{
		m_registry.insert( entry );
	}
	catch( const duplicate_error_t & )
	{
		// The same list was added by someone else during the download.
		m_storage.discard( entry.m_id );
		throw;
	}

	::filtersync::logging::direct_mode::info(
			[&]( auto & logger, auto level )
			{
				logger.log( level, "manager: added filter {} (id {}, {} rule(s))",
						entry.m_url, entry.m_id, entry.m_rule_count );
			} );

	return entry;
}

std::optional< filter_entry_t >
manager_t::remove( std::string_view url )
{
	auto result = m_registry.remove( url );

	if( result )
		::filtersync::logging::direct_mode::info(
				[&]( auto & logger, auto level )
				{
					logger.log( level, "manager: removed filter {} (id {})",
							url, result->m_id );
				} );
	else
		::filtersync::logging::direct_mode::debug(
				[&]( auto & logger, auto level )
				{
					logger.log( level, "manager: filter {} not found", url );
				} );

	return result;
}

void
manager_t::restore( filter_entry_t configured )
{
	configured.m_rule_count = 0u;
	configured.m_last_updated = time_point_t{};
	configured.m_next_update = time_point_t{};
	configured.m_pending_id = no_pending_id;

	try
	{
		const auto last_updated = m_storage.last_write_time( configured.m_id );
		const auto content = m_storage.load( configured.m_id );

		configured.m_rule_count = count_rules( content );
		configured.m_last_updated = last_updated;
		configured.m_next_update = last_updated +
				std::chrono::duration_cast< clock_t::duration >(
						m_registry.update_period() );
	}
	catch( const std::exception & x )
	{
		// The list will be downloaded at the first update cycle.
		::filtersync::logging::direct_mode::err(
				[&]( auto & logger, auto level )
				{
					logger.log( level, "manager: unable to restore filter {} "
							"from {}: {}",
							configured.m_url,
							m_storage.path_for( configured.m_id ),
							x.what() );
				} );
	}

	m_ids.observe( configured.m_id );
	m_registry.insert( configured );

	::filtersync::logging::direct_mode::debug(
			[&]( auto & logger, auto level )
			{
				logger.log( level, "manager: restored filter {} (id {}, {} rule(s))",
						configured.m_url,
						configured.m_id,
						configured.m_rule_count );
			} );
}

} /* namespace filtersync::filter_list */

