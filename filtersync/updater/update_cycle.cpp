/*!
 * @file
 * @brief Single steps of the filter lists update cycle.
 */

#include <filtersync/updater/update_cycle.hpp>

#include <filtersync/logging/wrap_logging.hpp>

namespace filtersync::updater
{

update_cycle_t::update_cycle_t(
	filter_list::registry_t & registry,
	filter_list::downloader_t & downloader,
	filter_list::id_source_t & ids,
	commit_manager_t & committer )
	:	m_registry{ registry }
	,	m_downloader{ downloader }
	,	m_ids{ ids }
	,	m_committer{ committer }
{}

step_result_t
update_cycle_t::step( filter_list::time_point_t now )
{
	if( const auto due = m_registry.select_due( now ) )
		return refresh( *due, now );

	if( !m_dirty )
	{
		::filtersync::logging::direct_mode::debug(
				[]( auto & logger, auto level )
				{
					logger.log( level, "update: no filters were updated" );
				} );
		return step_result_t::idle;
	}

	const auto result = m_committer.commit();
	// Failed renames should be repeated at the next commit window.
	m_dirty = ( 0u != result.m_failed );

	return step_result_t::committed;
}

step_result_t
update_cycle_t::refresh(
	const filter_list::filter_entry_t & entry,
	filter_list::time_point_t now )
{
	const auto staged_id = m_ids.next( now );

	::filtersync::logging::direct_mode::debug(
			[&]( auto & logger, auto level )
			{
				logger.log( level, "update: downloading filter {} (id {}, "
						"staged id {})",
						entry.m_url, entry.m_id, staged_id );
			} );

	try
	{
		const auto rules = m_downloader.download_to( entry.m_url, staged_id );

		const filter_list::staged_update_t update{
				entry.m_id,
				staged_id,
				rules,
				filter_list::clock_t::now()
			};

		if( !m_registry.stage( update ) )
		{
			::filtersync::logging::direct_mode::warn(
					[&]( auto & logger, auto level )
					{
						logger.log( level, "update: filter {} (id {}) was removed "
								"during the refresh, staged id {} is left unused",
								entry.m_url, entry.m_id, staged_id );
					} );
			return step_result_t::refresh_failed;
		}

		m_dirty = true;
		return step_result_t::refreshed;
	}
	catch( const std::exception & x )
	{
		::filtersync::logging::direct_mode::err(
				[&]( auto & logger, auto level )
				{
					logger.log( level, "update: unable to refresh filter {} "
							"(id {}): {}",
							entry.m_url, entry.m_id, x.what() );
				} );
	}

	return step_result_t::refresh_failed;
}

} /* namespace filtersync::updater */

