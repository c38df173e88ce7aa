/*!
 * @file
 * @brief Promotion of staged filter lists.
 */

#include <filtersync/updater/commit_manager.hpp>

#include <filtersync/nothrow_block/macros.hpp>

#include <filtersync/logging/wrap_logging.hpp>

namespace filtersync::updater
{

commit_manager_t::commit_manager_t(
	filter_list::registry_t & registry,
	const filter_list::storage_t & storage,
	proxy_controller_t & consumer )
	:	m_registry{ registry }
	,	m_storage{ storage }
	,	m_consumer{ consumer }
{}

commit_result_t
commit_manager_t::commit()
{
	commit_result_t result;

	const auto pending = m_registry.pending_updates();
	if( pending.empty() )
	{
		::filtersync::logging::direct_mode::debug(
				[]( auto & logger, auto level )
				{
					logger.log( level, "commit: nothing to commit" );
				} );
		return result;
	}

	close_consumer();

	for( const auto & p : pending )
	{
		try
		{
			m_storage.promote( p.m_staged_id, p.m_id );
			// The entry could be removed during the rename. It isn't
			// an error, the file is just left for an external cleanup.
			(void)m_registry.complete_pending( p.m_id, p.m_staged_id );
			++result.m_promoted;
		}
		catch( const std::exception & x )
		{
			++result.m_failed;

			// The consumer is closed here and has to be restarted anyway.
			FILTERSYNC_NOTHROW_BLOCK_BEGIN()
				FILTERSYNC_NOTHROW_BLOCK_STAGE(log_promote_failure)

				::filtersync::logging::direct_mode::err(
						[&]( auto & logger, auto level )
						{
							logger.log( level, "commit: unable to promote filter {} "
									"(id {}, staged id {}): {}",
									p.m_url, p.m_id, p.m_staged_id, x.what() );
						} );
			FILTERSYNC_NOTHROW_BLOCK_END(JUST_IGNORE)
		}
	}

	restart_consumer();

	::filtersync::logging::direct_mode::info(
			[&]( auto & logger, auto level )
			{
				logger.log( level, "commit: {} filter(s) updated, {} failed",
						result.m_promoted, result.m_failed );
			} );

	return result;
}

void
commit_manager_t::close_consumer() noexcept
{
	FILTERSYNC_NOTHROW_BLOCK_BEGIN()
		try
		{
			m_consumer.close();
		}
		catch( const std::exception & x )
		{
			::filtersync::logging::direct_mode::err(
					[&]( auto & logger, auto level )
					{
						logger.log( level, "commit: consumer close failed: {}",
								x.what() );
					} );
		}
	FILTERSYNC_NOTHROW_BLOCK_END(LOG_THEN_IGNORE)
}

void
commit_manager_t::restart_consumer() noexcept
{
	FILTERSYNC_NOTHROW_BLOCK_BEGIN()
		try
		{
			m_consumer.restart();
		}
		catch( const std::exception & x )
		{
			::filtersync::logging::direct_mode::err(
					[&]( auto & logger, auto level )
					{
						logger.log( level, "commit: consumer restart failed: {}",
								x.what() );
					} );
		}
	FILTERSYNC_NOTHROW_BLOCK_END(LOG_THEN_IGNORE)
}

} /* namespace filtersync::updater */

