/*!
 * @file
 * @brief Macros for nothrow blocks.
 */

#pragma once

#include <filtersync/logging/wrap_logging.hpp>

#include <exception>

namespace filtersync::nothrow_block::impl
{

//! Logs an exception suppressed by a nothrow block.
/*!
 * @a description is nullptr if the exception isn't derived from
 * std::exception.
 *
 * Any exception from the logger itself is swallowed.
 */
inline void
log_suppressed_exception(
	const char * file,
	unsigned int line,
	const char * function,
	const char * stage,
	const char * description ) noexcept
{
	try
	{
		::filtersync::logging::direct_mode::err(
				[&]( auto & logger, auto level ) {
					logger.log( level,
							"{}:{} [{}] unexpected exception at stage '{}' => {}",
							file, line, function,
							stage ? stage : "unspecified",
							description ? description :
									"description not available" );
				} );
	}
	catch( ... ) {}
}

} /* namespace filtersync::nothrow_block::impl */

/*!
 * Starts a new block for catching and suppressing all exceptions.
 *
 * Usage example:
 * @code
 * FILTERSYNC_NOTHROW_BLOCK_BEGIN()
 * 	... // Some code inside.
 * FILTERSYNC_NOTHROW_BLOCK_END(JUST_IGNORE)
 * @endcode
 */
#define FILTERSYNC_NOTHROW_BLOCK_BEGIN() \
{ \
	const char * filtersync_nothrow_block_stage__ = nullptr; \
	(void)filtersync_nothrow_block_stage__; \
	try \
	{ 

/*!
 * Sets a name of the current stage. That name will be used for logging.
 *
 * Usage example:
 * @code
 * FILTERSYNC_NOTHROW_BLOCK_BEGIN()
 * 	FILTERSYNC_NOTHROW_BLOCK_STAGE(first_stage)
 * 	... // Some code
 *
 * 	FILTERSYNC_NOTHROW_BLOCK_STAGE(second_stage)
 * 	... // Some code
 * FILTERSYNC_NOTHROW_BLOCK_END(LOG_THEN_IGNORE)
 * @endcode
 */
#define FILTERSYNC_NOTHROW_BLOCK_STAGE(stage_name) \
	filtersync_nothrow_block_stage__ = #stage_name;

#define FILTERSYNC_NOTHROW_BLOCK_END_STATEMENT_LOG_THEN_IGNORE() \
} \
catch( const std::exception & x ) \
{ \
	::filtersync::nothrow_block::impl::log_suppressed_exception( \
			__FILE__, __LINE__, __PRETTY_FUNCTION__, \
			filtersync_nothrow_block_stage__, x.what() ); \
} \
catch( ... ) \
{ \
	::filtersync::nothrow_block::impl::log_suppressed_exception( \
			__FILE__, __LINE__, __PRETTY_FUNCTION__, \
			filtersync_nothrow_block_stage__, nullptr ); \
}

#define FILTERSYNC_NOTHROW_BLOCK_END_STATEMENT_JUST_IGNORE() \
} \
catch( ... ) {}

/*!
 * Finishes block started by FILTERSYNC_NOTHROW_BLOCK_BEGIN.
 *
 * @a action can be LOG_THEN_IGNORE or JUST_IGNORE.
 */
#define FILTERSYNC_NOTHROW_BLOCK_END(action) \
	FILTERSYNC_NOTHROW_BLOCK_END_STATEMENT_##action() \
}
