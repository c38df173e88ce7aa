/*!
 * @file
 * @brief Helpers for logging.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace filtersync
{

namespace logging
{

namespace impl
{

/*!
 * @brief Install the process-wide logger.
 *
 * The daemon and every test executable install exactly one logger
 * before any filter is loaded.
 */
void
setup_logger( std::shared_ptr< spdlog::logger > logger ) noexcept;

//! Drop the logger installed by setup_logger().
void
remove_logger() noexcept;

/*!
 * @brief The installed logger or nullptr.
 *
 * Logging without an installed logger is a no-op.
 */
[[nodiscard]]
spdlog::logger *
logger_if_present() noexcept;

} /* namespace impl */

/*!
 * @brief RAII owner of the process-wide logger.
 *
 * The logger is installed by the constructor and dropped by the
 * destructor. main() creates it right after the command line is parsed,
 * tests use a single inline instance with a null sink.
 */
class logger_holder_t
{
public:
	logger_holder_t( std::shared_ptr< spdlog::logger > logger ) noexcept
	{
		impl::setup_logger( std::move(logger) );
	}

	~logger_holder_t()
	{
		impl::remove_logger();
	}

	logger_holder_t( const logger_holder_t & ) = delete;
	logger_holder_t &
	operator=( const logger_holder_t & ) = delete;
};

//! Tag for logging via the process-wide logger.
struct direct_logging_marker_t {};

/*!
 * @brief Log level that has already passed the level check.
 *
 * It's passed to logging actions instead of a bare level_enum.
 */
class processed_log_level_t
{
	spdlog::level::level_enum m_level;

public:
	explicit processed_log_level_t(
		spdlog::level::level_enum level )
		:	m_level{ level }
	{}

	[[nodiscard]]
	auto
	value() const noexcept { return m_level; }

	[[nodiscard]]
	operator spdlog::level::level_enum() const noexcept { return value(); }
};

/*!
 * @brief Call @a action only if @a level is enabled.
 *
 * The message formatting is skipped entirely for disabled levels
 * and when there is no installed logger.
 * The @a action is expected to be:
 * @code
 * void(spdlog::logger &, processed_log_level_t);
 * @endcode
 */
template< typename Logging_Action >
void
wrap_logging(
	direct_logging_marker_t,
	spdlog::level::level_enum level,
	Logging_Action && action )
{
	if( auto * logger = impl::logger_if_present();
			logger && logger->should_log( level ) )
	{
		action( *logger, processed_log_level_t{ level } );
	}
}

//
// direct_mode
//
/*!
 * @brief Shorthands for wrap_logging with direct_logging_marker_t.
 *
 * Usage example:
 * @code
 * filtersync::logging::direct_mode::info(
 * 	[&]( auto & logger, auto level ) {
 * 		logger.log( level, "{} filter(s) loaded", count );
 * 	} );
 * @endcode
 */
namespace direct_mode
{

template< typename Logging_Action >
void
trace( Logging_Action && action )
{
	wrap_logging( direct_logging_marker_t{}, spdlog::level::trace,
			std::forward<Logging_Action>(action) );
}

template< typename Logging_Action >
void
debug( Logging_Action && action )
{
	wrap_logging( direct_logging_marker_t{}, spdlog::level::debug,
			std::forward<Logging_Action>(action) );
}

template< typename Logging_Action >
void
info( Logging_Action && action )
{
	wrap_logging( direct_logging_marker_t{}, spdlog::level::info,
			std::forward<Logging_Action>(action) );
}

template< typename Logging_Action >
void
warn( Logging_Action && action )
{
	wrap_logging( direct_logging_marker_t{}, spdlog::level::warn,
			std::forward<Logging_Action>(action) );
}

template< typename Logging_Action >
void
err( Logging_Action && action )
{
	wrap_logging( direct_logging_marker_t{}, spdlog::level::err,
			std::forward<Logging_Action>(action) );
}

template< typename Logging_Action >
void
critical( Logging_Action && action )
{
	wrap_logging( direct_logging_marker_t{}, spdlog::level::critical,
			std::forward<Logging_Action>(action) );
}

} /* namespace direct_mode */

} /* namespace logging */

} /* namespace filtersync */

