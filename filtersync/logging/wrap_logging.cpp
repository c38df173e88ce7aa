/*!
 * @file
 * @brief The process-wide logger.
 */

#include <filtersync/logging/wrap_logging.hpp>

namespace filtersync::logging::impl
{

namespace
{

// Set at the start of main() and removed at its end.
std::shared_ptr< spdlog::logger > g_logger;

} /* namespace anonymous */

void
setup_logger( std::shared_ptr< spdlog::logger > logger ) noexcept
{
	g_logger = std::move(logger);
}

void
remove_logger() noexcept
{
	g_logger.reset();
}

spdlog::logger *
logger_if_present() noexcept
{
	return g_logger.get();
}

} /* namespace filtersync::logging::impl */
