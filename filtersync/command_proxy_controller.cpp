/*!
 * @file
 * @brief Consumer controller that runs shell commands.
 */

#include <filtersync/command_proxy_controller.hpp>

#include <filtersync/logging/wrap_logging.hpp>

#include <filtersync/exception.hpp>

#include <fmt/format.h>

#include <cstdlib>

#include <sys/wait.h>

namespace filtersync
{

namespace
{

void
run_command(
	std::string_view what,
	const std::optional< std::string > & command )
{
	if( !command )
		return;

	::filtersync::logging::direct_mode::debug(
			[&]( auto & logger, auto level )
			{
				logger.log( level, "consumer: {} command: {}", what, *command );
			} );

	const int status = std::system( command->c_str() );
	if( -1 == status )
		throw exception_t{ fmt::format( "consumer: unable to run {} command",
				what ) };

	if( !WIFEXITED(status) )
		throw exception_t{ fmt::format( "consumer: {} command terminated "
				"abnormally, status: {}", what, status ) };

	if( const auto code = WEXITSTATUS(status); 0 != code )
		throw exception_t{ fmt::format( "consumer: {} command failed, "
				"exit code: {}", what, code ) };
}

} /* namespace anonymous */

command_proxy_controller_t::command_proxy_controller_t(
	std::optional< std::string > close_command,
	std::optional< std::string > restart_command )
	:	m_close_command{ std::move(close_command) }
	,	m_restart_command{ std::move(restart_command) }
{}

void
command_proxy_controller_t::close()
{
	run_command( "close", m_close_command );
}

void
command_proxy_controller_t::restart()
{
	run_command( "restart", m_restart_command );
}

} /* namespace filtersync */

