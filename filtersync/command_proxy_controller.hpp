/*!
 * @file
 * @brief Consumer controller that runs shell commands.
 */

#pragma once

#include <filtersync/proxy_controller.hpp>

#include <optional>
#include <string>

namespace filtersync
{

//
// command_proxy_controller_t
//
/*!
 * @brief Implementation of proxy_controller_t that runs
 * operator-supplied shell commands.
 *
 * If a command isn't specified the corresponding method does nothing.
 */
class command_proxy_controller_t final : public proxy_controller_t
{
public:
	command_proxy_controller_t(
		std::optional< std::string > close_command,
		std::optional< std::string > restart_command );

	void
	close() override;

	void
	restart() override;

private:
	const std::optional< std::string > m_close_command;
	const std::optional< std::string > m_restart_command;
};

} /* namespace filtersync */

