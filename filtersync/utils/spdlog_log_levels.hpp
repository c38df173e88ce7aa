/*!
 * @file
 * @brief Names of spdlog's severity levels used by filtersync.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace filtersync::utils
{

namespace log_levels_impl
{

using name_and_level_t = std::pair< std::string_view, spdlog::level::level_enum >;

inline constexpr std::array< name_and_level_t, 7 > known_levels{
	name_and_level_t{ "trace", spdlog::level::trace },
	name_and_level_t{ "debug", spdlog::level::debug },
	name_and_level_t{ "info", spdlog::level::info },
	name_and_level_t{ "warn", spdlog::level::warn },
	name_and_level_t{ "error", spdlog::level::err },
	name_and_level_t{ "crit", spdlog::level::critical },
	name_and_level_t{ "off", spdlog::level::off }
};

} /* namespace log_levels_impl */

//! Names accepted by `--log-level` and by `log_level` in the config.
[[nodiscard]]
inline constexpr std::string_view
supported_log_level_names() noexcept
{
	return "trace, debug, info, warn, error, crit, off";
}

[[nodiscard]]
inline std::optional< spdlog::level::level_enum >
name_to_spdlog_level_enum( std::string_view name ) noexcept
{
	for( const auto & [n, level] : log_levels_impl::known_levels )
		if( n == name )
			return level;

	return std::nullopt;
}

} /* namespace filtersync::utils */
