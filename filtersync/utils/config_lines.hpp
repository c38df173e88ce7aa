/*!
 * @file
 * @brief Iteration over meaningful lines of a config text.
 */

#pragma once

#include <cstdint>
#include <string_view>

namespace filtersync::utils
{

//
// config_line_t
//
//! A trimmed non-empty line of a config with its 1-based number.
struct config_line_t
{
	std::string_view m_content;
	std::uint_fast32_t m_number;
};

//
// for_each_config_line
//
/*!
 * @brief Calls @a handler for every meaningful line of @a content.
 *
 * Empty lines and lines starting with `#` (after leading spaces) are
 * skipped but counted. Leading and trailing spaces (CR included) are
 * removed from the line passed to @a handler.
 */
template< typename Handler >
void
for_each_config_line( std::string_view content, Handler && handler )
{
	constexpr std::string_view spaces{ " \t\x0b\r" };

	std::uint_fast32_t number{ 0u };
	while( !content.empty() )
	{
		++number;

		const auto eol = content.find( '\n' );
		auto line = content.substr( 0u, eol );
		content.remove_prefix(
				std::string_view::npos == eol ? content.size() : eol + 1u );

		const auto first = line.find_first_not_of( spaces );
		if( std::string_view::npos == first || '#' == line[ first ] )
			continue;

		line = line.substr( first, line.find_last_not_of( spaces ) - first + 1u );
		handler( config_line_t{ line, number } );
	}
}

} /* namespace filtersync::utils */
