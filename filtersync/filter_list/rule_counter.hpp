/*!
 * @file
 * @brief Counting of rules in the content of a filter list.
 */

#pragma once

#include <cstdint>
#include <string_view>

namespace filtersync::filter_list
{

//
// count_rules
//
/*!
 * @brief Count rules in the content of a filter list.
 *
 * Content is split into lines by '\n' (a '\r' before '\n' is
 * treated as a part of the line end). A line is a rule unless it is
 * empty or starts with '#' or '!'.
 *
 * Any content is accepted, the content isn't validated.
 */
[[nodiscard]]
inline std::uint64_t
count_rules( std::string_view content ) noexcept
{
	std::uint64_t rules{};

	while( !content.empty() )
	{
		auto eol = content.find( '\n' );
		if( std::string_view::npos == eol )
			eol = content.size();

		auto line = content.substr( 0u, eol );
		content.remove_prefix( eol == content.size() ? eol : eol + 1u );

		if( !line.empty() && '\r' == line.back() )
			line.remove_suffix( 1u );

		if( line.empty() || '#' == line.front() || '!' == line.front() )
			continue;

		++rules;
	}

	return rules;
}

} /* namespace filtersync::filter_list */

