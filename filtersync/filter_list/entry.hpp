/*!
 * @file
 * @brief Description of a single filter list.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <tuple>

namespace filtersync::filter_list
{

//! Type of filter identifier.
/*!
 * Zero is never used as a valid identifier.
 */
using filter_id_t = std::uint64_t;

//! Special value that means "no staged update".
inline constexpr filter_id_t no_pending_id{ 0u };

//! Type of clock for all filter-related timestamps.
using clock_t = std::chrono::system_clock;

//! Type of timepoint for all filter-related timestamps.
using time_point_t = clock_t::time_point;

//
// filter_entry_t
//
/*!
 * @brief Metadata of a filter list.
 *
 * The content of a list is stored in the file derived from m_id.
 * If m_pending_id isn't zero then a freshly downloaded content is
 * stored in the file derived from m_pending_id and waits for
 * the commit.
 */
struct filter_entry_t
{
	filter_id_t m_id{};
	bool m_enabled{ true };
	std::string m_name;
	std::string m_url;

	//! Count of rules in the last downloaded content.
	/*!
	 * It's an advisory value for diagnostic purposes only.
	 */
	std::uint64_t m_rule_count{};

	//! Time of the last successful refresh.
	time_point_t m_last_updated{};

	//! The earliest time of the next refresh.
	time_point_t m_next_update{};

	//! Identifier of the staged file or no_pending_id.
	filter_id_t m_pending_id{ no_pending_id };

	[[nodiscard]]
	bool
	has_pending_update() const noexcept
	{
		return no_pending_id != m_pending_id;
	}

	[[nodiscard]]
	bool
	operator==( const filter_entry_t & b ) const noexcept
	{
		const auto tup = []( const auto & v ) {
			return std::tie( v.m_id, v.m_enabled, v.m_name, v.m_url,
					v.m_rule_count, v.m_last_updated, v.m_next_update,
					v.m_pending_id );
		};
		return tup( *this ) == tup( b );
	}

	[[nodiscard]]
	bool
	operator!=( const filter_entry_t & b ) const noexcept
	{
		return !( *this == b );
	}
};

// For debugging and logging purposes only.
std::ostream &
operator<<( std::ostream & to, const filter_entry_t & entry );

} /* namespace filtersync::filter_list */

