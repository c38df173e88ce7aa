/*!
 * @file
 * @brief A source of identifiers for filters and staged files.
 */

#pragma once

#include <filtersync/filter_list/entry.hpp>

#include <algorithm>
#include <mutex>

namespace filtersync::filter_list
{

//
// id_source_t
//
/*!
 * @brief Mints identifiers from the wall clock.
 *
 * An identifier is the count of seconds since the epoch. But a new
 * identifier is always greater than every identifier returned or
 * observed earlier, so two identifiers minted within the same second
 * are still different.
 *
 * @note
 * This class is thread-safe.
 */
class id_source_t
{
public:
	id_source_t() = default;

	id_source_t( const id_source_t & ) = delete;
	id_source_t &
	operator=( const id_source_t & ) = delete;

	//! Get a new identifier.
	[[nodiscard]]
	filter_id_t
	next( time_point_t now = clock_t::now() )
	{
		const auto seconds = std::chrono::duration_cast< std::chrono::seconds >(
				now.time_since_epoch() ).count();
		const auto from_clock = seconds > 0 ?
				static_cast< filter_id_t >( seconds ) : filter_id_t{ 1u };

		std::lock_guard< std::mutex > lock{ m_lock };
		m_last = std::max( from_clock, m_last + 1u );

		return m_last;
	}

	//! Inform about an identifier that is already in use.
	void
	observe( filter_id_t id )
	{
		std::lock_guard< std::mutex > lock{ m_lock };
		m_last = std::max( id, m_last );
	}

private:
	std::mutex m_lock;

	filter_id_t m_last{ no_pending_id };
};

} /* namespace filtersync::filter_list */

