/*!
 * @file
 * @brief In-memory registry of filter lists.
 */

#pragma once

#include <filtersync/filter_list/entry.hpp>

#include <chrono>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace filtersync::filter_list
{

//
// staged_update_t
//
/*!
 * @brief Result of a successful refresh that has to be reflected
 * in the registry.
 */
struct staged_update_t
{
	//! Identifier of the refreshed entry.
	filter_id_t m_id;
	//! Identifier of the file with the new content.
	filter_id_t m_staged_id;
	//! Count of rules in the new content.
	std::uint64_t m_rule_count;
	//! Time of the refresh.
	time_point_t m_updated_at;
};

//
// pending_update_t
//
/*!
 * @brief Description of an entry that waits for the commit.
 */
struct pending_update_t
{
	filter_id_t m_id;
	filter_id_t m_staged_id;
	std::string m_url;
};

//
// registry_t
//
/*!
 * @brief The table of all known filter lists.
 *
 * Entries are kept in the order of their insertion.
 *
 * Names and URLs are unique among all entries. Identifiers are unique too.
 *
 * @note
 * This class is thread-safe. Every method is a single critical section
 * and no method performs network or file I/O.
 */
class registry_t
{
public:
	using entry_container_t = std::vector< filter_entry_t >;

	explicit registry_t( std::chrono::milliseconds update_period );

	registry_t( const registry_t & ) = delete;
	registry_t &
	operator=( const registry_t & ) = delete;

	[[nodiscard]]
	std::chrono::milliseconds
	update_period() const noexcept { return m_update_period; }

	//! Check that there is no entry with the same name or URL.
	/*!
	 * @throw duplicate_error_t if there is such an entry.
	 */
	void
	ensure_unique( std::string_view name, std::string_view url ) const;

	//! Append a new entry to the end of the registry.
	/*!
	 * The uniqueness of id, name and URL is checked again because
	 * the registry can be changed since the last ensure_unique() call.
	 *
	 * @throw duplicate_error_t if some of them are already in use.
	 */
	void
	insert( filter_entry_t entry );

	//! Remove the first entry with the specified URL.
	/*!
	 * @return the removed entry or empty value if there is no such entry.
	 */
	[[nodiscard]]
	std::optional< filter_entry_t >
	remove( std::string_view url );

	//! Find the first enabled entry that should be refreshed.
	/*!
	 * The next_update of the found entry is moved by the update period
	 * before the return. So the entry won't be selected again
	 * until the next period even if its refresh fails.
	 *
	 * @return a copy of the found entry or empty value.
	 */
	[[nodiscard]]
	std::optional< filter_entry_t >
	select_due( time_point_t now );

	//! Store the result of a successful refresh.
	/*!
	 * Updates the rule count and the last update time immediately and
	 * makes the new file pending.
	 *
	 * @return false if there is no entry with the specified id (it could
	 * be removed during the refresh).
	 */
	[[nodiscard]]
	bool
	stage( const staged_update_t & update );

	//! Get the list of entries that wait for the commit.
	[[nodiscard]]
	std::vector< pending_update_t >
	pending_updates() const;

	//! Mark pending update as committed.
	/*!
	 * Nothing changes if the entry is removed or has a different
	 * pending id.
	 *
	 * @return true if the pending id was cleared.
	 */
	bool
	complete_pending( filter_id_t id, filter_id_t staged_id );

	//! Get a copy of all entries.
	[[nodiscard]]
	entry_container_t
	snapshot() const;

	//! Find an entry by URL.
	[[nodiscard]]
	std::optional< filter_entry_t >
	find( std::string_view url ) const;

	[[nodiscard]]
	std::size_t
	size() const;

private:
	const std::chrono::milliseconds m_update_period;

	mutable std::mutex m_lock;

	entry_container_t m_entries;

	//! Search for a conflicting entry.
	/*!
	 * @attention
	 * Must be called with m_lock acquired.
	 */
	[[nodiscard]]
	entry_container_t::const_iterator
	find_conflict(
		std::string_view name,
		std::string_view url ) const noexcept;

	//! Search for an entry with the specified id.
	/*!
	 * @attention
	 * Must be called with m_lock acquired.
	 */
	[[nodiscard]]
	entry_container_t::iterator
	find_by_id( filter_id_t id ) noexcept;
};

} /* namespace filtersync::filter_list */

