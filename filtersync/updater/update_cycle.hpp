/*!
 * @file
 * @brief Single steps of the filter lists update cycle.
 */

#pragma once

#include <filtersync/updater/commit_manager.hpp>

#include <filtersync/filter_list/downloader.hpp>
#include <filtersync/filter_list/id_source.hpp>
#include <filtersync/filter_list/registry.hpp>

namespace filtersync::updater
{

//
// step_result_t
//
//! What was done by update_cycle_t::step().
enum class step_result_t
{
	//! A due entry was downloaded and staged.
	refreshed,
	//! A due entry was selected but its refresh failed.
	refresh_failed,
	//! Nothing was due and staged files were committed.
	committed,
	//! Nothing was due and nothing waited for the commit.
	idle
};

//
// update_cycle_t
//
/*!
 * @brief The logic of the update cycle without any timers.
 *
 * Every call to step() performs exactly one action: refresh of one due
 * entry or the commit. The caller repeats step() until it returns
 * step_result_t::committed or step_result_t::idle and then sleeps
 * for the update period.
 *
 * @note
 * This class isn't thread-safe. It's intended to be used by
 * a single agent.
 */
class update_cycle_t
{
public:
	update_cycle_t(
		filter_list::registry_t & registry,
		filter_list::downloader_t & downloader,
		filter_list::id_source_t & ids,
		commit_manager_t & committer );

	step_result_t
	step( filter_list::time_point_t now );

	//! Is there a staged update that waits for the commit?
	[[nodiscard]]
	bool
	dirty() const noexcept { return m_dirty; }

private:
	filter_list::registry_t & m_registry;
	filter_list::downloader_t & m_downloader;
	filter_list::id_source_t & m_ids;
	commit_manager_t & m_committer;

	bool m_dirty{ false };

	[[nodiscard]]
	step_result_t
	refresh(
		const filter_list::filter_entry_t & entry,
		filter_list::time_point_t now );
};

[[nodiscard]]
inline bool
is_cycle_finished( step_result_t r ) noexcept
{
	return step_result_t::committed == r || step_result_t::idle == r;
}

} /* namespace filtersync::updater */

