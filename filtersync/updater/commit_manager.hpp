/*!
 * @file
 * @brief Promotion of staged filter lists.
 */

#pragma once

#include <filtersync/filter_list/registry.hpp>
#include <filtersync/filter_list/storage.hpp>

#include <filtersync/proxy_controller.hpp>

#include <cstddef>

namespace filtersync::updater
{

//
// commit_result_t
//
//! Outcome of a single commit.
struct commit_result_t
{
	//! Count of staged files renamed over canonical ones.
	std::size_t m_promoted{};
	//! Count of failed renames. Those entries stay pending.
	std::size_t m_failed{};

	[[nodiscard]]
	bool
	is_noop() const noexcept { return 0u == m_promoted && 0u == m_failed; }
};

//
// commit_manager_t
//
/*!
 * @brief Makes all staged filter lists visible to the consumer.
 *
 * The consumer is closed once before the first rename and restarted
 * once after the last one. Nothing is done (the consumer isn't touched)
 * if there is no pending update.
 *
 * Failures of the consumer's close() and restart() are logged and
 * don't stop the commit.
 */
class commit_manager_t
{
public:
	commit_manager_t(
		filter_list::registry_t & registry,
		const filter_list::storage_t & storage,
		proxy_controller_t & consumer );

	commit_result_t
	commit();

private:
	filter_list::registry_t & m_registry;
	const filter_list::storage_t & m_storage;
	proxy_controller_t & m_consumer;

	void
	close_consumer() noexcept;

	void
	restart_consumer() noexcept;
};

} /* namespace filtersync::updater */

