/*!
 * @file
 * @brief The public interface of updater-agent.
 */

#pragma once

#include <filtersync/application_context.hpp>

#include <filtersync/updater/update_cycle.hpp>

#include <so_5/all.hpp>

#include <chrono>

namespace filtersync::updater
{

//
// params_t
//
/*!
 * @brief Initial parameters for updater-agent.
 */
struct params_t
{
	//! The logic of update cycle.
	/*!
	 * @note
	 * This reference is expected to be valid for the whole lifetime
	 * of updater-agent.
	 */
	update_cycle_t & m_cycle;

	//! Pause between update cycles.
	std::chrono::milliseconds m_update_period;

	//! Initial value of the enable flag.
	bool m_enabled{ true };
};

//
// update_now_t
//
/*!
 * @brief A command to start an update cycle right now.
 *
 * Is ignored if an update cycle is in progress.
 */
struct update_now_t final : public so_5::signal_t {};

//
// switch_updates_t
//
/*!
 * @brief A command to enable or disable update cycles.
 *
 * If updates are disabled during a cycle then the cycle is interrupted
 * before the next step.
 */
struct switch_updates_t final : public so_5::message_t
{
	bool m_enabled;

	explicit switch_updates_t( bool enabled )
		:	m_enabled{ enabled }
	{}
};

//
// introduce_updater
//
/*!
 * @brief A factory for creation and launching a new updater-agent.
 *
 * The agent listens to app_ctx.m_updater_mbox for update_now_t and
 * switch_updates_t.
 */
[[nodiscard]]
so_5::coop_handle_t
introduce_updater(
	so_5::environment_t & env,
	so_5::disp_binder_shptr_t disp_binder,
	application_context_t app_ctx,
	params_t params );

} /* namespace filtersync::updater */

