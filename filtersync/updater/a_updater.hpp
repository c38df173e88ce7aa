/*!
 * @file
 * @brief Agent that periodically updates filter lists.
 */

#pragma once

#include <filtersync/updater/pub.hpp>

namespace filtersync::updater
{

//
// a_updater_t
//
/*!
 * @brief Agent that drives update_cycle_t.
 *
 * The agent has two states:
 *
 * - processing. Every step of the update cycle is performed in
 *   a separate event. The agent sends process_next_t to itself until
 *   the cycle finishes. It allows to handle control messages between
 *   steps;
 * - waiting. A single-shot timer for the update period is armed.
 *   When the timer fires the agent switches to processing.
 *
 * The agent starts in processing state because entries restored without
 * files have to be downloaded as soon as possible.
 */
class a_updater_t final : public so_5::agent_t
{
public:
	a_updater_t(
		context_t ctx,
		application_context_t app_ctx,
		params_t params );

	void
	so_define_agent() override;

	void
	so_evt_start() override;

private:
	//! Request for the next step of the update cycle.
	struct process_next_t final : public so_5::signal_t {};

	//! Notification about the end of waiting period.
	struct wakeup_t final : public so_5::signal_t {};

	const application_context_t m_app_ctx;

	update_cycle_t & m_cycle;

	const std::chrono::milliseconds m_update_period;

	//! Are updates enabled?
	bool m_enabled;

	state_t st_processing{ this, "processing" };
	state_t st_waiting{ this, "waiting" };

	//! Timer for the end of the current waiting period.
	so_5::timer_id_t m_wakeup_timer;

	void
	on_enter_processing();

	void
	on_enter_waiting();

	void
	on_exit_waiting();

	void
	arm_wakeup_timer();

	void
	on_process_next( mhood_t< process_next_t > );

	void
	on_wakeup( mhood_t< wakeup_t > );

	void
	on_update_now_when_waiting( mhood_t< update_now_t > );

	void
	on_update_now_when_processing( mhood_t< update_now_t > );

	void
	on_switch_updates( mhood_t< switch_updates_t > cmd );
};

} /* namespace filtersync::updater */

