/*!
 * @file
 * @brief Agent that periodically updates filter lists.
 */

#include <filtersync/updater/a_updater.hpp>

#include <filtersync/logging/wrap_logging.hpp>

namespace filtersync::updater
{

a_updater_t::a_updater_t(
	context_t ctx,
	application_context_t app_ctx,
	params_t params )
	:	so_5::agent_t{ std::move(ctx) }
	,	m_app_ctx{ std::move(app_ctx) }
	,	m_cycle{ params.m_cycle }
	,	m_update_period{ params.m_update_period }
	,	m_enabled{ params.m_enabled }
{}

void
a_updater_t::so_define_agent()
{
	st_processing
		.on_enter( [this]{ on_enter_processing(); } )
		.event( &a_updater_t::on_process_next )
		.event( m_app_ctx.m_updater_mbox,
				&a_updater_t::on_update_now_when_processing );

	st_waiting
		.on_enter( [this]{ on_enter_waiting(); } )
		.on_exit( [this]{ on_exit_waiting(); } )
		.event( &a_updater_t::on_wakeup )
		.event( m_app_ctx.m_updater_mbox,
				&a_updater_t::on_update_now_when_waiting );

	so_subscribe( m_app_ctx.m_updater_mbox )
		.in( st_processing )
		.in( st_waiting )
		.event( &a_updater_t::on_switch_updates );
}

void
a_updater_t::so_evt_start()
{
	::filtersync::logging::direct_mode::info(
			[&]( auto & logger, auto level )
			{
				logger.log( level, "updater: started, update period: {}ms, "
						"updates enabled: {}",
						m_update_period.count(), m_enabled );
			} );

	this >>= st_processing;
}

void
a_updater_t::on_enter_processing()
{
	so_5::send< process_next_t >( *this );
}

void
a_updater_t::on_enter_waiting()
{
	arm_wakeup_timer();
}

void
a_updater_t::on_exit_waiting()
{
	m_wakeup_timer.release();
}

void
a_updater_t::arm_wakeup_timer()
{
	// Zero repetition period means a single-shot timer.
	m_wakeup_timer = so_5::send_periodic< wakeup_t >(
			*this,
			m_update_period,
			std::chrono::milliseconds::zero() );
}

void
a_updater_t::on_process_next( mhood_t< process_next_t > )
{
	if( !m_enabled )
	{
		::filtersync::logging::direct_mode::info(
				[]( auto & logger, auto level )
				{
					logger.log( level, "updater: updates are disabled, "
							"cycle interrupted" );
				} );
		this >>= st_waiting;
		return;
	}

	try
	{
		const auto result = m_cycle.step( filter_list::clock_t::now() );
		if( is_cycle_finished( result ) )
		{
			this >>= st_waiting;
			return;
		}
	}
	catch( const std::exception & x )
	{
		::filtersync::logging::direct_mode::err(
				[&]( auto & logger, auto level )
				{
					logger.log( level, "updater: update cycle failed: {}",
							x.what() );
				} );
		this >>= st_waiting;
		return;
	}

	so_5::send< process_next_t >( *this );
}

void
a_updater_t::on_wakeup( mhood_t< wakeup_t > )
{
	if( m_enabled )
		this >>= st_processing;
	else
		arm_wakeup_timer();
}

void
a_updater_t::on_update_now_when_waiting( mhood_t< update_now_t > )
{
	if( !m_enabled )
	{
		::filtersync::logging::direct_mode::warn(
				[]( auto & logger, auto level )
				{
					logger.log( level, "updater: update_now ignored, "
							"updates are disabled" );
				} );
		return;
	}

	::filtersync::logging::direct_mode::info(
			[]( auto & logger, auto level )
			{
				logger.log( level, "updater: immediate update requested" );
			} );

	this >>= st_processing;
}

void
a_updater_t::on_update_now_when_processing( mhood_t< update_now_t > )
{
	::filtersync::logging::direct_mode::debug(
			[]( auto & logger, auto level )
			{
				logger.log( level, "updater: update_now ignored, "
						"update cycle is in progress" );
			} );
}

void
a_updater_t::on_switch_updates( mhood_t< switch_updates_t > cmd )
{
	m_enabled = cmd->m_enabled;

	::filtersync::logging::direct_mode::info(
			[&]( auto & logger, auto level )
			{
				logger.log( level, "updater: updates {}",
						m_enabled ? "enabled" : "disabled" );
			} );
}

} /* namespace filtersync::updater */

