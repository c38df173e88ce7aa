/*!
 * @file
 * @brief The public interface of updater-agent.
 */

#include <filtersync/updater/pub.hpp>

#include <filtersync/updater/a_updater.hpp>

namespace filtersync::updater
{

//
// introduce_updater
//
so_5::coop_handle_t
introduce_updater(
	so_5::environment_t & env,
	so_5::disp_binder_shptr_t disp_binder,
	application_context_t app_ctx,
	params_t params )
{
	auto coop_holder = env.make_coop( std::move(disp_binder) );

	coop_holder->make_agent< a_updater_t >(
			std::move(app_ctx),
			std::move(params) );

	return env.register_coop( std::move(coop_holder) );
}

} /* namespace filtersync::updater */

