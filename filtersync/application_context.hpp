/*!
 * @file
 * @brief Definition of context in that filtersync's entities will work.
 */

#pragma once

#include <so_5/all.hpp>

namespace filtersync
{

//
// application_context_t
//
/*!
 * @brief A struct for holding info necessary for interaction
 * between filtersync's entities.
 */
struct application_context_t
{
	//! mbox for control messages to the updater.
	so_5::mbox_t m_updater_mbox;
};

} /* namespace filtersync */

