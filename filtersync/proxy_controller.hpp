/*!
 * @file
 * @brief Interface for controlling the consumer of filter lists.
 */

#pragma once

namespace filtersync
{

//
// proxy_controller_t
//
/*!
 * @brief Interface of the service that reads filter lists.
 *
 * Both methods are blocking. They throw an exception on failure.
 */
class proxy_controller_t
{
public:
	virtual ~proxy_controller_t() = default;

	//! Stop reading of filter lists and release all file handles.
	virtual void
	close() = 0;

	//! Reload filter lists from the canonical files.
	virtual void
	restart() = 0;
};

} /* namespace filtersync */

