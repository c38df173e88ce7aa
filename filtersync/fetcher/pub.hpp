/*!
 * @file
 * @brief The public interface of fetcher.
 */

#pragma once

#include <filtersync/fetcher/http_client.hpp>

#include <filtersync/exception.hpp>

#include <string>

namespace filtersync::fetcher
{

//
// download
//
/*!
 * @brief Download the content of a filter list.
 *
 * Only one attempt is performed.
 *
 * @throw network_error_t if the transport fails.
 * @throw protocol_error_t if the status code isn't 200.
 */
[[nodiscard]]
std::string
download(
	http_client_t & client,
	const std::string & url );

} /* namespace filtersync::fetcher */

