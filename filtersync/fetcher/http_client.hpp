/*!
 * @file
 * @brief Interface of the transport for downloading filter lists.
 */

#pragma once

#include <string>

namespace filtersync::fetcher
{

//
// http_response_t
//
/*!
 * @brief The final response to a GET request.
 */
struct http_response_t
{
	//! Status code from the status-line.
	unsigned int m_status_code{};

	//! The whole body of the response.
	std::string m_body;
};

//
// http_client_t
//
/*!
 * @brief Interface of HTTP client to be used for all downloads.
 *
 * An implementation should throw an exception if the request can't
 * be performed (DNS failure, connection refused, time-out, broken
 * response and so on). A response with any status code is a normal
 * result.
 */
class http_client_t
{
public:
	virtual ~http_client_t() = default;

	//! Perform GET request.
	[[nodiscard]]
	virtual http_response_t
	get( const std::string & url ) = 0;
};

} /* namespace filtersync::fetcher */

