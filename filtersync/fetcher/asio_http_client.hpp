/*!
 * @file
 * @brief HTTP client based on asio and http_parser.
 */

#pragma once

#include <filtersync/fetcher/http_client.hpp>

#include <chrono>
#include <cstddef>
#include <string>

namespace filtersync::fetcher
{

//
// asio_http_client_params_t
//
/*!
 * @brief Parameters for asio_http_client.
 */
struct asio_http_client_params_t
{
	//! Max time for the whole request including all redirects.
	std::chrono::milliseconds m_timeout{ 60'000 };

	//! Max size of a response body.
	std::size_t m_max_response_size{ 64u * 1024u * 1024u };

	//! Max count of redirects to be followed.
	unsigned int m_max_redirects{ 10u };

	//! Value for User-Agent header field.
	std::string m_user_agent{ "filtersync" };
};

//
// asio_http_client_t
//
/*!
 * @brief The default implementation of http_client interface.
 *
 * Supports plain HTTP/1.1 only. Every request uses a new connection
 * with `Connection: close`.
 *
 * Every call to get() creates its own asio::io_context, so different
 * calls don't share any state and can be performed from different
 * threads.
 */
class asio_http_client_t final : public http_client_t
{
public:
	explicit asio_http_client_t( asio_http_client_params_t params );

	[[nodiscard]]
	http_response_t
	get( const std::string & url ) override;

private:
	const asio_http_client_params_t m_params;
};

} /* namespace filtersync::fetcher */

