/*!
 * @file
 * @brief The public interface of fetcher.
 */

#include <filtersync/fetcher/pub.hpp>

#include <filtersync/logging/wrap_logging.hpp>

#include <fmt/format.h>

namespace filtersync::fetcher
{

namespace
{

constexpr unsigned int status_ok = 200u;

} /* anonymous namespace */

std::string
download(
	http_client_t & client,
	const std::string & url )
{
	::filtersync::logging::direct_mode::debug(
			[&]( auto & logger, auto level )
			{
				logger.log( level, "fetcher: downloading filter from {}", url );
			} );

	http_response_t response;
	try
	{
		response = client.get( url );
	}
	catch( const std::exception & x )
	{
		throw network_error_t{
				fmt::format( "couldn't download filter from {}: {}",
						url, x.what() )
			};
	}

	if( status_ok != response.m_status_code )
		throw protocol_error_t{
				fmt::format( "couldn't download filter from {}: "
						"status code: {}",
						url, response.m_status_code ),
				response.m_status_code
			};

	::filtersync::logging::direct_mode::trace(
			[&]( auto & logger, auto level )
			{
				logger.log( level, "fetcher: {} byte(s) received from {}",
						response.m_body.size(), url );
			} );

	return std::move(response.m_body);
}

} /* namespace filtersync::fetcher */

