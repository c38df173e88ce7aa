/*!
 * @file
 * @brief HTTP client based on asio and http_parser.
 */

#include <filtersync/fetcher/asio_http_client.hpp>

#include <filtersync/logging/wrap_logging.hpp>
#include <filtersync/nothrow_block/macros.hpp>

#include <filtersync/exception.hpp>

#include <restinio/http_headers.hpp>

#include <nodejs/http_parser/http_parser.h>

#include <asio.hpp>

#include <fmt/format.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace filtersync::fetcher
{

namespace
{

//
// http_client_ex_t
//
//! Exception to be used by asio_http_client.
struct http_client_ex_t : public exception_t
{
public:
	http_client_ex_t( const std::string & what )
		:	exception_t{ "http_client: " + what }
	{}
};

//
// target_url_t
//
//! Parts of URL required for a request.
struct target_url_t
{
	std::string m_host;
	std::uint16_t m_port;

	//! Path with optional query.
	std::string m_request_target;

	//! Value for Host header field.
	[[nodiscard]]
	std::string
	host_field() const
	{
		if( 80u == m_port )
			return m_host;
		return fmt::format( "{}:{}", m_host, m_port );
	}
};

[[nodiscard]]
target_url_t
parse_url( std::string_view url )
{
	http_parser_url parser_url;
	http_parser_url_init( &parser_url );

	const auto parse_url_result = http_parser_parse_url(
			url.data(),
			url.size(),
			0,
			&parser_url );
	if( parse_url_result )
		throw http_client_ex_t{
				fmt::format( "unable to parse URL '{}', "
						"http_parser_parse_url result: {}",
						url, parse_url_result )
			};

	const auto is_component_present = [&]( unsigned int component ) -> bool
		{
			return parser_url.field_set & (1u << component);
		};

	const auto try_extract_url_component =
		[&]( unsigned int component ) -> std::string_view
		{
			std::string_view result;
			if( is_component_present(component) )
				result = url.substr(
						parser_url.field_data[component].off,
						parser_url.field_data[component].len );
			return result;
		};

	const auto schema = try_extract_url_component( UF_SCHEMA );
	if( "http" != schema )
		throw http_client_ex_t{
				fmt::format( "unsupported schema in URL '{}'", url )
			};

	target_url_t result;

	result.m_host = std::string{ try_extract_url_component( UF_HOST ) };
	if( result.m_host.empty() )
		throw http_client_ex_t{
				fmt::format( "no host in URL '{}'", url )
			};

	result.m_port = is_component_present( UF_PORT ) ?
			parser_url.port : std::uint16_t{ 80u };

	const auto path = try_extract_url_component( UF_PATH );
	const auto query = try_extract_url_component( UF_QUERY );

	if( !path.empty() )
		result.m_request_target.append( path.data(), path.size() );
	else
		result.m_request_target += '/';

	if( !query.empty() )
	{
		result.m_request_target += '?';
		result.m_request_target.append( query.data(), query.size() );
	}

	return result;
}

//
// wrap_http_parser_callback
//
template<
	typename Handler,
	typename... Args >
[[nodiscard]]
int
wrap_http_parser_callback(
	http_parser * parser,
	int (Handler::*callback)( Args... ),
	Args ...args ) noexcept
{
	auto * handler = reinterpret_cast<Handler *>(parser->data);

	FILTERSYNC_NOTHROW_BLOCK_BEGIN()
		return (handler->*callback)( std::forward<Args>(args)... );
	FILTERSYNC_NOTHROW_BLOCK_END(LOG_THEN_IGNORE)

	return -1;
}

template< typename T >
struct http_parser_callback_kind_detector;

template< typename Handler >
struct http_parser_callback_kind_detector<
	int (Handler::*)() >
{
	static constexpr bool with_data = false;
};

template< typename Handler >
struct http_parser_callback_kind_detector<
	int (Handler::*)( const char *, std::size_t ) >
{
	static constexpr bool with_data = true;
};

template< auto Callback >
[[nodiscard]]
auto
make_http_parser_callback() noexcept
{
	using detector = http_parser_callback_kind_detector< decltype(Callback) >;

	if constexpr( detector::with_data )
		return []( http_parser * parser, const char * data, std::size_t size )
			{
				return wrap_http_parser_callback( parser, Callback, data, size );
			};
	else
		return []( http_parser * parser )
			{
				return wrap_http_parser_callback( parser, Callback );
			};
}

//
// response_parser_t
//
/*!
 * @brief Collector of a response from incoming data.
 */
class response_parser_t
{
public:
	explicit response_parser_t( std::size_t max_body_size )
		:	m_max_body_size{ max_body_size }
	{
		http_parser_init( &m_parser, HTTP_RESPONSE );
		m_parser.data = this;

		http_parser_settings_init( &m_settings );
		m_settings.on_header_field = make_http_parser_callback<
				&response_parser_t::on_header_field >();
		m_settings.on_header_value = make_http_parser_callback<
				&response_parser_t::on_header_value >();
		m_settings.on_headers_complete = make_http_parser_callback<
				&response_parser_t::on_headers_complete >();
		m_settings.on_body = make_http_parser_callback<
				&response_parser_t::on_body >();
		m_settings.on_message_complete = make_http_parser_callback<
				&response_parser_t::on_message_complete >();
	}

	response_parser_t( const response_parser_t & ) = delete;
	response_parser_t( response_parser_t && ) = delete;

	/*!
	 * @brief Feed the next portion of data.
	 *
	 * Zero @a size means the end of the stream.
	 *
	 * @throw http_client_ex_t if the data can't be parsed.
	 */
	void
	feed( const char * data, std::size_t size )
	{
		const auto parsed = http_parser_execute(
				&m_parser, &m_settings, data, size );

		if( m_completed )
			return;

		if( m_body_too_big )
			throw http_client_ex_t{
					fmt::format( "response body is too big, limit: {} byte(s)",
							m_max_body_size )
				};

		const auto err = static_cast< http_errno >( m_parser.http_errno );
		if( HPE_OK != err || parsed != size )
			throw http_client_ex_t{
					fmt::format( "unable to parse response: {} ({})",
							http_errno_name( err ),
							http_errno_description( err ) )
				};
	}

	[[nodiscard]]
	bool
	completed() const noexcept { return m_completed; }

	[[nodiscard]]
	std::optional< std::string_view >
	location() const
	{
		std::optional< std::string_view > result;
		if( const auto v = m_headers.opt_value_of(
				restinio::http_field::location ) )
			result = std::string_view{ v->data(), v->size() };
		return result;
	}

	[[nodiscard]]
	http_response_t
	response() &&
	{
		return http_response_t{ m_status_code, std::move(m_body) };
	}

private:
	const std::size_t m_max_body_size;

	http_parser m_parser;
	http_parser_settings m_settings;

	restinio::http_header_fields_t m_headers;

	std::string m_current_field_name;
	std::string m_current_field_value;
	bool m_last_was_value{ false };

	unsigned int m_status_code{};
	std::string m_body;

	bool m_body_too_big{ false };
	bool m_completed{ false };

	void
	flush_current_field()
	{
		if( !m_current_field_name.empty() )
			m_headers.add_field(
					std::move(m_current_field_name),
					std::move(m_current_field_value) );

		m_current_field_name.clear();
		m_current_field_value.clear();
	}

	int
	on_header_field( const char * data, std::size_t size )
	{
		if( m_last_was_value )
		{
			flush_current_field();
			m_last_was_value = false;
		}

		m_current_field_name.append( data, size );
		return 0;
	}

	int
	on_header_value( const char * data, std::size_t size )
	{
		m_current_field_value.append( data, size );
		m_last_was_value = true;
		return 0;
	}

	int
	on_headers_complete()
	{
		flush_current_field();
		m_status_code = m_parser.status_code;
		return 0;
	}

	int
	on_body( const char * data, std::size_t size )
	{
		if( m_body.size() + size > m_max_body_size )
		{
			m_body_too_big = true;
			return -1;
		}

		m_body.append( data, size );
		return 0;
	}

	int
	on_message_complete()
	{
		m_completed = true;
		// There is no need to handle anything after the first response.
		http_parser_pause( &m_parser, 1 );
		return 0;
	}
};

//
// single_request_t
//
/*!
 * @brief Performer of a single request over a new connection.
 */
class single_request_t
{
public:
	single_request_t(
		const target_url_t & target,
		const asio_http_client_params_t & params )
		:	m_target{ target }
		,	m_parser{ params.m_max_response_size }
		,	m_outgoing{ fmt::format(
				"GET {} HTTP/1.1\r\n"
				"Host: {}\r\n"
				"User-Agent: {}\r\n"
				"Accept: */*\r\n"
				"Connection: close\r\n"
				"\r\n",
				target.m_request_target,
				target.host_field(),
				params.m_user_agent ) }
	{}

	//! Perform the request.
	/*!
	 * @throw http_client_ex_t if the request isn't completed
	 * within @a timeout.
	 */
	void
	perform( std::chrono::steady_clock::duration timeout )
	{
		m_resolver.async_resolve(
				m_target.m_host,
				std::to_string( m_target.m_port ),
				[this]( const asio::error_code & ec,
					asio::ip::tcp::resolver::results_type results )
				{
					on_resolve( ec, std::move(results) );
				} );

		m_ctx.run_for( timeout );

		if( m_failure )
			throw http_client_ex_t{ *m_failure };

		if( !m_parser.completed() )
			throw http_client_ex_t{
					fmt::format( "request to {} timed out", m_target.host_field() )
				};
	}

	[[nodiscard]]
	const response_parser_t &
	parser() const noexcept { return m_parser; }

	[[nodiscard]]
	response_parser_t &
	parser() noexcept { return m_parser; }

private:
	const target_url_t & m_target;

	asio::io_context m_ctx;
	asio::ip::tcp::resolver m_resolver{ m_ctx };
	asio::ip::tcp::socket m_socket{ m_ctx };

	response_parser_t m_parser;

	const std::string m_outgoing;

	std::array< char, 16u * 1024u > m_incoming;

	//! Description of a failure if any.
	std::optional< std::string > m_failure;

	void
	fail( std::string description )
	{
		m_failure = std::move(description);

		asio::error_code ignored;
		m_socket.close( ignored );
	}

	void
	on_resolve(
		const asio::error_code & ec,
		asio::ip::tcp::resolver::results_type results )
	{
		if( ec )
			return fail( fmt::format( "unable to resolve {}: {}",
					m_target.m_host, ec.message() ) );

		asio::async_connect( m_socket, results,
				[this]( const asio::error_code & ec,
					const asio::ip::tcp::endpoint & /*endpoint*/ )
				{
					on_connect( ec );
				} );
	}

	void
	on_connect( const asio::error_code & ec )
	{
		if( ec )
			return fail( fmt::format( "unable to connect to {}: {}",
					m_target.host_field(), ec.message() ) );

		asio::async_write( m_socket, asio::buffer( m_outgoing ),
				[this]( const asio::error_code & ec, std::size_t /*written*/ )
				{
					if( ec )
						return fail( fmt::format( "unable to send request: {}",
								ec.message() ) );

					read_next_portion();
				} );
	}

	void
	read_next_portion()
	{
		m_socket.async_read_some( asio::buffer( m_incoming ),
				[this]( const asio::error_code & ec, std::size_t bytes )
				{
					on_read( ec, bytes );
				} );
	}

	void
	on_read( const asio::error_code & ec, std::size_t bytes )
	{
		try
		{
			if( bytes )
				m_parser.feed( m_incoming.data(), bytes );

			if( !m_parser.completed() && asio::error::eof == ec )
			{
				// The end of a close-delimited body.
				m_parser.feed( m_incoming.data(), 0u );
				if( !m_parser.completed() )
					return fail( "connection closed before the end "
							"of the response" );
			}
		}
		catch( const std::exception & x )
		{
			return fail( x.what() );
		}

		if( m_parser.completed() )
		{
			asio::error_code ignored;
			m_socket.shutdown( asio::ip::tcp::socket::shutdown_both, ignored );
			m_socket.close( ignored );
			return;
		}

		if( ec )
			return fail( fmt::format( "unable to read response: {}",
					ec.message() ) );

		read_next_portion();
	}
};

[[nodiscard]]
bool
is_redirection( unsigned int status_code ) noexcept
{
	switch( status_code )
	{
		case 301u: case 302u: case 303u: case 307u: case 308u:
			return true;
	}

	return false;
}

//! Make an absolute URL from the value of Location header field.
[[nodiscard]]
std::string
make_redirection_url(
	const target_url_t & current,
	std::string_view location )
{
	if( location.substr( 0u, 7u ) == "http://" ||
			location.substr( 0u, 8u ) == "https://" )
		return std::string{ location };

	if( !location.empty() && '/' == location.front() )
		return fmt::format( "http://{}{}", current.host_field(), location );

	throw http_client_ex_t{
			fmt::format( "unsupported Location value: '{}'", location )
		};
}

} /* anonymous namespace */

asio_http_client_t::asio_http_client_t( asio_http_client_params_t params )
	:	m_params{ std::move(params) }
{}

http_response_t
asio_http_client_t::get( const std::string & url )
{
	const auto deadline = std::chrono::steady_clock::now() + m_params.m_timeout;

	std::string current_url = url;
	for( unsigned int redirects = 0u; ; ++redirects )
	{
		const auto target = parse_url( current_url );

		const auto now = std::chrono::steady_clock::now();
		if( now >= deadline )
			throw http_client_ex_t{
					fmt::format( "request to {} timed out", url )
				};

		single_request_t request{ target, m_params };
		request.perform( deadline - now );

		const auto location = request.parser().location();
		auto response = std::move(request.parser()).response();

		if( !is_redirection( response.m_status_code ) || !location )
			return response;

		if( redirects >= m_params.m_max_redirects )
			throw http_client_ex_t{
					fmt::format( "too many redirects for {}", url )
				};

		current_url = make_redirection_url( target, *location );

		::filtersync::logging::direct_mode::debug(
				[&]( auto & logger, auto level )
				{
					logger.log( level, "http_client: redirect ({}) from {} to {}",
							response.m_status_code, url, current_url );
				} );
	}
}

} /* namespace filtersync::fetcher */

