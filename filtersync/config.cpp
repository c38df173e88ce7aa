/*!
 * @file
 * @brief Stuff for working with configuration.
 */

#include <filtersync/config.hpp>

#include <filtersync/utils/spdlog_log_levels.hpp>
#include <filtersync/utils/config_lines.hpp>

#include <restinio/helpers/http_field_parsers/basics.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace filtersync
{

namespace parse_config_impl
{

struct success_t {};

class failure_t
{
	std::string m_description;

public:
	failure_t( std::string description )
		:	m_description{ std::move(description) }
	{}

	[[nodiscard]]
	std::string_view
	description() const noexcept { return { m_description }; }
};

using command_handling_result_t = std::variant< success_t, failure_t >;

class command_handler_t
{
protected :
	template< typename Parser, typename Parsing_Result_Handler >
	[[nodiscard]]
	static command_handling_result_t
	perform_parsing(
		std::string_view content,
		Parser && parser,
		Parsing_Result_Handler && result_handler )
	{
		using namespace restinio::easy_parser;

		auto parse_result = try_parse(
				content,
				std::forward<Parser>(parser) );
		if( !parse_result )
			return failure_t{
					fmt::format( "unable to parse argument: {}",
							make_error_description( parse_result.error(), content ) )
			};
		else
			return result_handler( *parse_result );
	}

public:
	virtual ~command_handler_t() = default;

	[[nodiscard]]
	virtual command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const = 0;
};

using command_handler_unique_ptr_t = std::unique_ptr< command_handler_t >;

namespace parsers
{

//
// duration_value_p
//
/*!
 * @brief A producer for easy_parser that extracts durations
 * with possible suffixes (ms, s, min, h).
 *
 * Seconds are assumed if there is no suffix. The result is empty
 * if the value doesn't fit into std::chrono::milliseconds.
 */
[[nodiscard]]
static auto
duration_value_p()
{
	struct tmp_value_t
	{
		std::int_least64_t m_count{ 0 };
		std::int_least64_t m_multiplier{ 1000 };
	};

	using namespace restinio::http_field_parsers;

	return produce< std::optional< std::chrono::milliseconds > >(
			produce< tmp_value_t >(
				non_negative_decimal_number_p< std::int_least64_t >()
						>> &tmp_value_t::m_count,
				maybe(
					produce< std::int_least64_t >(
						alternatives(
							exact_p( "min" ) >> just_result( 60'000 ),
							exact_p( "ms" ) >> just_result( 1 ),
							exact_p( "s" ) >> just_result( 1'000 ),
							exact_p( "h" ) >> just_result( 3'600'000 )
						)
					) >> &tmp_value_t::m_multiplier
				)
			)
			>> convert( []( const auto tmp ) {
					std::optional< std::chrono::milliseconds > r;
					if( tmp.m_count <= std::chrono::milliseconds::max().count() /
							tmp.m_multiplier )
						r = std::chrono::milliseconds{ tmp.m_count * tmp.m_multiplier };
					return r;
				} )
			>> as_result()
		);
}

//
// byte_count_p
//
/*!
 * @brief A producer for easy_parser that extracts count of bytes
 * with possible suffixes (b, kib, mib, gib).
 *
 * The result is empty if the value doesn't fit into std::uint64_t.
 */
[[nodiscard]]
static auto
byte_count_p()
{
	using value_t = std::uint64_t;

	struct tmp_value_t
	{
		value_t m_count{ 0u };
		value_t m_multiplier{ 1u };
	};

	using namespace restinio::http_field_parsers;

	return produce< std::optional< value_t > >(
			produce< tmp_value_t >(
				non_negative_decimal_number_p< value_t >()
						>> &tmp_value_t::m_count,
				maybe(
					produce< value_t >(
						alternatives(
							expected_caseless_token_p( "gib" )
									>> just_result( value_t{1024u} * 1024u * 1024u ),
							expected_caseless_token_p( "mib" )
									>> just_result( value_t{1024u} * 1024u ),
							expected_caseless_token_p( "kib" )
									>> just_result( value_t{1024u} ),
							expected_caseless_token_p( "b" )
									>> just_result( value_t{1u} )
						)
					) >> &tmp_value_t::m_multiplier
				)
			)
			>> convert( []( const auto tmp ) {
					std::optional< value_t > r;
					if( tmp.m_count <= std::numeric_limits< value_t >::max() /
							tmp.m_multiplier )
						r = tmp.m_count * tmp.m_multiplier;
					return r;
				} )
			>> as_result()
		);
}

//
// on_off_p
//
/*!
 * @brief A producer for easy_parser that extracts `on` or `off`
 * as a boolean value.
 */
[[nodiscard]]
static auto
on_off_p()
{
	using namespace restinio::http_field_parsers;

	return produce< bool >(
			alternatives(
				exact_p( "on" ) >> just_result( true ),
				exact_p( "off" ) >> just_result( false )
			)
		);
}

} /* namespace parsers */

//
// log_level_handler_t
//
/*!
 * @brief Handler for `log_level` command.
 */
class log_level_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		using namespace restinio::http_field_parsers;

		return perform_parsing(
			content,
			token_p(),
			[&]( const std::string & level_name ) -> command_handling_result_t {
				const auto opt_level = filtersync::utils::name_to_spdlog_level_enum(
						level_name );
				if( !opt_level )
					return failure_t{
							fmt::format( "unsupported log-level: {}", level_name )
					};

				current_cfg.m_log_level = *opt_level;

				return success_t{};
			} );
	}
};

//
// filters_dir_handler_t
//
/*!
 * @brief Handler for `filters.dir` command.
 *
 * The whole rest of the line is used as the path, so the path
 * can contain spaces.
 */
class filters_dir_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		if( content.empty() )
			return failure_t{ "filters.dir can't be empty" };

		current_cfg.m_filters_dir = std::filesystem::path{
				std::string{ content }
			};

		return success_t{};
	}
};

//
// filters_enabled_handler_t
//
/*!
 * @brief Handler for `filters.enabled` command.
 */
class filters_enabled_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		return perform_parsing(
			content,
			parsers::on_off_p(),
			[&]( bool v ) -> command_handling_result_t {
				current_cfg.m_filters_enabled = v;
				return success_t{};
			} );
	}
};

//
// max_duration
//
//! The upper bound for all durations in the config (a year).
/*!
 * Deadlines are computed as a sum of the current time and a duration,
 * so a duration should be far from the limits of the clock.
 */
inline constexpr std::chrono::hours max_duration{ 24 * 365 };

//
// nonzero_duration_handler_t
//
/*!
 * @brief Handler for `filters.update_period` and `http.timeout` commands.
 *
 * The value should be in (0, max_duration].
 */
template< typename Setter >
class nonzero_duration_handler_t : public command_handler_t
{
	const std::string_view m_name;
	const Setter m_setter;

public:
	nonzero_duration_handler_t( std::string_view name, Setter setter )
		:	m_name{ name }
		,	m_setter{ std::move(setter) }
	{}

	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		return perform_parsing(
			content,
			parsers::duration_value_p(),
			[&]( std::optional< std::chrono::milliseconds > v )
				-> command_handling_result_t
			{
				if( !v || *v > max_duration )
					return failure_t{
							fmt::format( "{} can't be greater than {}h",
									m_name, max_duration.count() )
						};
				if( std::chrono::milliseconds::zero() == *v )
					return failure_t{ fmt::format( "{} can't be 0", m_name ) };

				m_setter( current_cfg, *v );

				return success_t{};
			} );
	}
};

template< typename Setter >
[[nodiscard]]
command_handler_unique_ptr_t
make_nonzero_duration_handler( std::string_view name, Setter setter )
{
	return std::make_unique< nonzero_duration_handler_t< Setter > >(
			name, std::move(setter) );
}

//
// max_response_size_handler_t
//
/*!
 * @brief Handler for `http.max_response_size` command.
 */
class max_response_size_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		return perform_parsing(
			content,
			parsers::byte_count_p(),
			[&]( std::optional< std::uint64_t > v ) -> command_handling_result_t {
				if( !v || *v > std::numeric_limits< std::size_t >::max() )
					return failure_t{ "http.max_response_size is too big" };
				if( 0u == *v )
					return failure_t{ "http.max_response_size can't be 0" };

				current_cfg.m_http_client.m_max_response_size =
						static_cast< std::size_t >( *v );

				return success_t{};
			} );
	}
};

//
// max_redirects_handler_t
//
/*!
 * @brief Handler for `http.max_redirects` command.
 */
class max_redirects_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		using namespace restinio::http_field_parsers;

		return perform_parsing(
			content,
			non_negative_decimal_number_p< unsigned int >(),
			[&]( unsigned int v ) -> command_handling_result_t {
				current_cfg.m_http_client.m_max_redirects = v;
				return success_t{};
			} );
	}
};

//
// consumer_command_handler_t
//
/*!
 * @brief Handler for `consumer.close_command` and
 * `consumer.restart_command` commands.
 */
template< std::optional< std::string > consumer_config_t::*Field >
class consumer_command_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		using namespace restinio::http_field_parsers;

		return perform_parsing(
			content,
			quoted_string_p(),
			[&]( std::string & cmd ) -> command_handling_result_t {
				if( cmd.empty() )
					return failure_t{ "consumer command can't be empty" };

				current_cfg.m_consumer.*Field = std::move(cmd);

				return success_t{};
			} );
	}
};

namespace filter_handler_details
{

struct parsed_description_t
{
	filter_list::filter_id_t m_id;
	bool m_enabled;
	std::string m_name;
	std::string m_url;
};

[[nodiscard]]
static inline auto
make_parser()
{
	using namespace restinio::http_field_parsers;

	const auto separator_p = []{
		return sequence( ows(), symbol( ',' ), ows() );
	};

	return produce< parsed_description_t >(
			non_negative_decimal_number_p< filter_list::filter_id_t >()
					>> &parsed_description_t::m_id,
			separator_p(),
			parsers::on_off_p() >> &parsed_description_t::m_enabled,
			separator_p(),
			quoted_string_p() >> &parsed_description_t::m_name,
			separator_p(),
			quoted_string_p() >> &parsed_description_t::m_url
		);
}

} /* namespace filter_handler_details */

//
// filter_handler_t
//
/*!
 * @brief Handler for `filter` command.
 */
class filter_handler_t : public command_handler_t
{
	using parser_t = decltype(filter_handler_details::make_parser());

	//! The actual parser of filter description.
	/*!
	 * It's created as a class member to avoid recreation of it for
	 * every 'filter' command in a file.
	 */
	const parser_t m_parser = filter_handler_details::make_parser();

	[[nodiscard]]
	static std::optional< failure_t >
	check_uniqueness(
		const config_t::filter_container_t & filters,
		const filter_handler_details::parsed_description_t & desc )
	{
		for( const auto & f : filters )
		{
			if( f.m_id == desc.m_id )
				return failure_t{
						fmt::format( "filter id {} is already used", desc.m_id )
					};
			if( f.m_name == desc.m_name )
				return failure_t{
						fmt::format( "filter name '{}' is already used",
								desc.m_name )
					};
			if( f.m_url == desc.m_url )
				return failure_t{
						fmt::format( "filter url '{}' is already used",
								desc.m_url )
					};
		}

		return std::nullopt;
	}

public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		namespace hd = filter_handler_details;

		return perform_parsing(
			content,
			m_parser,
			[&]( hd::parsed_description_t & desc ) -> command_handling_result_t
			{
				if( filter_list::no_pending_id == desc.m_id )
					return failure_t{ "filter id can't be 0" };
				if( desc.m_name.empty() )
					return failure_t{ "filter name can't be empty" };
				if( desc.m_url.empty() )
					return failure_t{ "filter url can't be empty" };

				if( auto check_result = check_uniqueness(
						current_cfg.m_filters, desc ) )
					return std::move( *check_result );

				filter_list::filter_entry_t entry;
				entry.m_id = desc.m_id;
				entry.m_enabled = desc.m_enabled;
				entry.m_name = std::move(desc.m_name);
				entry.m_url = std::move(desc.m_url);

				current_cfg.m_filters.push_back( std::move(entry) );

				return success_t{};
			} );
	}
};

//
// split_line
//
/*!
 * @brief Splits an already trimmed line into a command name and
 * the rest of the line.
 *
 * The rest is empty if the command has no arguments.
 */
[[nodiscard]]
std::pair< std::string_view, std::string_view >
split_line( std::string_view line ) noexcept
{
	constexpr std::string_view spaces{ " \t\x0b" };

	const auto name_end = line.find_first_of( spaces );
	if( std::string_view::npos == name_end )
		return { line, std::string_view{} };

	auto rest = line.substr( name_end );
	rest.remove_prefix( std::min(
			rest.find_first_not_of( spaces ), rest.size() ) );

	return { line.substr( 0u, name_end ), rest };
}

} /* namespace parse_config_impl */

//
// config_parser_t::parser_exception_t
//
config_parser_t::parser_exception_t::parser_exception_t(
	const std::string & what )
	:	exception_t{ "config_parser: " + what }
{}

//
// config_parser_t::impl_t
//
struct config_parser_t::impl_t
{
	std::map<
			std::string,
			parse_config_impl::command_handler_unique_ptr_t,
			std::less<> > m_commands;

	void
	add( std::string name, parse_config_impl::command_handler_unique_ptr_t h )
	{
		m_commands.emplace( std::move(name), std::move(h) );
	}

	//! Returns nullptr for an unknown command.
	[[nodiscard]]
	const parse_config_impl::command_handler_t *
	handler_for( std::string_view name ) const noexcept
	{
		const auto it = m_commands.find( name );
		return it != m_commands.end() ? it->second.get() : nullptr;
	}
};

//
// config_parser_t
//
config_parser_t::config_parser_t()
	:	m_impl{ std::make_unique< impl_t >() }
{
	using namespace parse_config_impl;

	m_impl->add( "log_level", std::make_unique< log_level_handler_t >() );

	m_impl->add( "filters.dir", std::make_unique< filters_dir_handler_t >() );
	m_impl->add( "filters.enabled",
			std::make_unique< filters_enabled_handler_t >() );
	m_impl->add( "filters.update_period",
			make_nonzero_duration_handler( "filters.update_period",
					[]( config_t & cfg, std::chrono::milliseconds v ) {
						cfg.m_update_period = v;
					} ) );

	m_impl->add( "http.timeout",
			make_nonzero_duration_handler( "http.timeout",
					[]( config_t & cfg, std::chrono::milliseconds v ) {
						cfg.m_http_client.m_timeout = v;
					} ) );
	m_impl->add( "http.max_response_size",
			std::make_unique< max_response_size_handler_t >() );
	m_impl->add( "http.max_redirects",
			std::make_unique< max_redirects_handler_t >() );

	m_impl->add( "consumer.close_command",
			std::make_unique< consumer_command_handler_t<
					&consumer_config_t::m_close_command > >() );
	m_impl->add( "consumer.restart_command",
			std::make_unique< consumer_command_handler_t<
					&consumer_config_t::m_restart_command > >() );

	m_impl->add( "filter", std::make_unique< filter_handler_t >() );
}

config_parser_t::~config_parser_t()
{}

[[nodiscard]]
config_t
config_parser_t::parse( std::string_view content )
{
	using namespace parse_config_impl;

	config_t result;
	bool has_commands{ false };

	utils::for_each_config_line( content, [&]( const utils::config_line_t & line ) {
			const auto [command, args] = split_line( line.m_content );

			const auto * handler = m_impl->handler_for( command );
			if( !handler )
				throw parser_exception_t{
						fmt::format( "unknown command {} at line {}",
								command, line.m_number )
					};

			const auto outcome = handler->try_handle( args, result );
			if( const auto * f = std::get_if< failure_t >( &outcome ) )
				throw parser_exception_t{
						fmt::format( "unable to process command {} at line {}: {}",
								command, line.m_number, f->description() )
					};

			has_commands = true;
		} );

	if( !has_commands )
		throw parser_exception_t{ "Empty config" };

	if( result.m_filters_dir.empty() )
		throw parser_exception_t{ "filters.dir should be specified" };

	return result;
}

} /* namespace filtersync */

