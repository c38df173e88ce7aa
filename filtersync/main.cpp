/*!
 * @file
 * @brief The entry point of filtersync.
 */

#include <filtersync/utils/spdlog_log_levels.hpp>
#include <filtersync/utils/ensure_successful_syscall.hpp>
#include <filtersync/utils/load_file_into_memory.hpp>

#include <filtersync/filter_list/manager.hpp>

#include <filtersync/fetcher/asio_http_client.hpp>

#include <filtersync/updater/pub.hpp>

#include <filtersync/command_proxy_controller.hpp>
#include <filtersync/config.hpp>

#include <filtersync/logging/wrap_logging.hpp>

#include <filtersync/nothrow_block/macros.hpp>

#include <signal.h>
#include <syslog.h>
#include <unistd.h>

#include <array>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <args/args.hxx>

#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/syslog_sink.h>

#include <fmt/std.h>

#include <so_5/all.hpp>

namespace {

const char version_string[] =
R"ver(filtersync v.0.1.0
[staged refresh, batch commit]
)ver";

//
// to_string
//

[[nodiscard]]
std::string
to_string( const spdlog::string_view_t what )
{
	return std::string( what.data(), what.size() );
}

//
// detec_log_level
//

[[nodiscard]]
spdlog::level::level_enum
detec_log_level(const std::string & name)
{
	const auto r = filtersync::utils::name_to_spdlog_level_enum( name );

	if( !r )
	{
		throw std::runtime_error( "Unsupported log-level: " + name );
	}

	return *r;
}

//
// log_params_t
//
/*!
 * @brief Where and how the log is written.
 *
 * Every item of m_targets is one of:
 * - "stdout" or "stderr" for a console;
 * - "@name" for syslog with ident "name";
 * - anything else is a name of a rotating log file.
 *
 * An empty list means "stdout".
 */
struct log_params_t
{
	std::vector< std::string > m_targets;

	spdlog::level::level_enum m_log_level{ spdlog::level::info };
	spdlog::level::level_enum m_log_flush_level{ spdlog::level::err };
	std::size_t m_log_file_size{ 10ull*1024u*1024u };
	std::size_t m_log_file_count{ 3u };
};

//
// cmd_line_args_t
//
struct cmd_line_args_t
{
	bool m_is_no_daemonize{ false };

	std::optional<gid_t> m_setgid;
	std::optional<uid_t> m_setuid;

	log_params_t m_log_params;

	std::filesystem::path m_config_file;
};

//
// finish_app_ex_t
//

//! An exception for errors related to command-line args parsing.
/*!
 * If such an exception is throw then the application has to be finished.
 */
class finish_app_ex_t : public std::runtime_error {

	int m_exit_code;

public:
	finish_app_ex_t(
		const char * what_arg,
		int exit_code )
	:	std::runtime_error{ what_arg }
	,	m_exit_code{ exit_code }
	{
	}

	int
	exit_code() const noexcept { return m_exit_code; }
};

//
// parse_cmd_line
//
/*!
 * @throw finish_app_ex_t if the application has to be finished
 * right after the parsing (help, version or a parsing error).
 */
[[nodiscard]]
cmd_line_args_t
parse_cmd_line( int argc, char ** argv )
{
	cmd_line_args_t result;

	args::ArgumentParser parser(
			"filtersync",
			"Keeps local copies of ad-blocking filter lists up to date" );

	args::HelpFlag help( parser, "help", "Display this help text",
			{ 'h', "help" } );
	args::Flag version( parser, "version", "Show version number",
			{ 'v', "version" } );

	args::ValueFlag< std::string > config_file( parser,
			"path", "Path to the config file [required]",
			{ 'c', "config-file" } );

	args::Flag no_daemonize( parser, "no-daemonize",
			"Stay in the foreground", { "no-daemonize" } );
	args::ValueFlag< uint32_t > setuid( parser,
			"uid", "Switch to that user after the start", { "setuid" } );
	args::ValueFlag< uint32_t > setgid( parser,
			"gid", "Switch to that group after the start", { "setgid" } );

	args::ValueFlagList< std::string > log_target( parser,
			"target", "Log destination: stdout, stderr, @ident for syslog "
			"or a file name. Can be repeated (default: stdout)",
			{ "log-target" } );
	args::ValueFlag< std::string > log_level( parser,
			"level", "Log level (" +
			std::string{ filtersync::utils::supported_log_level_names() } +
			"). log_level from the config takes precedence (default: " +
			to_string( spdlog::level::to_string_view(
					result.m_log_params.m_log_level ) ) + ")",
			{ 'l', "log-level" } );
	args::ValueFlag< std::string > log_flush_level( parser,
			"level", "The log is flushed on that level (default: " +
			to_string( spdlog::level::to_string_view(
					result.m_log_params.m_log_flush_level ) ) + ")",
			{ "log-flush-level" } );
	args::ValueFlag< std::size_t > log_file_size( parser,
			"bytes", "Size of one log file", { "log-file-size" } );
	args::ValueFlag< std::size_t > log_file_count( parser,
			"count", "Count of rotated log files, at least 2",
			{ "log-file-count" } );

	try
	{
		parser.ParseCLI( argc, argv );
	}
	catch( const args::Help & )
	{
		std::cout << parser;
		throw finish_app_ex_t( "cmd-line-help", 1 );
	}
	catch( const args::ParseError & e )
	{
		std::cerr << e.what() << std::endl;
		throw finish_app_ex_t( "cmd-line-parse-error", 2 );
	}

	if( version )
	{
		std::cout << version_string << std::endl;
		throw finish_app_ex_t( "show-version-only", 0 );
	}

	if( !config_file )
		throw std::runtime_error( "--config-file is required" );
	result.m_config_file = args::get( config_file );

	result.m_is_no_daemonize = no_daemonize;
	if( setuid )
		result.m_setuid = args::get( setuid );
	if( setgid )
		result.m_setgid = args::get( setgid );

	auto & log_params = result.m_log_params;
	if( log_target )
		log_params.m_targets = args::get( log_target );
	if( log_level )
		log_params.m_log_level = detec_log_level( args::get( log_level ) );
	if( log_flush_level )
		log_params.m_log_flush_level = detec_log_level(
				args::get( log_flush_level ) );
	if( log_file_size )
	{
		log_params.m_log_file_size = args::get( log_file_size );
		if( 0u == log_params.m_log_file_size )
			throw std::runtime_error( "--log-file-size can't be 0" );
	}
	if( log_file_count )
	{
		log_params.m_log_file_count = args::get( log_file_count );
		if( log_params.m_log_file_count < 2u )
			throw std::runtime_error( "--log-file-count should be at least 2" );
	}

	return result;
}

// SIGUSR1 starts an update. SIGCHLD comes from consumer commands.
const std::array<int, 7> SIGNALS_TO_HANDLE{
	SIGINT, SIGHUP, SIGQUIT, SIGTERM, SIGPIPE, SIGCHLD, SIGUSR1
};

[[nodiscard]]
sigset_t
make_sigset()
{
	sigset_t result;
	sigemptyset( &result );
	for( auto s : SIGNALS_TO_HANDLE )
	{
		::filtersync::utils::ensure_successful_syscall(
				sigaddset( &result, s ),
				"make_sigset.sigaddset()" );
	}

	return result;
}

//! Checks that filter lists can be stored in the specified directory.
/*!
 * @throws std::runtime_error In the case if check fails.
 */
void
ensure_filters_dir_is_writable( const std::filesystem::path & path )
{
	if( !std::filesystem::is_directory( path ) )
		throw std::runtime_error(
				fmt::format( "filters dir {} is not a directory", path ) );

	const auto probe = path / ".filtersync.probe";
	{
		std::ofstream tmp( probe );
		if( !tmp.is_open() || !(tmp << "probe") )
			throw std::runtime_error(
					fmt::format( "unable to write into filters dir {}", path ) );
	}

	std::filesystem::remove( probe );
}

//! Waits for signals until a termination one arrives.
void
run_loop( const filtersync::application_context_t & app_ctx )
{
	const sigset_t sigset = make_sigset();

	for(;;)
	{
		int signal;
		if( const int rc = sigwait( &sigset, &signal ); 0 != rc )
			throw std::runtime_error( "sigwait failed -> " +
					std::system_category().message( rc ) );

		switch( signal )
		{
			case SIGPIPE: [[fallthrough]];
			case SIGCHLD:
			break;

			case SIGUSR1:
				filtersync::logging::direct_mode::info(
					[]( auto & logger, auto level ) {
						logger.log( level, "SIGUSR1 received, updating filters" );
					} );
				so_5::send< filtersync::updater::update_now_t >(
						app_ctx.m_updater_mbox );
			break;

			default:
				filtersync::logging::direct_mode::info(
					[signal]( auto & logger, auto level ) {
						logger.log( level, "signal {} received, shutting down",
								signal );
					} );
			return;
		}
	}
}

//
// prepare_process
//
void
prepare_process( const cmd_line_args_t & params )
{
	using ::filtersync::utils::ensure_successful_syscall;

	if( !params.m_is_no_daemonize )
		// Relative paths from the command line should stay valid.
		ensure_successful_syscall( daemon( 1, 0 ), "prepare_process.daemon()" );

	if( params.m_setgid )
		ensure_successful_syscall( setgid( *params.m_setgid ),
				"prepare_process.setgid()" );

	if( params.m_setuid )
		ensure_successful_syscall( setuid( *params.m_setuid ),
				"prepare_process.setuid()" );

	// Must be done before any thread is started.
	const sigset_t sigset = make_sigset();
	ensure_successful_syscall( sigprocmask( SIG_BLOCK, &sigset, nullptr ),
			"prepare_process.sigprocmask()" );
}

[[nodiscard]]
spdlog::sink_ptr
make_sink( const std::string & target, const log_params_t & log_params )
{
	if( "stdout" == target )
		return std::make_shared< spdlog::sinks::stdout_color_sink_mt >();

	if( "stderr" == target )
		return std::make_shared< spdlog::sinks::stderr_color_sink_mt >();

	if( '@' == target.front() )
	{
		if( 1u == target.size() )
			throw std::runtime_error( "empty syslog ident in --log-target" );

		return std::make_shared< spdlog::sinks::syslog_sink_mt >(
				target.substr( 1u ),
				0, // No special options.
				LOG_USER,
				true );
	}

	return std::make_shared< spdlog::sinks::rotating_file_sink_mt >(
			target,
			log_params.m_log_file_size,
			log_params.m_log_file_count );
}

[[nodiscard]]
std::shared_ptr< spdlog::logger >
make_logger( const log_params_t & log_params )
{
	std::vector< spdlog::sink_ptr > sinks;
	for( const auto & t : log_params.m_targets )
	{
		if( t.empty() )
			throw std::runtime_error( "empty --log-target" );
		sinks.push_back( make_sink( t, log_params ) );
	}

	if( sinks.empty() )
		sinks.push_back(
				std::make_shared< spdlog::sinks::stdout_color_sink_mt >() );

	auto logger = std::make_shared< spdlog::logger >(
			"filtersync", sinks.begin(), sinks.end() );
	logger->set_level( log_params.m_log_level );
	logger->flush_on( log_params.m_log_flush_level );

	return logger;
}

// Redirects SObjectizer's diagnostics to the application log.
[[nodiscard]]
so_5::environment_params_t
make_sobjectizer_params()
{
	class so5_error_logger_t : public so_5::error_logger_t
	{
	public:
		void
		log(
			const char * file_name,
			unsigned int line,
			const std::string & message ) override
		{
			FILTERSYNC_NOTHROW_BLOCK_BEGIN()
				FILTERSYNC_NOTHROW_BLOCK_STAGE(log_so5_error)

				filtersync::logging::direct_mode::err(
					[&]( auto & logger, auto level ) {
						logger.log( level, "SObjectizer error: {} ({}:{})",
								message, file_name, line );
					} );
			FILTERSYNC_NOTHROW_BLOCK_END(LOG_THEN_IGNORE)
		}
	};

	class so5_event_exception_logger_t : public so_5::event_exception_logger_t
	{
	public:
		void
		log_exception(
			const std::exception & event_exception,
			const so_5::coop_handle_t & coop ) noexcept override
		{
			FILTERSYNC_NOTHROW_BLOCK_BEGIN()
				FILTERSYNC_NOTHROW_BLOCK_STAGE(log_so5_event_exception)

				filtersync::logging::direct_mode::err(
					[&]( auto & logger, auto level ) {
						logger.log( level,
								"exception from an event handler: {} (coop {})",
								event_exception.what(), coop.id() );
					} );
			FILTERSYNC_NOTHROW_BLOCK_END(LOG_THEN_IGNORE)
		}
	};

	so_5::environment_params_t params;

	params.error_logger( std::make_shared< so5_error_logger_t >() );
	params.event_exception_logger(
			std::make_unique< so5_event_exception_logger_t >() );

	return params;
}

[[nodiscard]]
filtersync::config_t
load_config( const std::filesystem::path & file_name )
{
	filtersync::config_parser_t parser;
	return parser.parse(
			filtersync::utils::load_file_into_memory( file_name ) );
}

//
// application_t
//
/*!
 * @brief Objects that are shared by the updater agent and the main thread.
 *
 * Filters listed in the config are restored in the constructor.
 */
struct application_t
{
	filtersync::filter_list::storage_t m_storage;
	filtersync::filter_list::registry_t m_registry;
	filtersync::filter_list::id_source_t m_ids;
	filtersync::fetcher::asio_http_client_t m_http_client;
	filtersync::filter_list::downloader_t m_downloader;
	filtersync::filter_list::manager_t m_manager;
	filtersync::command_proxy_controller_t m_consumer;
	filtersync::updater::commit_manager_t m_committer;
	filtersync::updater::update_cycle_t m_cycle;

	explicit application_t( const filtersync::config_t & cfg )
		:	m_storage{ cfg.m_filters_dir }
		,	m_registry{ cfg.m_update_period }
		,	m_http_client{ cfg.m_http_client }
		,	m_downloader{ m_http_client, m_storage }
		,	m_manager{ m_registry, m_storage, m_downloader, m_ids }
		,	m_consumer{
				cfg.m_consumer.m_close_command,
				cfg.m_consumer.m_restart_command }
		,	m_committer{ m_registry, m_storage, m_consumer }
		,	m_cycle{ m_registry, m_downloader, m_ids, m_committer }
	{
		for( const auto & f : cfg.m_filters )
			m_manager.restore( f );

		filtersync::logging::direct_mode::info(
			[this]( auto & logger, auto level ) {
				logger.log( level, "{} filter(s) restored from {}",
						m_registry.size(), m_storage.directory() );
			} );
	}
};

} /* anonimous namespace */

int
main(int argc, char ** argv)
{
	try
	{
		const auto cmd_line_args = parse_cmd_line( argc, argv );

		auto logger = make_logger( cmd_line_args.m_log_params );
		filtersync::logging::logger_holder_t log_holder{ logger };

		const auto cfg = load_config( cmd_line_args.m_config_file );
		if( cfg.m_log_level )
			logger->set_level( *(cfg.m_log_level) );

		ensure_filters_dir_is_writable( cfg.m_filters_dir );

		prepare_process( cmd_line_args );

		application_t app{ cfg };

		filtersync::application_context_t app_ctx;

		so_5::wrapped_env_t sobj{
			[&]( so_5::environment_t & env ) {
				app_ctx.m_updater_mbox = env.create_mbox();

				(void)filtersync::updater::introduce_updater(
						env,
						so_5::disp::one_thread::make_dispatcher(
								env, "updater" ).binder(),
						app_ctx,
						filtersync::updater::params_t{
								app.m_cycle,
								cfg.m_update_period,
								cfg.m_filters_enabled
						} );
			},
			[]( so_5::environment_params_t & params ) {
				params = make_sobjectizer_params();
			}
		};

		run_loop( app_ctx );
	}
	catch( const finish_app_ex_t & need_finish )
	{
		return need_finish.exit_code();
	}
	catch( const std::exception & ex )
	{
		std::cerr << "*** Exception caught: " << ex.what() << std::endl;
		return 2;
	}

	return 0;
}
