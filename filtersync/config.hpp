/*!
 * @file
 * @brief Stuff for working with configuration.
 */

#pragma once

#include <filtersync/exception.hpp>

#include <filtersync/filter_list/entry.hpp>

#include <filtersync/fetcher/asio_http_client.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace filtersync
{

//
// consumer_config_t
//
/*!
 * @brief Commands for controlling the consumer of filter lists.
 *
 * An empty value means that nothing should be done.
 */
struct consumer_config_t
{
	std::optional< std::string > m_close_command;
	std::optional< std::string > m_restart_command;
};

/*!
 * @brief Configuration for the whole filtersync.
 */
struct config_t
{
	/*!
	 * @brief Log level to be used for logging.
	 *
	 * The value spdlog::level::off means that logging should
	 * be disabled. An empty value means that the level from
	 * the command line is kept.
	 */
	std::optional< spdlog::level::level_enum > m_log_level;

	//! Directory for filter list files.
	std::filesystem::path m_filters_dir;

	//! Should filter lists be updated?
	bool m_filters_enabled{ true };

	//! Period of filter lists refresh.
	std::chrono::milliseconds m_update_period{ std::chrono::hours{ 24 } };

	//! Parameters for the default HTTP client.
	fetcher::asio_http_client_params_t m_http_client;

	//! Commands for the consumer.
	consumer_config_t m_consumer;

	/*!
	 * @brief Type of storage for filter lists known at the start.
	 */
	using filter_container_t = std::vector< filter_list::filter_entry_t >;

	/*!
	 * @brief Filter lists known at the start.
	 *
	 * Only id, enabled, name and url are set. Can be empty.
	 */
	filter_container_t m_filters;
};

//
// config_parser_t
//
/*!
 * @brief A class for parsing filtersync's config.
 *
 * It's supposed that an instance of that class is created just
 * once and then reused.
 */
class config_parser_t
{
public:
	//! Type of exception for parsing errors.
	struct parser_exception_t : public exception_t
	{
	public:
		parser_exception_t( const std::string & what );
	};

	config_parser_t();
	~config_parser_t();

	//! Parse the content of the config.
	/*!
	 * @throw parser_exception_t in the case of an error.
	 */
	[[nodiscard]]
	config_t
	parse( std::string_view content );

private:
	struct impl_t;

	std::unique_ptr<impl_t> m_impl;
};

} /* namespace filtersync */

