/*!
 * @file
 * @brief Downloading of filter lists into local files.
 */

#include <filtersync/filter_list/downloader.hpp>
#include <filtersync/filter_list/rule_counter.hpp>

#include <filtersync/fetcher/pub.hpp>

#include <filtersync/logging/wrap_logging.hpp>

#include <fmt/std.h>

namespace filtersync::filter_list
{

downloader_t::downloader_t(
	fetcher::http_client_t & client,
	const storage_t & storage )
	:	m_client{ client }
	,	m_storage{ storage }
{}

std::uint64_t
downloader_t::download_to(
	const std::string & url,
	filter_id_t target_id )
{
	const auto content = [&] {
		std::lock_guard< std::mutex > lock{ m_download_lock };
		return ::filtersync::fetcher::download( m_client, url );
	}();

	const auto rules = count_rules( content );

	m_storage.write( target_id, content );

	::filtersync::logging::direct_mode::debug(
			[&]( auto & logger, auto level )
			{
				logger.log( level, "downloader: saved filter {} at {} "
						"({} byte(s), {} rule(s))",
						url,
						m_storage.path_for( target_id ),
						content.size(),
						rules );
			} );

	return rules;
}

} /* namespace filtersync::filter_list */

