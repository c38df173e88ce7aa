/*!
 * @file
 * @brief Downloading of filter lists into local files.
 */

#pragma once

#include <filtersync/filter_list/storage.hpp>

#include <filtersync/fetcher/http_client.hpp>

#include <cstdint>
#include <mutex>
#include <string>

namespace filtersync::filter_list
{

//
// downloader_t
//
/*!
 * @brief Performs download, counting of rules and storing of
 * a filter list.
 *
 * Downloads are serialized: if one thread is downloading a list then
 * another thread waits until the first download finishes.
 */
class downloader_t
{
public:
	downloader_t(
		fetcher::http_client_t & client,
		const storage_t & storage );

	downloader_t( const downloader_t & ) = delete;
	downloader_t &
	operator=( const downloader_t & ) = delete;

	/*!
	 * @brief Download a list and store it into the file for @a target_id.
	 *
	 * The file for @a target_id isn't touched if the download fails.
	 *
	 * @return count of rules in the downloaded content.
	 *
	 * @throw network_error_t, protocol_error_t, io_error_t.
	 */
	[[nodiscard]]
	std::uint64_t
	download_to(
		const std::string & url,
		filter_id_t target_id );

private:
	fetcher::http_client_t & m_client;
	const storage_t & m_storage;

	//! The lock that allows only one download at a time.
	std::mutex m_download_lock;
};

} /* namespace filtersync::filter_list */

