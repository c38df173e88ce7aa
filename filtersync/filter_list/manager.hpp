/*!
 * @file
 * @brief Adding and removing of filter lists.
 */

#pragma once

#include <filtersync/filter_list/downloader.hpp>
#include <filtersync/filter_list/id_source.hpp>
#include <filtersync/filter_list/registry.hpp>
#include <filtersync/filter_list/storage.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace filtersync::filter_list
{

//
// new_filter_t
//
/*!
 * @brief Description of a filter list to be added.
 */
struct new_filter_t
{
	std::string m_name;
	std::string m_url;
};

//
// manager_t
//
/*!
 * @brief Entry point for operations that change the set of filter lists.
 *
 * Methods of that class are synchronous and can be called from
 * any thread.
 */
class manager_t
{
public:
	manager_t(
		registry_t & registry,
		const storage_t & storage,
		downloader_t & downloader,
		id_source_t & ids );

	/*!
	 * @brief Add a new filter list.
	 *
	 * The list is downloaded right into the canonical file. The registry
	 * is changed only if the download succeeds.
	 *
	 * @return the added entry.
	 *
	 * @throw duplicate_error_t if name or URL is already in use.
	 * @throw network_error_t, protocol_error_t, io_error_t if the list
	 * can't be downloaded and stored.
	 */
	filter_entry_t
	add( new_filter_t candidate );

	/*!
	 * @brief Remove a filter list with the specified URL.
	 *
	 * Files of the removed list aren't touched.
	 *
	 * @return the removed entry or empty value if there is no such list.
	 */
	[[nodiscard]]
	std::optional< filter_entry_t >
	remove( std::string_view url );

	/*!
	 * @brief Register a list that is known from the configuration.
	 *
	 * The metadata is restored from the canonical file: the last update
	 * time is the modification time of the file and the rule count is
	 * calculated from its content. If the file can't be read then
	 * the list is registered as one that should be refreshed
	 * immediately.
	 *
	 * @throw duplicate_error_t if id, name or URL is already in use.
	 */
	void
	restore( filter_entry_t configured );

private:
	registry_t & m_registry;
	const storage_t & m_storage;
	downloader_t & m_downloader;
	id_source_t & m_ids;
};

} /* namespace filtersync::filter_list */

