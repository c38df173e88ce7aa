/*!
 * @file
 * @brief Storage of filter lists content on the local disk.
 */

#pragma once

#include <filtersync/filter_list/entry.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace filtersync::filter_list
{

//
// storage_t
//
/*!
 * @brief Access to files with content of filter lists.
 *
 * Every file is stored in the same directory under the name
 * `<id>.<extension>`. Canonical and staged files use the same naming
 * scheme, so a staged file becomes canonical by a single rename.
 *
 * All methods throw io_error_t in the case of a failure.
 */
class storage_t
{
public:
	storage_t(
		std::filesystem::path directory,
		std::string extension = "txt" );

	[[nodiscard]]
	const std::filesystem::path &
	directory() const noexcept { return m_directory; }

	//! Name of file for the specified identifier.
	[[nodiscard]]
	std::filesystem::path
	path_for( filter_id_t id ) const;

	//! Store the content in the file for the specified identifier.
	/*!
	 * The content is written into a temporary file first and then that
	 * file is renamed. It means that the file for @a id is either
	 * absent/unchanged or contains the whole @a content.
	 */
	void
	write( filter_id_t id, std::string_view content ) const;

	//! Load the whole content of the file for the specified identifier.
	[[nodiscard]]
	std::string
	load( filter_id_t id ) const;

	//! Modification time of the file for the specified identifier.
	[[nodiscard]]
	time_point_t
	last_write_time( filter_id_t id ) const;

	//! Remove the file for the specified identifier if it exists.
	/*!
	 * Errors are ignored.
	 */
	void
	discard( filter_id_t id ) const noexcept;

	//! Replace the file for @a canonical_id by the file for @a staged_id.
	/*!
	 * It's a single rename operation. Readers of the canonical file
	 * see either the old or the new content.
	 */
	void
	promote( filter_id_t staged_id, filter_id_t canonical_id ) const;

private:
	const std::filesystem::path m_directory;
	const std::string m_extension;
};

} /* namespace filtersync::filter_list */

