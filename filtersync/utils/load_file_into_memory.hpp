/*!
 * @file
 * @brief Helper function for loading the whole file content into memory.
 */

#pragma once

#include <filtersync/exception.hpp>

#include <fmt/format.h>
#include <fmt/std.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace filtersync::utils
{

/*!
 * @brief Read the whole content of a file.
 *
 * @throw io_error_t if the file is absent or can't be read.
 */
[[nodiscard]]
inline std::string
load_file_into_memory(
	const std::filesystem::path & file_name )
{
	std::string buffer;

	std::error_code ec;
	const auto file_size = std::filesystem::file_size( file_name, ec );
	if( ec )
		throw io_error_t{
				fmt::format( "unable to get size of '{}': {}",
						file_name, ec.message() )
			};

	if( file_size )
	{
		std::ifstream file;
		file.open( file_name, std::ios_base::in | std::ios_base::binary );
		if( !file )
			throw io_error_t{
					fmt::format( "unable to open '{}' for reading", file_name )
				};

		buffer.resize( file_size );
		file.read( buffer.data(), static_cast<std::streamsize>(file_size) );

		if( file.gcount() != static_cast<std::streamsize>(file_size) )
			throw io_error_t{
					fmt::format( "number of bytes loaded mismatches the size of "
							"the file '{}': bytes_loaded={}, file_size={}",
							file_name,
							file.gcount(),
							file_size )
				};
	}

	return buffer;
}

} /* namespace filtersync::utils */

