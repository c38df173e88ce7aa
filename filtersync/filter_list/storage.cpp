/*!
 * @file
 * @brief Storage of filter lists content on the local disk.
 */

#include <filtersync/filter_list/storage.hpp>

#include <filtersync/utils/ensure_successful_syscall.hpp>
#include <filtersync/utils/load_file_into_memory.hpp>

#include <filtersync/exception.hpp>

#include <fmt/format.h>
#include <fmt/std.h>

#include <sys/stat.h>

#include <fstream>
#include <system_error>

namespace filtersync::filter_list
{

namespace
{

[[nodiscard]]
std::filesystem::path
make_temporary_name( const std::filesystem::path & target )
{
	auto result = target;
	result += ".tmp";
	return result;
}

void
write_whole_file(
	const std::filesystem::path & file_name,
	std::string_view content )
{
	std::ofstream file( file_name,
			std::ios_base::out | std::ios_base::binary |
					std::ios_base::trunc );
	if( !file )
		throw io_error_t{
				fmt::format( "unable to open '{}' for writing", file_name )
			};

	file.exceptions( std::ofstream::badbit | std::ofstream::failbit );

	file.write(
			content.data(),
			static_cast<std::streamsize>(content.size()) );

	file.close();
}

} /* anonymous namespace */

storage_t::storage_t(
	std::filesystem::path directory,
	std::string extension )
	:	m_directory{ std::move(directory) }
	,	m_extension{ std::move(extension) }
{}

std::filesystem::path
storage_t::path_for( filter_id_t id ) const
{
	return m_directory / fmt::format( "{}.{}", id, m_extension );
}

void
storage_t::write( filter_id_t id, std::string_view content ) const
{
	const auto target = path_for( id );
	const auto tmp_name = make_temporary_name( target );

	try
	{
		write_whole_file( tmp_name, content );
	}
	catch( const std::exception & x )
	{
		std::error_code ec;
		std::filesystem::remove( tmp_name, ec );

		throw io_error_t{
				fmt::format( "unable to write '{}': {}", tmp_name, x.what() )
			};
	}

	std::error_code ec;
	std::filesystem::rename( tmp_name, target, ec );
	if( ec )
	{
		std::error_code remove_ec;
		std::filesystem::remove( tmp_name, remove_ec );

		throw io_error_t{
				fmt::format( "unable to rename '{}' to '{}': {}",
						tmp_name, target, ec.message() )
			};
	}
}

std::string
storage_t::load( filter_id_t id ) const
{
	return ::filtersync::utils::load_file_into_memory( path_for( id ) );
}

time_point_t
storage_t::last_write_time( filter_id_t id ) const
{
	const auto file_name = path_for( id );

	struct stat st{};
	::filtersync::utils::ensure_successful_syscall< io_error_t >(
			::stat( file_name.c_str(), &st ),
			fmt::format( "stat('{}')", file_name ) );

	const auto since_epoch =
			std::chrono::seconds{ st.st_mtim.tv_sec } +
			std::chrono::nanoseconds{ st.st_mtim.tv_nsec };

	return time_point_t{
			std::chrono::duration_cast< clock_t::duration >( since_epoch ) };
}

void
storage_t::discard( filter_id_t id ) const noexcept
{
	std::error_code ec;
	std::filesystem::remove( path_for( id ), ec );
}

void
storage_t::promote( filter_id_t staged_id, filter_id_t canonical_id ) const
{
	const auto staged = path_for( staged_id );
	const auto canonical = path_for( canonical_id );

	std::error_code ec;
	std::filesystem::rename( staged, canonical, ec );
	if( ec )
		throw io_error_t{
				fmt::format( "unable to rename '{}' to '{}': {}",
						staged, canonical, ec.message() )
			};
}

} /* namespace filtersync::filter_list */

