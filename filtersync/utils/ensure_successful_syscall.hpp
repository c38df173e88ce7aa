/*!
 * @file
 * @brief Helper function that throws an exception if some
 * system call returns an error.
 */

#pragma once

#include <filtersync/exception.hpp>

#include <cerrno>
#include <string>
#include <string_view>
#include <system_error>

namespace filtersync::utils
{

/*!
 * @brief Throws @a Exception if @a ret_code is -1.
 *
 * The description of errno is appended to @a what.
 */
template< typename Exception = exception_t >
void
ensure_successful_syscall( int ret_code, std::string_view what )
{
	if( -1 == ret_code )
	{
		const auto error_code = errno;
		std::string description{ what };
		description += ": failed -> ";
		description += std::system_category().message( error_code );

		throw Exception{ description };
	}
}

} /* namespace filtersync::utils */

