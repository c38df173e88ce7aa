/*!
 * @file
 * @brief The base class for exceptions and the error taxonomy.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace filtersync
{

/*!
 * @brief The base class for all exceptions thrown by filtersync's code.
 */
class exception_t : public std::runtime_error
{
public:
	// Inherit constructors from the base class.
	using std::runtime_error::runtime_error;
};

//
// duplicate_error_t
//
/*!
 * @brief A filter with the same name or URL is already registered.
 */
class duplicate_error_t : public exception_t
{
public:
	using exception_t::exception_t;
};

//
// network_error_t
//
/*!
 * @brief The transport failed to perform a request.
 */
class network_error_t : public exception_t
{
public:
	using exception_t::exception_t;
};

//
// protocol_error_t
//
/*!
 * @brief The server replied with an unsuccessful status code.
 */
class protocol_error_t : public exception_t
{
	unsigned int m_status_code;

public:
	protocol_error_t(
		const std::string & what,
		unsigned int status_code )
		:	exception_t{ what }
		,	m_status_code{ status_code }
	{}

	[[nodiscard]]
	unsigned int
	status_code() const noexcept { return m_status_code; }
};

//
// io_error_t
//
/*!
 * @brief Read, write or rename of a filter file failed.
 */
class io_error_t : public exception_t
{
public:
	using exception_t::exception_t;
};

} /* namespace filtersync */

