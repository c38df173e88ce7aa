/*!
 * @file
 * @brief Description of a single filter list.
 */

#include <filtersync/filter_list/entry.hpp>

#include <fmt/chrono.h>
#include <fmt/ostream.h>

namespace filtersync::filter_list
{

std::ostream &
operator<<( std::ostream & to, const filter_entry_t & entry )
{
	const auto seconds = []( time_point_t tp ) {
		return std::chrono::duration_cast< std::chrono::seconds >(
				tp.time_since_epoch() ).count();
	};

	fmt::print( to, "{{id {}}} {{enabled {}}} {{name \"{}\"}} {{url {}}} "
			"{{rules {}}} {{last_updated {}}} {{next_update {}}}",
			entry.m_id,
			entry.m_enabled,
			entry.m_name,
			entry.m_url,
			entry.m_rule_count,
			seconds( entry.m_last_updated ),
			seconds( entry.m_next_update ) );

	if( entry.has_pending_update() )
		fmt::print( to, " {{pending {}}}", entry.m_pending_id );

	return to;
}

} /* namespace filtersync::filter_list */

