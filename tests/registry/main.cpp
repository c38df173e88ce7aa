#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN 
#include <doctest/doctest.h>

#include <filtersync/filter_list/registry.hpp>

#include <filtersync/exception.hpp>

#include <tests/fakes/pub.hpp>

#include <set>
#include <thread>

using namespace std::chrono_literals;

namespace fl = filtersync::filter_list;

namespace
{

[[nodiscard]]
fl::filter_entry_t
make_entry(
	fl::filter_id_t id,
	std::string name,
	std::string url,
	fl::time_point_t next_update = fl::time_point_t{} )
{
	fl::filter_entry_t e;
	e.m_id = id;
	e.m_name = std::move(name);
	e.m_url = std::move(url);
	e.m_next_update = next_update;
	return e;
}

} /* namespace anonymous */

TEST_CASE("uniqueness of names and urls") {
	fl::registry_t registry{ 24h };

	REQUIRE_NOTHROW( registry.insert( make_entry( 1, "first", "http://a/1" ) ) );

	REQUIRE_NOTHROW( registry.ensure_unique( "second", "http://a/2" ) );
	REQUIRE_THROWS_AS( registry.ensure_unique( "first", "http://a/2" ),
			filtersync::duplicate_error_t );
	REQUIRE_THROWS_AS( registry.ensure_unique( "second", "http://a/1" ),
			filtersync::duplicate_error_t );

	REQUIRE_THROWS_AS(
			registry.insert( make_entry( 2, "first", "http://a/2" ) ),
			filtersync::duplicate_error_t );
	REQUIRE_THROWS_AS(
			registry.insert( make_entry( 2, "second", "http://a/1" ) ),
			filtersync::duplicate_error_t );
	REQUIRE_THROWS_AS(
			registry.insert( make_entry( 1, "second", "http://a/2" ) ),
			filtersync::duplicate_error_t );

	REQUIRE( 1u == registry.size() );
}

TEST_CASE("remove of absent url leaves registry unchanged") {
	fl::registry_t registry{ 24h };

	registry.insert( make_entry( 1, "first", "http://a/1" ) );
	registry.insert( make_entry( 2, "second", "http://a/2" ) );

	const auto before = registry.snapshot();

	REQUIRE( !registry.remove( "http://a/3" ) );

	REQUIRE( before == registry.snapshot() );
}

TEST_CASE("remove returns the removed entry") {
	fl::registry_t registry{ 24h };

	registry.insert( make_entry( 1, "first", "http://a/1" ) );
	registry.insert( make_entry( 2, "second", "http://a/2" ) );

	const auto removed = registry.remove( "http://a/1" );
	REQUIRE( removed );
	REQUIRE( 1u == removed->m_id );
	REQUIRE( "first" == removed->m_name );

	REQUIRE( 1u == registry.size() );
	REQUIRE( !registry.find( "http://a/1" ) );

	// The name and url can be used again.
	REQUIRE_NOTHROW( registry.ensure_unique( "first", "http://a/1" ) );
}

TEST_CASE("select_due in insertion order with reservation") {
	fl::registry_t registry{ 1h };

	const auto now = fl::clock_t::now();

	registry.insert( make_entry( 1, "first", "http://a/1", now + 1min ) );
	registry.insert( make_entry( 2, "second", "http://a/2", now - 1min ) );
	registry.insert( make_entry( 3, "third", "http://a/3", now ) );

	auto due = registry.select_due( now );
	REQUIRE( due );
	REQUIRE( 2u == due->m_id );
	REQUIRE( now + 1h == due->m_next_update );
	REQUIRE( now + 1h == registry.find( "http://a/2" )->m_next_update );

	due = registry.select_due( now );
	REQUIRE( due );
	REQUIRE( 3u == due->m_id );

	REQUIRE( !registry.select_due( now ) );

	due = registry.select_due( now + 1min );
	REQUIRE( due );
	REQUIRE( 1u == due->m_id );
}

TEST_CASE("disabled entries are never due") {
	fl::registry_t registry{ 1h };

	auto e = make_entry( 1, "first", "http://a/1" );
	e.m_enabled = false;
	registry.insert( e );

	REQUIRE( !registry.select_due( fl::clock_t::now() ) );
}

TEST_CASE("stage and complete pending") {
	fl::registry_t registry{ 1h };

	registry.insert( make_entry( 1, "first", "http://a/1" ) );
	registry.insert( make_entry( 2, "second", "http://a/2" ) );

	REQUIRE( registry.pending_updates().empty() );

	const auto updated_at = fl::clock_t::now();
	REQUIRE( registry.stage( fl::staged_update_t{ 1, 100, 42, updated_at } ) );

	const auto first = registry.find( "http://a/1" );
	REQUIRE( 100u == first->m_pending_id );
	REQUIRE( 42u == first->m_rule_count );
	REQUIRE( updated_at == first->m_last_updated );

	const auto pending = registry.pending_updates();
	REQUIRE( 1u == pending.size() );
	REQUIRE( 1u == pending[0].m_id );
	REQUIRE( 100u == pending[0].m_staged_id );
	REQUIRE( "http://a/1" == pending[0].m_url );

	// Wrong staged id.
	REQUIRE( !registry.complete_pending( 1, 101 ) );
	REQUIRE( registry.complete_pending( 1, 100 ) );
	REQUIRE( registry.pending_updates().empty() );
	REQUIRE( !registry.find( "http://a/1" )->has_pending_update() );
}

TEST_CASE("stage for removed entry") {
	fl::registry_t registry{ 1h };

	registry.insert( make_entry( 1, "first", "http://a/1" ) );
	REQUIRE( registry.remove( "http://a/1" ) );

	REQUIRE( !registry.stage(
			fl::staged_update_t{ 1, 100, 1, fl::clock_t::now() } ) );
	REQUIRE( 0u == registry.size() );
	REQUIRE( !registry.complete_pending( 1, 100 ) );
}

TEST_CASE("concurrent inserts keep names and urls distinct") {
	fl::registry_t registry{ 1h };

	std::vector< std::thread > threads;
	for( unsigned t = 0u; t != 4u; ++t )
	{
		threads.emplace_back( [&registry, t] {
			for( unsigned i = 0u; i != 50u; ++i )
			{
				try
				{
					// Every thread tries the same names.
					registry.insert( make_entry(
							t * 1000u + i + 1u,
							"name-" + std::to_string( i ),
							"http://a/" + std::to_string( i ) ) );
				}
				catch( const filtersync::duplicate_error_t & ) {}
			}
		} );
	}
	for( auto & th : threads )
		th.join();

	const auto entries = registry.snapshot();
	REQUIRE( 50u == entries.size() );

	std::set< std::string > names;
	std::set< std::string > urls;
	for( const auto & e : entries )
	{
		names.insert( e.m_name );
		urls.insert( e.m_url );
	}
	REQUIRE( 50u == names.size() );
	REQUIRE( 50u == urls.size() );
}
