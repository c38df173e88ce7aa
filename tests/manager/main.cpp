#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN 
#include <doctest/doctest.h>

#include <filtersync/filter_list/manager.hpp>

#include <filtersync/exception.hpp>

#include <tests/fakes/pub.hpp>

#include <thread>

using namespace std::chrono_literals;

namespace fl = filtersync::filter_list;

namespace
{

struct test_env_t
{
	fakes::temp_dir_t m_dir;
	fakes::scripted_http_client_t m_client;
	fl::storage_t m_storage{ m_dir.path() };
	fl::registry_t m_registry{ 24h };
	fl::id_source_t m_ids;
	fl::downloader_t m_downloader{ m_client, m_storage };
	fl::manager_t m_manager{ m_registry, m_storage, m_downloader, m_ids };

	[[nodiscard]]
	bool
	dir_is_empty() const
	{
		return std::filesystem::is_empty( m_dir.path() );
	}
};

} /* namespace anonymous */

TEST_CASE("successful add") {
	test_env_t env;
	env.m_client.respond( "http://a/1", 200u, "# title\nrule1\nrule2\n" );

	const auto before = fl::clock_t::now();

	fl::filter_entry_t added;
	REQUIRE_NOTHROW( added = env.m_manager.add( { "first", "http://a/1" } ) );

	REQUIRE( 0u != added.m_id );
	REQUIRE( added.m_enabled );
	REQUIRE( "first" == added.m_name );
	REQUIRE( "http://a/1" == added.m_url );
	REQUIRE( 2u == added.m_rule_count );
	REQUIRE( !added.has_pending_update() );
	REQUIRE( before <= added.m_last_updated );
	REQUIRE( added.m_last_updated + 24h == added.m_next_update );

	// The content is in the canonical file.
	REQUIRE( "# title\nrule1\nrule2\n" == env.m_storage.load( added.m_id ) );

	REQUIRE( 1u == env.m_registry.size() );
	REQUIRE( added == *env.m_registry.find( "http://a/1" ) );
}

TEST_CASE("ids of added filters are distinct") {
	test_env_t env;
	env.m_client.respond( "http://a/1", 200u, "a" );
	env.m_client.respond( "http://a/2", 200u, "b" );

	const auto first = env.m_manager.add( { "first", "http://a/1" } );
	const auto second = env.m_manager.add( { "second", "http://a/2" } );

	REQUIRE( first.m_id != second.m_id );
	REQUIRE( "a" == env.m_storage.load( first.m_id ) );
	REQUIRE( "b" == env.m_storage.load( second.m_id ) );
}

TEST_CASE("add with duplicate name or url") {
	test_env_t env;
	env.m_client.respond( "http://a/1", 200u, "a" );
	env.m_client.respond( "http://a/2", 200u, "b" );

	(void)env.m_manager.add( { "first", "http://a/1" } );
	const auto before = env.m_registry.snapshot();

	REQUIRE_THROWS_AS( ( env.m_manager.add( { "first", "http://a/2" } ) ),
			filtersync::duplicate_error_t );
	REQUIRE_THROWS_AS( ( env.m_manager.add( { "second", "http://a/1" } ) ),
			filtersync::duplicate_error_t );

	// Nothing is downloaded for duplicates.
	REQUIRE( 1u == env.m_client.requests().size() );
	REQUIRE( before == env.m_registry.snapshot() );
}

TEST_CASE("add of url that returns 404") {
	test_env_t env;
	env.m_client.respond( "http://a/1", 404u, "Not Found" );

	REQUIRE_THROWS_AS( ( env.m_manager.add( { "first", "http://a/1" } ) ),
			filtersync::protocol_error_t );

	REQUIRE( 0u == env.m_registry.size() );
	REQUIRE( env.dir_is_empty() );
}

TEST_CASE("add of unreachable url") {
	test_env_t env;

	REQUIRE_THROWS_AS( ( env.m_manager.add( { "first", "http://a/1" } ) ),
			filtersync::network_error_t );

	REQUIRE( 0u == env.m_registry.size() );
	REQUIRE( env.dir_is_empty() );
}

TEST_CASE("add when the directory is unusable") {
	fakes::temp_dir_t dir;
	fakes::scripted_http_client_t client;
	client.respond( "http://a/1", 200u, "a" );

	fl::storage_t storage{ dir.path() / "absent" };
	fl::registry_t registry{ 24h };
	fl::id_source_t ids;
	fl::downloader_t downloader{ client, storage };
	fl::manager_t manager{ registry, storage, downloader, ids };

	REQUIRE_THROWS_AS( ( manager.add( { "first", "http://a/1" } ) ),
			filtersync::io_error_t );
	REQUIRE( 0u == registry.size() );
}

TEST_CASE("same url added during the download") {
	test_env_t env;
	env.m_client.respond( "http://a/1", 200u, "a" );

	env.m_client.on_request( [&env]( const std::string & ) {
			fl::filter_entry_t other;
			other.m_id = 1u;
			other.m_name = "other";
			other.m_url = "http://a/1";
			env.m_registry.insert( other );
		} );

	REQUIRE_THROWS_AS( ( env.m_manager.add( { "first", "http://a/1" } ) ),
			filtersync::duplicate_error_t );

	REQUIRE( 1u == env.m_registry.size() );
	REQUIRE( "other" == env.m_registry.find( "http://a/1" )->m_name );
	// The downloaded file is removed.
	REQUIRE( env.dir_is_empty() );
}

TEST_CASE("concurrent adds are downloaded one by one") {
	test_env_t env;
	for( int i = 0; i != 4; ++i )
		env.m_client.respond( "http://a/" + std::to_string(i), 200u, "rule" );

	env.m_client.on_request( []( const std::string & ) {
			std::this_thread::sleep_for( 20ms );
		} );

	std::vector< std::thread > threads;
	for( int i = 0; i != 4; ++i )
		threads.emplace_back( [&env, i] {
				(void)env.m_manager.add( {
						"name-" + std::to_string(i),
						"http://a/" + std::to_string(i) } );
			} );
	for( auto & t : threads )
		t.join();

	REQUIRE( 4u == env.m_registry.size() );
	REQUIRE( 1u == env.m_client.max_in_flight() );
}

TEST_CASE("remove") {
	test_env_t env;
	env.m_client.respond( "http://a/1", 200u, "a" );

	const auto added = env.m_manager.add( { "first", "http://a/1" } );

	REQUIRE( !env.m_manager.remove( "http://a/2" ) );
	REQUIRE( 1u == env.m_registry.size() );

	const auto removed = env.m_manager.remove( "http://a/1" );
	REQUIRE( removed );
	REQUIRE( added == *removed );
	REQUIRE( 0u == env.m_registry.size() );

	// The file isn't touched.
	REQUIRE( std::filesystem::exists( env.m_storage.path_for( added.m_id ) ) );
}

TEST_CASE("restore from existing file") {
	test_env_t env;
	env.m_storage.write( 1000, "rule1\n# c\nrule2\nrule3\n" );
	const auto mtime = env.m_storage.last_write_time( 1000 );

	fl::filter_entry_t configured;
	configured.m_id = 1000;
	configured.m_enabled = false;
	configured.m_name = "first";
	configured.m_url = "http://a/1";

	REQUIRE_NOTHROW( env.m_manager.restore( configured ) );

	const auto restored = env.m_registry.find( "http://a/1" );
	REQUIRE( restored );
	REQUIRE( 1000u == restored->m_id );
	REQUIRE( !restored->m_enabled );
	REQUIRE( 3u == restored->m_rule_count );
	REQUIRE( mtime == restored->m_last_updated );
	REQUIRE( mtime + 24h == restored->m_next_update );
	REQUIRE( !restored->has_pending_update() );

	// New ids are greater than restored ones.
	REQUIRE( 1000u < env.m_ids.next( fl::time_point_t{} ) );
}

TEST_CASE("restore without file") {
	test_env_t env;

	fl::filter_entry_t configured;
	configured.m_id = 1000;
	configured.m_name = "first";
	configured.m_url = "http://a/1";

	REQUIRE_NOTHROW( env.m_manager.restore( configured ) );

	const auto restored = env.m_registry.find( "http://a/1" );
	REQUIRE( restored );
	REQUIRE( 0u == restored->m_rule_count );
	// It's due immediately.
	REQUIRE( env.m_registry.select_due( fl::clock_t::now() ) );
}
