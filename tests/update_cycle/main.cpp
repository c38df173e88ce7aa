#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN 
#include <doctest/doctest.h>

#include <filtersync/updater/update_cycle.hpp>

#include <filtersync/filter_list/rule_counter.hpp>

#include <tests/fakes/pub.hpp>

using namespace std::chrono_literals;

namespace fl = filtersync::filter_list;
namespace upd = filtersync::updater;

namespace
{

struct test_env_t
{
	fakes::temp_dir_t m_dir;
	fakes::scripted_http_client_t m_client;
	fakes::recording_consumer_t m_consumer;
	fl::storage_t m_storage{ m_dir.path() };
	fl::registry_t m_registry{ 1h };
	fl::id_source_t m_ids;
	fl::downloader_t m_downloader{ m_client, m_storage };
	upd::commit_manager_t m_committer{ m_registry, m_storage, m_consumer };
	upd::update_cycle_t m_cycle{
			m_registry, m_downloader, m_ids, m_committer };

	//! Add an entry with existing canonical file.
	void
	seed(
		fl::filter_id_t id,
		const std::string & url,
		const std::string & content,
		bool enabled = true )
	{
		m_storage.write( id, content );
		m_ids.observe( id );

		fl::filter_entry_t e;
		e.m_id = id;
		e.m_enabled = enabled;
		e.m_name = "name-of-" + url;
		e.m_url = url;
		e.m_rule_count = fl::count_rules( content );
		m_registry.insert( e );
	}

	[[nodiscard]]
	fl::filter_entry_t
	entry( const std::string & url ) const
	{
		const auto r = m_registry.find( url );
		if( !r )
			throw std::runtime_error( "no entry for " + url );
		return *r;
	}

	//! Perform steps until the end of the cycle.
	std::vector< upd::step_result_t >
	run_cycle( fl::time_point_t now = fl::clock_t::now() )
	{
		std::vector< upd::step_result_t > results;
		do
		{
			results.push_back( m_cycle.step( now ) );
		}
		while( !upd::is_cycle_finished( results.back() ) );

		return results;
	}
};

using events_t = std::vector< std::string >;

const events_t one_batch{ "close", "restart" };

} /* namespace anonymous */

TEST_CASE("nothing due and nothing pending") {
	test_env_t env;
	env.seed( 10, "http://a/1", "old" );
	// The entry isn't due.
	(void)env.m_registry.select_due( fl::clock_t::now() );

	REQUIRE( std::vector{ upd::step_result_t::idle } == env.run_cycle() );
	REQUIRE( env.m_client.requests().empty() );
	REQUIRE( env.m_consumer.events().empty() );
}

TEST_CASE("commit without pending updates does nothing") {
	test_env_t env;
	env.seed( 10, "http://a/1", "old" );

	const auto result = env.m_committer.commit();
	REQUIRE( result.is_noop() );
	REQUIRE( 0u == result.m_promoted );
	REQUIRE( 0u == result.m_failed );

	// The consumer isn't paused and resumed.
	REQUIRE( env.m_consumer.events().empty() );
	REQUIRE( "old" == env.m_storage.load( 10 ) );
}

TEST_CASE("two due entries are refreshed one by one and committed once") {
	test_env_t env;
	env.seed( 10, "http://a/1", "old1\n" );
	env.seed( 20, "http://a/2", "old2\n" );
	env.m_client.respond( "http://a/1", 200u, "new1\nrule\n" );
	env.m_client.respond( "http://a/2", 200u, "new2\n# c\n" );

	// Canonical files aren't changed until the consumer is closed.
	events_t contents_on_close;
	env.m_consumer.on_close( [&] {
			contents_on_close.push_back( env.m_storage.load( 10 ) );
			contents_on_close.push_back( env.m_storage.load( 20 ) );
		} );

	const auto results = env.run_cycle();
	REQUIRE( std::vector{
			upd::step_result_t::refreshed,
			upd::step_result_t::refreshed,
			upd::step_result_t::committed } == results );

	REQUIRE( events_t{ "old1\n", "old2\n" } == contents_on_close );
	REQUIRE( one_batch == env.m_consumer.events() );

	REQUIRE( events_t{ "http://a/1", "http://a/2" } == env.m_client.requests() );
	REQUIRE( 1u == env.m_client.max_in_flight() );

	REQUIRE( "new1\nrule\n" == env.m_storage.load( 10 ) );
	REQUIRE( "new2\n# c\n" == env.m_storage.load( 20 ) );

	const auto first = env.entry( "http://a/1" );
	REQUIRE( !first.has_pending_update() );
	REQUIRE( 2u == first.m_rule_count );
	REQUIRE( 10u == first.m_id );

	const auto second = env.entry( "http://a/2" );
	REQUIRE( !second.has_pending_update() );
	REQUIRE( 1u == second.m_rule_count );

	// Only canonical files remain.
	std::size_t files = 0u;
	for( const auto & f : std::filesystem::directory_iterator{ env.m_dir.path() } )
	{
		(void)f;
		++files;
	}
	REQUIRE( 2u == files );

	REQUIRE( !env.m_cycle.dirty() );
}

TEST_CASE("metadata is visible before the commit") {
	test_env_t env;
	env.seed( 10, "http://a/1", "old\n" );
	env.m_client.respond( "http://a/1", 200u, "a\nb\nc\n" );

	const auto now = fl::clock_t::now();
	REQUIRE( upd::step_result_t::refreshed == env.m_cycle.step( now ) );

	const auto e = env.entry( "http://a/1" );
	REQUIRE( e.has_pending_update() );
	REQUIRE( 10u != e.m_pending_id );
	REQUIRE( 3u == e.m_rule_count );
	REQUIRE( now <= e.m_last_updated );
	REQUIRE( now + 1h == e.m_next_update );
	REQUIRE( env.m_cycle.dirty() );

	// The new content is in the staged file, the canonical one is intact.
	REQUIRE( "a\nb\nc\n" == env.m_storage.load( e.m_pending_id ) );
	REQUIRE( "old\n" == env.m_storage.load( 10 ) );
	REQUIRE( env.m_consumer.events().empty() );
}

TEST_CASE("failed download") {
	test_env_t env;
	env.seed( 10, "http://a/1", "old\n" );
	env.m_client.respond( "http://a/1", 500u, "oops" );

	const auto before = env.entry( "http://a/1" );
	const auto now = fl::clock_t::now();

	REQUIRE( std::vector{
			upd::step_result_t::refresh_failed,
			upd::step_result_t::idle } == env.run_cycle( now ) );

	const auto after = env.entry( "http://a/1" );
	// Only the reservation is changed.
	REQUIRE( now + 1h == after.m_next_update );
	REQUIRE( before.m_rule_count == after.m_rule_count );
	REQUIRE( before.m_last_updated == after.m_last_updated );
	REQUIRE( !after.has_pending_update() );

	REQUIRE( "old\n" == env.m_storage.load( 10 ) );
	REQUIRE( env.m_consumer.events().empty() );

	// It isn't retried before the next period.
	REQUIRE( std::vector{ upd::step_result_t::idle } ==
			env.run_cycle( now + 59min ) );
	REQUIRE( 1u == env.m_client.requests().size() );
}

TEST_CASE("failure of one entry doesn't affect others") {
	test_env_t env;
	env.seed( 10, "http://a/1", "old1" );
	env.seed( 20, "http://a/2", "old2" );
	env.m_client.respond( "http://a/2", 200u, "new2" );

	REQUIRE( std::vector{
			upd::step_result_t::refresh_failed,
			upd::step_result_t::refreshed,
			upd::step_result_t::committed } == env.run_cycle() );

	REQUIRE( "old1" == env.m_storage.load( 10 ) );
	REQUIRE( "new2" == env.m_storage.load( 20 ) );
	REQUIRE( one_batch == env.m_consumer.events() );
}

TEST_CASE("failed rename is retried at the next commit") {
	test_env_t env;
	env.seed( 10, "http://a/1", "old1" );
	env.seed( 20, "http://a/2", "old2" );
	env.m_client.respond( "http://a/1", 200u, "new1" );
	env.m_client.respond( "http://a/2", 200u, "new2" );

	// The staged file of the second entry disappears.
	fl::filter_id_t lost_staged_id{};
	env.m_consumer.on_close( [&] {
			lost_staged_id = env.entry( "http://a/2" ).m_pending_id;
			env.m_storage.discard( lost_staged_id );
		} );

	const auto now = fl::clock_t::now();
	REQUIRE( upd::step_result_t::committed == env.run_cycle( now ).back() );

	REQUIRE( one_batch == env.m_consumer.events() );

	REQUIRE( "new1" == env.m_storage.load( 10 ) );
	REQUIRE( !env.entry( "http://a/1" ).has_pending_update() );

	REQUIRE( "old2" == env.m_storage.load( 20 ) );
	REQUIRE( lost_staged_id == env.entry( "http://a/2" ).m_pending_id );
	REQUIRE( env.m_cycle.dirty() );

	// The staged file appears again and the next commit window
	// promotes it.
	env.m_consumer.on_close( {} );
	env.m_storage.write( lost_staged_id, "new2" );

	REQUIRE( std::vector{ upd::step_result_t::committed } ==
			env.run_cycle( now + 1min ) );

	REQUIRE( "new2" == env.m_storage.load( 20 ) );
	REQUIRE( !env.entry( "http://a/2" ).has_pending_update() );
	REQUIRE( !env.m_cycle.dirty() );
	REQUIRE( events_t{ "close", "restart", "close", "restart" } ==
			env.m_consumer.events() );
}

TEST_CASE("commit without an installed logger") {
	test_env_t env;
	env.seed( 10, "http://a/1", "old1" );
	env.seed( 20, "http://a/2", "old2" );
	env.m_client.respond( "http://a/1", 200u, "new1" );
	env.m_client.respond( "http://a/2", 200u, "new2" );

	const auto now = fl::clock_t::now();
	REQUIRE( upd::step_result_t::refreshed == env.m_cycle.step( now ) );
	REQUIRE( upd::step_result_t::refreshed == env.m_cycle.step( now ) );

	env.m_storage.discard( env.entry( "http://a/2" ).m_pending_id );

	filtersync::logging::impl::remove_logger();
	upd::commit_result_t result;
	REQUIRE_NOTHROW( result = env.m_committer.commit() );

	bool logging_action_called{ false };
	filtersync::logging::direct_mode::critical(
			[&]( auto &, auto ) { logging_action_called = true; } );

	filtersync::logging::impl::setup_logger( fakes::make_null_logger() );

	REQUIRE( !logging_action_called );
	REQUIRE( 1u == result.m_promoted );
	REQUIRE( 1u == result.m_failed );
	REQUIRE( one_batch == env.m_consumer.events() );
	REQUIRE( "new1" == env.m_storage.load( 10 ) );
	REQUIRE( "old2" == env.m_storage.load( 20 ) );
}

TEST_CASE("consumer failures don't stop the commit") {
	test_env_t env;
	env.seed( 10, "http://a/1", "old" );
	env.m_client.respond( "http://a/1", 200u, "new" );
	env.m_consumer.fail_close( true );
	env.m_consumer.fail_restart( true );

	REQUIRE( upd::step_result_t::committed == env.run_cycle().back() );

	REQUIRE( one_batch == env.m_consumer.events() );
	REQUIRE( "new" == env.m_storage.load( 10 ) );
	REQUIRE( !env.entry( "http://a/1" ).has_pending_update() );
}

TEST_CASE("entry removed during the refresh") {
	test_env_t env;
	env.seed( 10, "http://a/1", "old" );
	env.m_client.respond( "http://a/1", 200u, "new" );

	env.m_client.on_request( [&]( const std::string & url ) {
			(void)env.m_registry.remove( url );
		} );

	REQUIRE( std::vector{
			upd::step_result_t::refresh_failed,
			upd::step_result_t::idle } == env.run_cycle() );

	REQUIRE( 0u == env.m_registry.size() );
	REQUIRE( env.m_consumer.events().empty() );
	REQUIRE( "old" == env.m_storage.load( 10 ) );
}

TEST_CASE("disabled entries are skipped") {
	test_env_t env;
	env.seed( 10, "http://a/1", "old", false );
	env.m_client.respond( "http://a/1", 200u, "new" );

	REQUIRE( std::vector{ upd::step_result_t::idle } == env.run_cycle() );
	REQUIRE( env.m_client.requests().empty() );
}
