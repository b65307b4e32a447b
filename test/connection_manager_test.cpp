/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "test_helpers.hpp"

#include "errors.hpp"

#include <catch2/catch.hpp>

#include <string>

TEST_CASE("The connection is opened lazily", "[connection_manager]")
{
	Test_host host;
	CHECK_FALSE(host.connection.is_connected());
	CHECK(host.client->open_count() == 0);
	host.controller.list();
	CHECK(host.connection.is_connected());
	host.controller.list();
	CHECK(host.client->open_count() == 1);
	CHECK(host.connection.get_uri() == "dummy:///");
	host.connection.disconnect();
	host.connection.disconnect();
	CHECK_FALSE(host.connection.is_connected());
}

TEST_CASE("Unknown vms are not found", "[connection_manager]")
{
	Test_host host;
	CHECK_FALSE(host.connection.find(Vm_id::by_name("ghost")).is_initialized());
	try {
		host.connection.lookup(Vm_id::by_uuid("00000000-0000-0000-0000-000000000000"));
		FAIL("Lookup of an unknown vm succeeded.");
	} catch (const Not_found_error &e) {
		CHECK(e.kind() == "not-found");
		CHECK(std::string(e.what()).find("00000000-0000-0000-0000-000000000000") != std::string::npos);
	}
}

TEST_CASE("Malformed uuids are rejected without asking the hypervisor", "[connection_manager]")
{
	Test_host host;
	try {
		host.connection.find(Vm_id::by_uuid("not-a-uuid"));
		FAIL("Lookup of a malformed uuid succeeded.");
	} catch (const Validation_error &e) {
		CHECK(e.kind() == "validation");
		CHECK(contains(e.get_result().errors, "Invalid UUID format: 'not-a-uuid'"));
	}
	CHECK_THROWS_AS(host.controller.start(Vm_id::by_uuid("5a8c5b1e-21e2-4f4b-9d2e")), Validation_error);
	CHECK(host.client->call_count("lookup_by_uuid") == 0);

	CHECK_FALSE(host.connection.find(Vm_id::by_uuid("5A8C5B1E-21E2-4F4B-9D2E-6B0CFB5E6A10")).is_initialized());
	CHECK(host.client->call_count("lookup_by_uuid") == 1);
}

TEST_CASE("An unreachable hypervisor is reconnected once it is back", "[connection_manager]")
{
	Test_host host;
	host.controller.list();
	host.client->set_reachable(false);
	CHECK_THROWS_AS(host.controller.list(), Connection_error);
	CHECK_FALSE(host.connection.is_connected());
	host.client->set_reachable(true);
	CHECK_NOTHROW(host.controller.list());
	CHECK(host.client->open_count() == 2);
}

TEST_CASE("A connection failure during a call drops the handle", "[connection_manager]")
{
	Test_host host;
	host.controller.create(make_test_spec("web-1"));
	host.client->fail_next("create", Hypervisor_error::Category::connection);
	try {
		host.controller.start(Vm_id::by_name("web-1"));
		FAIL("Start with a broken connection succeeded.");
	} catch (const Connection_error &e) {
		CHECK(e.kind() == "connection");
		CHECK(std::string(e.what()).find("Lost connection to hypervisor during start of VM 'web-1'") == 0);
	}
	CHECK_FALSE(host.connection.is_connected());
	CHECK(host.controller.start(Vm_id::by_name("web-1")).status == "started");
	CHECK(host.client->open_count() == 2);
}

TEST_CASE("Hypervisor failures become operation errors", "[connection_manager]")
{
	Test_host host;
	host.controller.create(make_test_spec("web-1"));
	host.client->fail_next("create");
	try {
		host.controller.start(Vm_id::by_name("web-1"));
		FAIL("Start with an injected failure succeeded.");
	} catch (const Operation_error &e) {
		CHECK(e.get_operation() == "start");
		CHECK(e.get_vm_name() == "web-1");
		CHECK(std::string(e.what()) == "Failed to start VM 'web-1': Injected failure of create");
	}
	CHECK(host.connection.is_connected());
	CHECK(host.domain("web-1").state == Vm_state::stopped);
}

TEST_CASE("Failures of host operations", "[connection_manager]")
{
	Test_host host;
	host.client->fail_next("get_node_info");
	CHECK_THROWS_AS(host.accountant.host_capacity(), Engine_error);
	CHECK(host.connection.is_connected());
}

TEST_CASE("Stale connections are checked before use", "[connection_manager]")
{
	auto client = new Dummy_client(make_test_node());
	Connection_manager connection(std::unique_ptr<Hypervisor_client>(client), "dummy:///", std::chrono::seconds(0));
	connection.find(Vm_id::by_name("a"));
	CHECK(client->call_count("get_hostname") == 0);
	connection.find(Vm_id::by_name("a"));
	CHECK(client->call_count("get_hostname") == 1);
	client->fail_next("get_hostname", Hypervisor_error::Category::connection);
	CHECK_NOTHROW(connection.find(Vm_id::by_name("a")));
	CHECK(client->open_count() == 2);
}

TEST_CASE("Health check reports instead of throwing", "[connection_manager]")
{
	Test_host host;
	host.controller.create(make_test_spec("web-1"));
	host.controller.create(make_test_spec("web-2"));
	host.controller.start(Vm_id::by_name("web-1"));

	auto health = host.connection.health_check();
	CHECK(health.healthy);
	CHECK(health.hostname == "dummy-host");
	CHECK(health.uri == "dummy:///");
	CHECK(health.total_domains == 2);
	CHECK(health.active_domains == 1);
	CHECK(health.error.empty());

	host.client->set_reachable(false);
	health = host.connection.health_check();
	CHECK_FALSE(health.healthy);
	CHECK_FALSE(health.error.empty());
	CHECK_FALSE(health.timestamp.empty());
}

TEST_CASE("Lifecycle subscription survives reconnects", "[connection_manager]")
{
	Test_host host;
	std::vector<std::string> types;
	host.connection.subscribe_lifecycle_events([&types](const Lifecycle_event &event) {types.push_back(event.type);});
	host.controller.create(make_test_spec("web-1"));
	host.client->set_reachable(false);
	CHECK_THROWS_AS(host.controller.list(), Connection_error);
	host.client->set_reachable(true);
	host.controller.start(Vm_id::by_name("web-1"));
	CHECK(host.client->call_count("register_lifecycle_callback") == 2);
	REQUIRE(types.size() == 2);
	CHECK(types[0] == "defined");
	CHECK(types[1] == "started");

	host.connection.unsubscribe_lifecycle_events();
	host.controller.stop(Vm_id::by_name("web-1"), true);
	CHECK(types.size() == 2);
}
