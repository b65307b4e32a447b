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

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

// Calls changing the run state, in order.
static std::vector<std::string> run_state_calls(const Dummy_client &client)
{
	std::vector<std::string> calls;
	for (const auto &call : client.call_history()) {
		if (call == "create" || call == "shutdown" || call == "destroy")
			calls.push_back(call);
	}
	return calls;
}

static long long elapsed_ms(std::chrono::steady_clock::time_point begin)
{
	return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - begin).count();
}

TEST_CASE("Create defines a stopped vm with fresh disks", "[lifecycle]")
{
	Test_host host;
	auto spec = make_test_spec("web-1");
	spec.uuid = "5a8c5b1e-21e2-4f4b-9d2e-6b0cfb5e6a10";
	auto result = host.controller.create(spec);
	CHECK(result.status == "created");
	CHECK(result.operation == "create");
	CHECK(result.name == "web-1");
	CHECK(result.uuid == spec.uuid);
	CHECK(result.details["vcpus"].as<unsigned int>() == 2);
	CHECK(result.details["memory-mb"].as<unsigned long long>() == 2048);

	auto info = host.domain("web-1");
	CHECK(info.state == Vm_state::stopped);
	CHECK(info.uuid == spec.uuid);
	CHECK(host.storage.exists("/images/web-1-root.qcow2"));

	REQUIRE(host.events.of_type("vm_created").size() == 1);
	auto changes = host.events.of_type("vm_status_changed");
	REQUIRE(changes.size() == 1);
	CHECK(changes.front().data["old-state"].as<std::string>() == "undefined");
	CHECK(changes.front().data["new-state"].as<std::string>() == "stopped");
}

TEST_CASE("Create generates a uuid if none is given", "[lifecycle]")
{
	Test_host host;
	auto result = host.controller.create(make_test_spec("web-1"));
	CHECK(result.uuid.size() == 36);
	CHECK(host.domain("web-1").uuid == result.uuid);
}

TEST_CASE("Creating an existing vm fails without side effects", "[lifecycle]")
{
	Test_host host;
	host.controller.create(make_test_spec("web-1"));
	try {
		host.controller.create(make_test_spec("web-1"));
		FAIL("Second create succeeded.");
	} catch (const Operation_error &e) {
		CHECK(std::string(e.what()).find("VM already exists") != std::string::npos);
		CHECK(e.kind() == "operation");
	}
	CHECK(host.client->call_count("define_xml") == 1);
	CHECK(host.storage.images().size() == 1);
}

TEST_CASE("An invalid spec touches nothing", "[lifecycle]")
{
	Test_host host;
	auto before = host.accountant.allocated();
	CHECK_THROWS_AS(host.controller.create(make_test_spec("tiny", 2, 100)), Validation_error);
	CHECK(host.client->call_count("define_xml") == 0);
	CHECK(host.storage.images().empty());
	auto after = host.accountant.allocated();
	CHECK(after.vcpus == before.vcpus);
	CHECK(after.memory_kb == before.memory_kb);
	CHECK(host.events.get_events().empty());
}

TEST_CASE("Exhausted resources are reported as allocation error", "[lifecycle]")
{
	Test_host host;
	host.controller.create(make_test_spec("big-1", 2, 10000));
	try {
		host.controller.create(make_test_spec("big-2", 2, 10000));
		FAIL("Create beyond the host memory succeeded.");
	} catch (const Resource_allocation_error &e) {
		CHECK(e.kind() == "resource-allocation");
		CHECK(e.get_result().insufficient_resources);
	}
	CHECK_FALSE(host.connection.find(Vm_id::by_name("big-2")).is_initialized());
}

TEST_CASE("Disk images are rolled back if defining fails", "[lifecycle]")
{
	Test_host host;
	auto spec = make_test_spec("web-1");
	Disk_config data;
	data.name = "data";
	data.size_gb = 50;
	spec.disks.push_back(data);
	host.client->fail_next("define_xml");
	CHECK_THROWS_AS(host.controller.create(spec), Operation_error);
	CHECK(host.storage.images().empty());
	CHECK_FALSE(host.connection.find(Vm_id::by_name("web-1")).is_initialized());
}

TEST_CASE("A failing disk aborts create", "[lifecycle]")
{
	Test_host host;
	host.storage.fail_on("/images/web-1-root.qcow2");
	try {
		host.controller.create(make_test_spec("web-1"));
		FAIL("Create with failing storage succeeded.");
	} catch (const Operation_error &e) {
		CHECK(e.get_operation() == "create");
		CHECK(e.get_vm_name() == "web-1");
	}
	CHECK(host.client->call_count("define_xml") == 0);
}

TEST_CASE("Start is idempotent", "[lifecycle]")
{
	Test_host host;
	host.controller.create(make_test_spec("web-1"));
	CHECK(host.controller.start(Vm_id::by_name("web-1")).status == "started");
	CHECK(host.domain("web-1").state == Vm_state::running);
	CHECK(host.controller.start(Vm_id::by_name("web-1")).status == "already_running");
	CHECK(host.client->call_count("create") == 1);
}

TEST_CASE("Start requires a stopped vm", "[lifecycle]")
{
	Test_host host;
	host.controller.create(make_test_spec("web-1"));
	host.controller.start(Vm_id::by_name("web-1"));
	host.controller.pause(Vm_id::by_name("web-1"));
	try {
		host.controller.start(Vm_id::by_name("web-1"));
		FAIL("Start of a paused vm succeeded.");
	} catch (const State_error &e) {
		CHECK(e.get_current() == Vm_state::paused);
		CHECK(e.get_required() == Vm_state::stopped);
	}
}

TEST_CASE("Stop reports what it did", "[lifecycle]")
{
	Test_host host;
	host.controller.create(make_test_spec("web-1"));
	auto id = Vm_id::by_name("web-1");
	CHECK(host.controller.stop(id, false).status == "already_stopped");
	CHECK(host.client->call_count("shutdown") == 0);
	CHECK(host.client->call_count("destroy") == 0);

	SECTION("graceful shutdown") {
		host.controller.start(id);
		CHECK(host.controller.stop(id, false).status == "shutdown");
		CHECK(host.domain("web-1").state == Vm_state::stopped);
	}
	SECTION("guest ignoring the shutdown") {
		host.client->set_shutdown_delay(0);
		host.controller.start(id);
		CHECK(host.controller.stop(id, false).status == "shutdown");
		CHECK(host.domain("web-1").state == Vm_state::stopping);
		CHECK(host.controller.stop(id, false).status == "already_stopping");
		CHECK(host.controller.stop(id, true).status == "destroyed");
		CHECK(host.domain("web-1").state == Vm_state::stopped);
	}
	SECTION("forced") {
		host.controller.start(id);
		CHECK(host.controller.stop(id, true).status == "destroyed");
		CHECK(host.client->call_count("shutdown") == 0);
	}
}

TEST_CASE("Restart waits for the shutdown", "[lifecycle]")
{
	Test_host host;
	host.controller.create(make_test_spec("web-1"));
	auto id = Vm_id::by_name("web-1");
	host.controller.start(id);

	SECTION("guest shuts down") {
		host.client->set_shutdown_delay(3);
		auto result = host.controller.restart(id, false);
		CHECK(result.status == "restarted");
		CHECK_FALSE(result.details["destroyed-after-timeout"].as<bool>());
		CHECK(host.client->call_count("destroy") == 0);
	}
	SECTION("guest ignores the shutdown") {
		host.client->set_shutdown_delay(0);
		auto result = host.controller.restart(id, false);
		CHECK(result.status == "restarted");
		CHECK(result.details["destroyed-after-timeout"].as<bool>());
		CHECK(host.client->call_count("destroy") == 1);
	}
	SECTION("forced") {
		auto result = host.controller.restart(id, true);
		CHECK(result.status == "restarted");
		CHECK(host.client->call_count("shutdown") == 0);
	}
	CHECK(host.domain("web-1").state == Vm_state::running);
	CHECK(host.client->call_count("create") == 2);
}

TEST_CASE("Restart of a paused vm does not wait for a shutdown", "[lifecycle]")
{
	Test_host host;
	host.controller.create(make_test_spec("web-1"));
	auto id = Vm_id::by_name("web-1");
	host.controller.start(id);
	host.controller.pause(id);

	auto begin = std::chrono::steady_clock::now();
	auto result = host.controller.restart(id, false);
	CHECK(elapsed_ms(begin) < 500);
	CHECK(result.status == "restarted");
	CHECK_FALSE(result.details["destroyed-after-timeout"].as<bool>());
	CHECK(host.client->call_count("shutdown") == 0);
	CHECK(host.client->call_count("destroy") == 1);
	CHECK(host.domain("web-1").state == Vm_state::running);
}

TEST_CASE("Operations on one vm never interleave", "[lifecycle][concurrency]")
{
	Test_host host;
	host.controller.create(make_test_spec("web-1"));
	auto id = Vm_id::by_name("web-1");
	host.controller.start(id);
	host.client->set_shutdown_delay(5);

	SECTION("two restarts") {
		auto restart = [&host, &id]
		{
			return host.controller.restart(id, false).status;
		};
		auto first = std::async(std::launch::async, restart);
		auto second = std::async(std::launch::async, restart);
		CHECK(first.get() == "restarted");
		CHECK(second.get() == "restarted");
		CHECK(run_state_calls(*host.client) == (std::vector<std::string>{"create", "shutdown", "create", "shutdown", "create"}));
		CHECK(host.domain("web-1").state == Vm_state::running);
	}
	SECTION("stop against restart") {
		auto restarting = std::async(std::launch::async, [&host, &id]
		{
			return host.controller.restart(id, false).status;
		});
		auto stopped = host.controller.stop(id, true).status;
		CHECK(restarting.get() == "restarted");
		CHECK(stopped == "destroyed");
		auto calls = run_state_calls(*host.client);
		bool stop_first = calls == std::vector<std::string>{"create", "destroy", "create"};
		bool restart_first = calls == std::vector<std::string>{"create", "shutdown", "create", "destroy"};
		CHECK((stop_first || restart_first));
	}
}

TEST_CASE("Pause and resume", "[lifecycle]")
{
	Test_host host;
	host.controller.create(make_test_spec("web-1"));
	auto id = Vm_id::by_name("web-1");
	auto result = host.controller.pause(id);
	CHECK(result.status == "invalid_state");
	CHECK(result.details["reason"].as<std::string>() == "VM is stopped, pause requires running");
	CHECK(host.client->call_count("suspend") == 0);

	host.controller.start(id);
	CHECK(host.controller.pause(id).status == "paused");
	CHECK(host.domain("web-1").state == Vm_state::paused);
	CHECK(host.controller.pause(id).status == "invalid_state");
	CHECK(host.controller.resume(id).status == "resumed");
	CHECK(host.domain("web-1").state == Vm_state::running);
	CHECK(host.controller.resume(id).status == "invalid_state");
}

TEST_CASE("Delete reports failed disks and continues", "[lifecycle]")
{
	Test_host host;
	auto spec = make_test_spec("web-1");
	Disk_config data;
	data.name = "data";
	data.size_gb = 50;
	spec.disks.push_back(data);
	host.controller.create(spec);
	host.storage.fail_on("/images/web-1-data.qcow2");

	auto result = host.controller.remove(Vm_id::by_name("web-1"), true);
	CHECK(result.status == "deleted");
	REQUIRE(result.details["deleted-disks"].size() == 1);
	CHECK(result.details["deleted-disks"][0].as<std::string>() == "/images/web-1-root.qcow2");
	CHECK(result.details["failed-disks"]["/images/web-1-data.qcow2"].IsDefined());
	CHECK_FALSE(host.connection.find(Vm_id::by_name("web-1")).is_initialized());
	CHECK(host.events.of_type("vm_deleted").size() == 1);
}

TEST_CASE("Delete of a running vm destroys it first", "[lifecycle]")
{
	Test_host host;
	host.controller.create(make_test_spec("web-1"));
	host.controller.start(Vm_id::by_name("web-1"));
	auto result = host.controller.remove(Vm_id::by_name("web-1"), false);
	CHECK(result.status == "deleted");
	CHECK(result.details["deleted-disks"].size() == 0);
	CHECK(host.client->call_count("destroy") == 1);
	CHECK_FALSE(host.connection.find(Vm_id::by_name("web-1")).is_initialized());
	// Disks stay without delete_disks.
	CHECK(host.storage.exists("/images/web-1-root.qcow2"));
}

TEST_CASE("Delete of a crashed vm destroys it first", "[lifecycle]")
{
	Test_host host;
	host.controller.create(make_test_spec("web-1"));
	host.controller.start(Vm_id::by_name("web-1"));
	auto uuid = host.domain("web-1").uuid;
	host.client->set_crashed(uuid);
	REQUIRE(host.domain("web-1").state == Vm_state::error);

	auto result = host.controller.remove(Vm_id::by_name("web-1"), false);
	CHECK(result.status == "deleted");
	CHECK(host.client->call_count("destroy") == 1);
	// Undefining an active domain would have left it running as a transient one.
	CHECK_FALSE(host.client->lookup_by_uuid(uuid).is_initialized());
	CHECK(host.accountant.allocated().total_domains == 0);
}

TEST_CASE("Clone copies a stopped vm", "[lifecycle]")
{
	Test_host host;
	host.controller.create(make_test_spec("web-1", 2, 2048));
	auto source = host.domain("web-1");

	auto result = host.controller.clone(Vm_id::by_name("web-1"), "web-2", "");
	CHECK(result.status == "cloned");
	CHECK(result.name == "web-2");
	CHECK(result.uuid != source.uuid);
	CHECK(result.details["source-name"].as<std::string>() == "web-1");
	CHECK(result.details["vcpus"].as<unsigned int>() == 2);
	CHECK(host.storage.exists("/images/web-2_web-1-root.qcow2"));

	auto clone = host.domain("web-2");
	CHECK(clone.state == Vm_state::stopped);
	CHECK(clone.max_memory_kb == source.max_memory_kb);
	auto xml = host.client->get_xml_desc(clone.uuid);
	CHECK(xml.find("/images/web-2_web-1-root.qcow2") != std::string::npos);
}

TEST_CASE("Clone refuses a running source or a taken name", "[lifecycle]")
{
	Test_host host;
	host.controller.create(make_test_spec("web-1"));
	host.controller.create(make_test_spec("web-2"));
	CHECK_THROWS_AS(host.controller.clone(Vm_id::by_name("web-1"), "web-2", ""), Operation_error);
	host.controller.start(Vm_id::by_name("web-1"));
	CHECK_THROWS_AS(host.controller.clone(Vm_id::by_name("web-1"), "web-3", ""), State_error);
	CHECK_THROWS_AS(host.controller.clone(Vm_id::by_name("web-1"), "", ""), std::invalid_argument);
	CHECK(host.storage.images().size() == 2);
}

TEST_CASE("Names must not leave the storage directory", "[lifecycle]")
{
	Test_host host;
	CHECK_THROWS_AS(host.controller.create(make_test_spec("../../etc/x")), Validation_error);
	auto spec = make_test_spec("web-1");
	spec.disks.front().name = "../../root";
	CHECK_THROWS_AS(host.controller.create(spec), Validation_error);
	CHECK(host.storage.images().empty());

	host.controller.create(make_test_spec("web-1"));
	CHECK_THROWS_AS(host.controller.clone(Vm_id::by_name("web-1"), "../web-2", ""), Validation_error);
	CHECK_THROWS_AS(host.controller.clone(Vm_id::by_name("web-1"), "a/b", ""), Validation_error);
	CHECK(host.storage.images().size() == 1);
	CHECK(host.client->call_count("define_xml") == 1);
}

TEST_CASE("Resize of a stopped vm changes the maximum", "[lifecycle]")
{
	Test_host host;
	host.controller.create(make_test_spec("web-1", 2, 2048));
	auto result = host.controller.resize(Vm_id::by_name("web-1"), 4, 4096LL, false);
	CHECK(result.status == "resized");
	CHECK(result.details["changes"].size() == 3);
	auto info = host.domain("web-1");
	CHECK(info.max_vcpus == 4);
	CHECK(info.vcpus == 4);
	CHECK(info.max_memory_kb == 4096ULL * 1024);
	CHECK(info.memory_kb == 4096ULL * 1024);
	CHECK(host.accountant.allocated().vcpus == 4);
}

TEST_CASE("Resize of a running vm", "[lifecycle]")
{
	Test_host host;
	host.controller.create(make_test_spec("web-1", 4, 4096));
	auto id = Vm_id::by_name("web-1");
	host.controller.start(id);

	CHECK_THROWS_AS(host.controller.resize(id, boost::none, 2048LL, false), State_error);
	CHECK_THROWS_AS(host.controller.resize(id, 8, boost::none, true), Operation_error);

	auto result = host.controller.resize(id, 2, 2048LL, true);
	CHECK(result.status == "resized");
	auto info = host.domain("web-1");
	CHECK(info.vcpus == 2);
	CHECK(info.memory_kb == 2048ULL * 1024);
	// The maximum and thus the allocation are unchanged.
	CHECK(info.max_vcpus == 4);
	CHECK(info.max_memory_kb == 4096ULL * 1024);
}

TEST_CASE("Resize validates its arguments", "[lifecycle]")
{
	Test_host host;
	host.controller.create(make_test_spec("web-1"));
	auto id = Vm_id::by_name("web-1");
	CHECK_THROWS_AS(host.controller.resize(id, boost::none, boost::none, false), std::invalid_argument);
	CHECK_THROWS_AS(host.controller.resize(id, 64, boost::none, false), Validation_error);
	CHECK_THROWS_AS(host.controller.resize(id, boost::none, 256LL, false), Validation_error);
	CHECK_THROWS_AS(host.controller.resize(id, boost::none, 60000LL, false), Resource_allocation_error);
}

TEST_CASE("Runtime limits are applied", "[lifecycle]")
{
	Test_host host;
	host.controller.create(make_test_spec("web-1"));
	auto uuid = host.domain("web-1").uuid;
	Limits_config limits;
	limits.cpu_shares = 512;
	limits.vcpu_quota = 50000LL;
	limits.memory_hard_limit_mb = 1024LL;

	auto result = host.controller.set_limits(Vm_id::by_uuid(uuid), limits);
	CHECK(result.status == "limits_set");
	CHECK(result.details["limits"]["cpu-shares"].as<int>() == 512);
	auto scheduler = host.client->get_scheduler_params(uuid);
	CHECK(*scheduler.cpu_shares == 512);
	CHECK(*scheduler.vcpu_quota == 50000);
	CHECK_FALSE(scheduler.vcpu_period.is_initialized());
	auto memory = host.client->get_memory_params(uuid);
	CHECK(*memory.hard_limit_kb == 1024ULL * 1024);

	CHECK_THROWS_AS(host.controller.set_limits(Vm_id::by_uuid(uuid), Limits_config()), Validation_error);
}

TEST_CASE("Status and list", "[lifecycle]")
{
	Test_host host;
	host.controller.create(make_test_spec("web-1", 2, 2048));
	host.controller.create(make_test_spec("web-2", 1, 1024));
	host.controller.start(Vm_id::by_name("web-2"));

	auto status = host.controller.status(Vm_id::by_name("web-2"));
	CHECK(status.state == Vm_state::running);
	CHECK(status.vcpus == 1);

	auto list = host.controller.list();
	REQUIRE(list.size() == 2);
	unsigned long long total_memory_mb = 0;
	for (const auto &summary : list)
		total_memory_mb += summary.memory_mb;
	CHECK(total_memory_mb == 3072);
}

TEST_CASE("A vm from create to delete", "[lifecycle]")
{
	Test_host host;
	auto id = Vm_id::by_name("web-1");
	CHECK_THROWS_AS(host.controller.status(id), Not_found_error);
	host.controller.create(make_test_spec("web-1"));
	CHECK(host.controller.status(id).state == Vm_state::stopped);
	host.controller.start(id);
	CHECK(host.controller.status(id).state == Vm_state::running);
	host.controller.stop(id, true);
	CHECK(host.controller.status(id).state == Vm_state::stopped);
	host.controller.remove(id, true);
	CHECK_THROWS_AS(host.controller.status(id), Not_found_error);
	CHECK_THROWS_AS(host.controller.start(id), Not_found_error);
	CHECK(host.storage.images().empty());
}

TEST_CASE("Concurrent creates cannot overcommit the host", "[lifecycle]")
{
	Test_host host;
	std::atomic<int> created(0);
	std::atomic<int> rejected(0);
	auto create = [&](const std::string &name)
	{
		try {
			host.controller.create(make_test_spec(name, 2, 10000));
			++created;
		} catch (const Resource_allocation_error &) {
			++rejected;
		}
	};
	std::thread first(create, "race-1");
	std::thread second(create, "race-2");
	first.join();
	second.join();
	CHECK(created.load() == 1);
	CHECK(rejected.load() == 1);
	CHECK(host.accountant.allocated().memory_kb == 10000ULL * 1024);
}

TEST_CASE("A slow disk copy does not stall other vms", "[lifecycle][concurrency]")
{
	Test_host host;
	host.controller.create(make_test_spec("web-1"));
	host.controller.create(make_test_spec("web-2"));
	host.storage.set_copy_delay(std::chrono::milliseconds(1500));
	auto cloning = std::async(std::launch::async, [&host]
	{
		return host.controller.clone(Vm_id::by_name("web-1"), "web-3", "");
	});
	std::this_thread::sleep_for(std::chrono::milliseconds(200));

	auto begin = std::chrono::steady_clock::now();
	CHECK(host.controller.start(Vm_id::by_name("web-2")).status == "started");
	CHECK(host.controller.stop(Vm_id::by_name("web-2"), true).status == "destroyed");
	CHECK(host.controller.create(make_test_spec("web-4")).status == "created");
	// The name of the clone is taken while its disks are copied.
	CHECK_THROWS_AS(host.controller.create(make_test_spec("web-3")), Operation_error);
	CHECK(elapsed_ms(begin) < 500);

	CHECK(cloning.get().status == "cloned");
	CHECK(host.accountant.allocated().vcpus == 8);
	CHECK(host.accountant.available().vcpus == 0);
}

TEST_CASE("Operations are timed on request", "[lifecycle]")
{
	Test_host host;
	auto result = host.controller.create(make_test_spec("web-1"), Time_measurement(true));
	auto timings = result.time_measurement.emit();
	CHECK(timings["overall"].IsDefined());
	CHECK(timings["validate"].IsDefined());
	CHECK(timings["define"].IsDefined());
	CHECK(host.controller.start(Vm_id::by_name("web-1")).time_measurement.empty());
}
