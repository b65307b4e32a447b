/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "test_helpers.hpp"

#include "errors.hpp"
#include "monitoring_collector.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <string>

static Monitoring_collector::Options make_options(double memory_alert_threshold = 90.0, bool lifecycle_events = false)
{
	Monitoring_collector::Options options;
	options.interval = std::chrono::hours(1);
	options.memory_alert_threshold = memory_alert_threshold;
	options.lifecycle_events = lifecycle_events;
	return options;
}

TEST_CASE("A tick publishes metrics of running vms and the host", "[monitoring]")
{
	Test_host host;
	host.controller.create(make_test_spec("web-1"));
	host.controller.create(make_test_spec("web-2"));
	host.controller.start(Vm_id::by_name("web-1"));
	host.events.clear();

	Monitoring_collector monitor(host.connection, host.accountant, host.events, make_options());
	monitor.tick();

	auto vm_metrics = host.events.of_type("vm_metrics");
	REQUIRE(vm_metrics.size() == 1);
	CHECK(vm_metrics.front().vm_name == "web-1");
	auto data = vm_metrics.front().data;
	CHECK(data["state"].as<std::string>() == "running");
	CHECK(data["cpu"]["time-ns"].as<unsigned long long>() > 0);
	CHECK(data["memory"]["total-kb"].as<unsigned long long>() == 2048ULL * 1024);
	CHECK(data["disks"]["vda"]["rd-bytes"].as<long long>() > 0);
	CHECK(data["interfaces"].size() == 1);

	auto host_metrics = host.events.of_type("host_metrics");
	REQUIRE(host_metrics.size() == 1);
	auto host_data = host_metrics.front().data;
	CHECK(host_data["hostname"].as<std::string>() == "dummy-host");
	CHECK(host_data["cpus"].as<unsigned int>() == 8);
	CHECK(host_data["active-vms"].as<unsigned int>() == 1);
	CHECK(host_data["total-vms"].as<unsigned int>() == 2);
	CHECK(host_data["allocated-vcpus"].as<unsigned long long>() == 4);
	CHECK(host_data["hypervisor-type"].as<std::string>() == "QEMU");

	CHECK(host.events.of_type("host_alert").empty());
}

TEST_CASE("Counters are cumulative", "[monitoring]")
{
	Test_host host;
	host.controller.create(make_test_spec("web-1"));
	host.controller.start(Vm_id::by_name("web-1"));
	Monitoring_collector monitor(host.connection, host.accountant, host.events, make_options());
	auto first = monitor.collect_vm_metrics(Vm_id::by_name("web-1"));
	auto second = monitor.collect_vm_metrics(Vm_id::by_name("web-1"));
	CHECK(second.cpu.cpu_time_ns > first.cpu.cpu_time_ns);
	CHECK(first.disks.count("vda") == 1);
	CHECK(first.memory_used_kb == 1024ULL * 1024);
	CHECK(first.vcpus == 2);
	CHECK(first.uptime_s.value_or(0) > 0);
	CHECK(first.emit()["state"].as<std::string>() == "running");
}

TEST_CASE("Metrics of a stopped vm have no counters", "[monitoring]")
{
	Test_host host;
	host.controller.create(make_test_spec("web-1", 2, 2048));
	Monitoring_collector monitor(host.connection, host.accountant, host.events, make_options());
	auto metrics = monitor.collect_vm_metrics(Vm_id::by_name("web-1"));
	CHECK(metrics.name == "web-1");
	CHECK(metrics.state == Vm_state::stopped);
	CHECK(metrics.max_memory_kb == 2048ULL * 1024);
	CHECK(metrics.memory_kb == 2048ULL * 1024);
	CHECK(metrics.vcpus == 2);
	CHECK_FALSE(metrics.uptime_s.is_initialized());
	CHECK(metrics.disks.empty());
	CHECK(metrics.interfaces.empty());
	CHECK(host.client->call_count("get_cpu_stats") == 0);

	auto node = metrics.emit();
	CHECK(node["state"].as<std::string>() == "stopped");
	CHECK(node["vcpus"].as<unsigned int>() == 2);
	CHECK_FALSE(node["uptime-s"].IsDefined());

	CHECK_THROWS_AS(monitor.collect_vm_metrics(Vm_id::by_name("ghost")), Not_found_error);
}

TEST_CASE("Failing metrics of one vm do not stop the round", "[monitoring]")
{
	Test_host host;
	host.controller.create(make_test_spec("web-1"));
	host.controller.create(make_test_spec("web-2"));
	host.controller.start(Vm_id::by_name("web-1"));
	host.controller.start(Vm_id::by_name("web-2"));
	host.events.clear();
	host.client->fail_next("get_cpu_stats");

	Monitoring_collector monitor(host.connection, host.accountant, host.events, make_options());
	monitor.tick();
	CHECK(host.events.of_type("vm_metrics").size() == 1);
	CHECK(host.events.of_type("host_metrics").size() == 1);
}

TEST_CASE("Allocated memory above the threshold raises an alert", "[monitoring]")
{
	Test_host host;
	// 2048 of 16384 MiB are 12.5%.
	host.controller.create(make_test_spec("web-1", 2, 2048));
	Monitoring_collector monitor(host.connection, host.accountant, host.events, make_options(10.0));
	monitor.tick();
	auto alerts = host.events.of_type("host_alert");
	REQUIRE(alerts.size() == 1);
	CHECK(alerts.front().data["severity"].as<std::string>() == "warning");
	CHECK(alerts.front().data["message"].as<std::string>() == "Allocated memory at 12% of host memory");
}

TEST_CASE("An unreachable hypervisor raises a critical alert", "[monitoring]")
{
	Test_host host;
	host.client->set_reachable(false);
	Monitoring_collector monitor(host.connection, host.accountant, host.events, make_options());
	CHECK_NOTHROW(monitor.tick());
	auto alerts = host.events.of_type("host_alert");
	REQUIRE(alerts.size() == 1);
	CHECK(alerts.front().data["severity"].as<std::string>() == "critical");
	CHECK(host.events.of_type("host_metrics").empty());
}

TEST_CASE("Lifecycle events are forwarded while running", "[monitoring]")
{
	Test_host host;
	host.controller.create(make_test_spec("web-1"));
	Monitoring_collector monitor(host.connection, host.accountant, host.events, make_options(90.0, true));
	monitor.start();
	CHECK(monitor.is_running());
	host.events.clear();
	host.controller.start(Vm_id::by_name("web-1"));
	monitor.stop();
	CHECK_FALSE(monitor.is_running());

	int forwarded = 0;
	for (const auto &event : host.events.of_type("vm_status_changed")) {
		if (!event.data["lifecycle-event"].IsDefined())
			continue;
		++forwarded;
		CHECK(event.vm_name == "web-1");
		CHECK(event.data["lifecycle-event"].as<std::string>() == "started");
		CHECK(event.data["new-state"].as<std::string>() == "running");
	}
	CHECK(forwarded == 1);

	host.events.clear();
	host.controller.stop(Vm_id::by_name("web-1"), true);
	CHECK(host.events.of_type("vm_status_changed").size() == 1);
}

TEST_CASE("The monitoring interval must be positive", "[monitoring]")
{
	Test_host host;
	auto options = make_options();
	options.interval = std::chrono::milliseconds(0);
	CHECK_THROWS_AS(Monitoring_collector(host.connection, host.accountant, host.events, options), std::invalid_argument);
}
