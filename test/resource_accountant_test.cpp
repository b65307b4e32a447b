/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "test_helpers.hpp"

#include <catch2/catch.hpp>

static void require_consistent(Resource_accountant &accountant)
{
	auto limits = accountant.limits();
	CHECK(static_cast<long long>(limits.allocated.vcpus) + limits.available.vcpus == static_cast<long long>(limits.capacity.cpus));
	CHECK(static_cast<long long>(limits.allocated.memory_kb) + limits.available.memory_kb == static_cast<long long>(limits.capacity.memory_kb));
}

TEST_CASE("Host capacity is read from the hypervisor", "[resource_accountant]")
{
	Test_host host;
	auto capacity = host.accountant.host_capacity();
	CHECK(capacity.cpus == 8);
	CHECK(capacity.memory_kb == 16ULL * 1024 * 1024);
	CHECK(capacity.arch == "x86_64");
	CHECK(capacity.numa_nodes == 1);
}

TEST_CASE("Limits of an empty host", "[resource_accountant]")
{
	Test_host host;
	auto limits = host.accountant.limits();
	CHECK(limits.max_cpu_cores == 8);
	// 80% of 16384 MiB.
	CHECK(limits.max_memory_mb == 13107);
	// 90% of 500 GiB free.
	CHECK(limits.max_disk_gb == 450);
	CHECK(limits.max_disks == 10);
	CHECK(limits.max_networks == 5);
	CHECK(limits.allocated.total_domains == 0);
	CHECK(limits.available.overcommitted_vcpus == 32);
	CHECK(limits.vcpu_overcommit_ratio == Approx(4.0));
}

TEST_CASE("A spec which fits the host is valid", "[resource_accountant]")
{
	Test_host host;
	auto result = host.accountant.validate(make_test_spec("web-1"));
	CHECK(result.valid);
	CHECK(result.errors.empty());
	CHECK_FALSE(result.insufficient_resources);
}

TEST_CASE("Too many cores are rejected with all violations", "[resource_accountant]")
{
	Test_host host;
	auto result = host.accountant.validate(make_test_spec("big", 40));
	CHECK_FALSE(result.valid);
	CHECK(contains(result.errors, "CPU cores must be between 1 and 32"));
	CHECK(contains(result.errors, "Total logical CPUs (40) exceeds system capacity (8)"));
	CHECK(contains(result.errors, "Not enough CPU cores available (requested: 40, available: 32)"));
	CHECK(result.insufficient_resources);
}

TEST_CASE("Structural errors are collected", "[resource_accountant]")
{
	Test_host host;
	auto spec = make_test_spec("broken", 2, 100);
	spec.disks.clear();
	spec.networks.clear();
	auto result = host.accountant.validate(spec);
	CHECK_FALSE(result.valid);
	CHECK(contains(result.errors, "Memory size must be at least 512MB"));
	CHECK(contains(result.errors, "At least one disk is required"));
	CHECK(contains(result.errors, "At least one network interface is required"));
	CHECK_FALSE(result.insufficient_resources);
	CHECK(result.summary().find("; ") != std::string::npos);
}

TEST_CASE("Disk validation", "[resource_accountant]")
{
	Test_host host;
	auto spec = make_test_spec("disks");
	SECTION("duplicate names and a second bootable disk") {
		spec.disks.push_back(spec.disks.front());
		auto result = host.accountant.validate(spec);
		CHECK(contains(result.errors, "Duplicate disk name: root"));
		CHECK(contains(result.errors, "Only one disk can be marked as bootable"));
	}
	SECTION("unknown format and cache mode") {
		spec.disks.front().format = "vdi";
		spec.disks.front().cache = "fast";
		auto result = host.accountant.validate(spec);
		CHECK(contains(result.errors, "Disk root format must be qcow2, raw, or vmdk"));
		CHECK(contains(result.errors, "Disk root cache mode is invalid"));
	}
	SECTION("no bootable disk is only a warning") {
		spec.disks.front().bootable = false;
		auto result = host.accountant.validate(spec);
		CHECK(result.valid);
		CHECK(contains(result.warnings, "No bootable disk specified"));
	}
	SECTION("more space than the storage holds") {
		spec.disks.front().size_gb = 1000;
		auto result = host.accountant.validate(spec);
		CHECK_FALSE(result.valid);
		CHECK(contains(result.errors, "Total disk allocation (1000GB) exceeds available space (500GB)"));
		CHECK(result.insufficient_resources);
	}
}

TEST_CASE("Vm and disk names must be plain file name parts", "[resource_accountant]")
{
	Test_host host;
	auto spec = make_test_spec("../../etc/x");
	spec.disks.front().name = "../root";
	auto result = host.accountant.validate(spec);
	CHECK_FALSE(result.valid);
	CHECK_FALSE(result.insufficient_resources);
	CHECK(contains(result.errors, "Invalid VM name: '../../etc/x'"));
	CHECK(contains(result.errors, "Invalid disk name: '../root'"));

	CHECK(is_valid_name("web-1.example_2"));
	CHECK_FALSE(is_valid_name(""));
	CHECK_FALSE(is_valid_name(".."));
	CHECK_FALSE(is_valid_name("a/b"));
	CHECK_FALSE(is_valid_name("-web"));
	CHECK_FALSE(is_valid_name("web 1"));
}

TEST_CASE("Reserved resources are not available", "[resource_accountant]")
{
	Test_host host;
	auto before = host.accountant.available();
	{
		auto reservation = host.accountant.reserve("web-1", 2, 2048LL * 1024, 20);
		CHECK(host.accountant.is_reserved("web-1"));
		auto during = host.accountant.available();
		CHECK(during.vcpus == before.vcpus - 2);
		CHECK(during.memory_kb == before.memory_kb - 2048LL * 1024);
		CHECK(during.disk_gb < before.disk_gb);
		CHECK(host.accountant.allocated().vcpus == 0);
	}
	CHECK_FALSE(host.accountant.is_reserved("web-1"));
	CHECK(host.accountant.available().memory_kb == before.memory_kb);
}

TEST_CASE("Network validation", "[resource_accountant]")
{
	Test_host host;
	auto spec = make_test_spec("net");
	auto &network = spec.networks.front();
	SECTION("valid addresses") {
		network.mac = std::string("52:54:00:12:34:56");
		network.ip = std::string("10.0.0.5");
		CHECK(host.accountant.validate(spec).valid);
		network.ip = std::string("fd00::5");
		CHECK(host.accountant.validate(spec).valid);
	}
	SECTION("malformed addresses") {
		network.mac = std::string("52:54:00:12:34");
		network.ip = std::string("10.0.0.300");
		auto result = host.accountant.validate(spec);
		CHECK(contains(result.errors, "Invalid MAC address format: 52:54:00:12:34"));
		CHECK(contains(result.errors, "Invalid IP address for eth0: 10.0.0.300"));
	}
	SECTION("bridge without bridge name") {
		network.type = "bridge";
		auto result = host.accountant.validate(spec);
		CHECK(contains(result.errors, "Bridge network eth0 requires a bridge name"));
	}
	SECTION("vlan out of range") {
		network.type = "vlan";
		network.vlan = 5000;
		auto result = host.accountant.validate(spec);
		CHECK(contains(result.errors, "VLAN ID for eth0 must be between 1 and 4094"));
	}
	SECTION("unknown type") {
		network.type = "macvtap";
		auto result = host.accountant.validate(spec);
		CHECK(contains(result.errors, "Network eth0 type must be bridge, nat, or vlan"));
	}
}

TEST_CASE("Allocated and available add up to the capacity", "[resource_accountant]")
{
	Test_host host;
	require_consistent(host.accountant);
	host.controller.create(make_test_spec("web-1", 2, 2048));
	require_consistent(host.accountant);
	host.controller.create(make_test_spec("web-2", 4, 4096));
	require_consistent(host.accountant);
	auto allocated = host.accountant.allocated();
	CHECK(allocated.vcpus == 6);
	CHECK(allocated.memory_kb == 6144ULL * 1024);
	CHECK(allocated.total_domains == 2);
	CHECK(allocated.active_domains == 0);
	host.controller.start(Vm_id::by_name("web-1"));
	CHECK(host.accountant.allocated().active_domains == 1);
	host.controller.remove(Vm_id::by_name("web-1"), true);
	require_consistent(host.accountant);
	CHECK(host.accountant.allocated().vcpus == 4);
}

TEST_CASE("Allocation scans are cached until invalidated", "[resource_accountant]")
{
	Test_host host(std::chrono::minutes(10));
	CHECK(host.accountant.allocated().total_domains == 0);
	auto spec = make_test_spec("hidden");
	spec.ensure_uuid();
	// Defined behind the accountant's back.
	host.client->define_xml(host.templates.generate(spec));
	CHECK(host.accountant.allocated().total_domains == 0);
	host.accountant.invalidate();
	CHECK(host.accountant.allocated().total_domains == 1);
}

TEST_CASE("Allocation check against the available resources", "[resource_accountant]")
{
	Test_host host;
	CHECK(host.accountant.check_allocation(32, 1024).valid);
	auto result = host.accountant.check_allocation(33, 20LL * 1024 * 1024, 10);
	CHECK_FALSE(result.valid);
	CHECK(result.insufficient_resources);
	CHECK(result.errors.size() == 2);
}

TEST_CASE("Overcommit ratio must be positive", "[resource_accountant]")
{
	Test_host host;
	CHECK_THROWS_AS(Resource_accountant(host.connection, host.storage, 0.0), std::invalid_argument);
}

TEST_CASE("Runtime limits validation", "[resource_accountant]")
{
	Limits_config limits;
	CHECK(contains(validate_limits(limits).errors, "At least one limit must be set"));

	limits.cpu_shares = 512;
	limits.vcpu_period = 100000;
	limits.vcpu_quota = -1;
	CHECK(validate_limits(limits).valid);

	limits.vcpu_quota = 500;
	CHECK(contains(validate_limits(limits).errors, "vCPU quota must be -1 or at least 1000 microseconds"));

	Limits_config memory;
	memory.memory_hard_limit_mb = 1024;
	memory.memory_soft_limit_mb = 2048;
	CHECK(contains(validate_limits(memory).errors, "Memory soft limit must not exceed the hard limit"));
}
