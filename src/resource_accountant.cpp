/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "resource_accountant.hpp"

#include "errors.hpp"

#include <fast-lib/log.hpp>
#include <boost/regex.hpp>

#include <algorithm>
#include <arpa/inet.h>
#include <set>
#include <stdexcept>
#include <utility>

FASTLIB_LOG_INIT(accountant_log, "Resource_accountant")
FASTLIB_LOG_SET_LEVEL_GLOBAL(accountant_log, trace);

const unsigned int max_vm_cores = 32;
const unsigned long long max_vm_memory_mb = 65536;
const long long max_vm_disk_gb = 2000;
const unsigned int max_vm_disks = 10;
const unsigned int max_vm_networks = 5;
const unsigned long long gibibyte = 1024ULL * 1024 * 1024;

bool is_valid_mac(const std::string &mac)
{
	static const boost::regex pattern("^([0-9A-Fa-f]{2}[:-]){5}([0-9A-Fa-f]{2})$");
	return boost::regex_match(mac, pattern);
}

bool is_valid_ip(const std::string &ip)
{
	unsigned char buf[sizeof(struct in6_addr)];
	return inet_pton(AF_INET, ip.c_str(), buf) == 1 || inet_pton(AF_INET6, ip.c_str(), buf) == 1;
}

bool is_valid_name(const std::string &name)
{
	static const boost::regex pattern("^[A-Za-z0-9][A-Za-z0-9._-]*$");
	return boost::regex_match(name, pattern);
}

void validate_cpu(const Cpu_config &cpu, unsigned int system_cpus, Validation_result &result)
{
	if (cpu.cores < 1 || cpu.cores > 32)
		result.add_error("CPU cores must be between 1 and 32");
	if (cpu.sockets < 1 || cpu.sockets > 4)
		result.add_error("CPU sockets must be between 1 and 4");
	if (cpu.threads < 1 || cpu.threads > 2)
		result.add_error("CPU threads per core must be 1 or 2");
	auto total_logical_cpus = cpu.total_vcpus();
	if (total_logical_cpus > system_cpus)
		result.add_error("Total logical CPUs (" + std::to_string(total_logical_cpus) + ") exceeds system capacity (" + std::to_string(system_cpus) + ")");
	if (!cpu.pinning.empty()) {
		for (auto core : cpu.pinning) {
			if (core < 0 || static_cast<unsigned int>(core) >= system_cpus)
				result.add_error("CPU pinning core " + std::to_string(core) + " is invalid (system has " + std::to_string(system_cpus) + " cores)");
		}
		if (cpu.pinning.size() != static_cast<size_t>(std::max(cpu.cores, 0)))
			result.add_error("CPU pinning list length must match number of cores");
	}
	if (cpu.shares && (*cpu.shares < 1 || *cpu.shares > 2048))
		result.add_error("CPU shares must be between 1 and 2048");
	if (cpu.limit && (*cpu.limit < 1 || *cpu.limit > 100))
		result.add_error("CPU limit must be between 1 and 100 percent");
}

void validate_memory(const Memory_config &memory, unsigned long long system_memory_kb, Validation_result &result)
{
	if (memory.size_mb < 512)
		result.add_error("Memory size must be at least 512MB");
	if (memory.size_mb > 65536)
		result.add_error("Memory size cannot exceed 64GB");
	auto system_memory_mb = system_memory_kb / 1024;
	if (memory.size_mb > system_memory_mb * 0.9)
		result.add_error("Memory allocation (" + std::to_string(memory.size_mb) + "MB) exceeds 90% of system memory (" + std::to_string(system_memory_mb) + "MB)");
	if (memory.shares && (*memory.shares < 1 || *memory.shares > 2048))
		result.add_error("Memory shares must be between 1 and 2048");
	if (memory.overcommit_ratio && (*memory.overcommit_ratio < 0.5 || *memory.overcommit_ratio > 2.0))
		result.add_error("Memory overcommit ratio must be between 0.5 and 2.0");
	if (memory.hugepages)
		result.add_warning("Hugepages support requires proper system configuration");
}

// free_gb is boost::none if the free storage space is unknown.
void validate_disks(const std::vector<Disk_config> &disks, const boost::optional<long long> &free_gb, Validation_result &result)
{
	static const std::set<std::string> formats = {"qcow2", "raw", "vmdk"};
	static const std::set<std::string> cache_modes = {"none", "writeback", "writethrough", "directsync", "unsafe"};
	if (disks.empty()) {
		result.add_error("At least one disk is required");
		return;
	}
	if (disks.size() > max_vm_disks)
		result.add_error("Maximum 10 disks allowed per VM");
	auto bootable_count = std::count_if(disks.begin(), disks.end(), [](const Disk_config &disk) {return disk.bootable;});
	if (bootable_count == 0)
		result.add_warning("No bootable disk specified");
	else if (bootable_count > 1)
		result.add_error("Only one disk can be marked as bootable");
	std::set<std::string> names;
	long long total_size_gb = 0;
	for (const auto &disk : disks) {
		if (!names.insert(disk.name).second)
			result.add_error("Duplicate disk name: " + disk.name);
		if (!is_valid_name(disk.name))
			result.add_error("Invalid disk name: '" + disk.name + "'");
		if (disk.size_gb < 1)
			result.add_error("Disk " + disk.name + " size must be at least 1GB");
		if (disk.size_gb > max_vm_disk_gb)
			result.add_error("Disk " + disk.name + " size cannot exceed 2TB");
		total_size_gb += disk.size_gb;
		if (!formats.count(disk.format))
			result.add_error("Disk " + disk.name + " format must be qcow2, raw, or vmdk");
		if (!cache_modes.count(disk.cache))
			result.add_error("Disk " + disk.name + " cache mode is invalid");
	}
	if (free_gb && total_size_gb > *free_gb * 0.9)
		result.add_error("Total disk allocation (" + std::to_string(total_size_gb) + "GB) exceeds available space (" + std::to_string(*free_gb) + "GB)");
}

void validate_networks(const std::vector<Network_config> &networks, Validation_result &result)
{
	static const std::set<std::string> types = {"bridge", "nat", "vlan"};
	if (networks.empty()) {
		result.add_error("At least one network interface is required");
		return;
	}
	if (networks.size() > max_vm_networks)
		result.add_error("Maximum 5 network interfaces allowed per VM");
	std::set<std::string> names;
	std::set<std::string> macs;
	for (const auto &network : networks) {
		if (!names.insert(network.name).second)
			result.add_error("Duplicate network interface name: " + network.name);
		if (!types.count(network.type))
			result.add_error("Network " + network.name + " type must be bridge, nat, or vlan");
		else if (network.type == "bridge" && (!network.bridge || network.bridge->empty()))
			result.add_error("Bridge network " + network.name + " requires a bridge name");
		if (network.mac) {
			if (!macs.insert(*network.mac).second)
				result.add_error("Duplicate MAC address: " + *network.mac);
			if (!is_valid_mac(*network.mac))
				result.add_error("Invalid MAC address format: " + *network.mac);
		}
		if (network.vlan && (*network.vlan < 1 || *network.vlan > 4094))
			result.add_error("VLAN ID for " + network.name + " must be between 1 and 4094");
		if (network.ip && !is_valid_ip(*network.ip))
			result.add_error("Invalid IP address for " + network.name + ": " + *network.ip);
		if (network.bandwidth_mbps && *network.bandwidth_mbps < 1)
			result.add_error("Bandwidth limit for " + network.name + " must be at least 1 Mbps");
	}
}

Validation_result validate_limits(const Limits_config &limits)
{
	Validation_result result;
	if (limits.empty())
		result.add_error("At least one limit must be set");
	if (limits.cpu_shares && (*limits.cpu_shares < 1 || *limits.cpu_shares > 2048))
		result.add_error("CPU shares must be between 1 and 2048");
	if (limits.vcpu_period && (*limits.vcpu_period < 1000 || *limits.vcpu_period > 1000000))
		result.add_error("vCPU period must be between 1000 and 1000000 microseconds");
	if (limits.vcpu_quota && *limits.vcpu_quota != -1 && *limits.vcpu_quota < 1000)
		result.add_error("vCPU quota must be -1 or at least 1000 microseconds");
	if (limits.memory_hard_limit_mb && *limits.memory_hard_limit_mb < 1)
		result.add_error("Memory hard limit must be at least 1MB");
	if (limits.memory_soft_limit_mb && *limits.memory_soft_limit_mb < 1)
		result.add_error("Memory soft limit must be at least 1MB");
	if (limits.memory_hard_limit_mb && limits.memory_soft_limit_mb && *limits.memory_soft_limit_mb > *limits.memory_hard_limit_mb)
		result.add_error("Memory soft limit must not exceed the hard limit");
	return result;
}

Resource_accountant::Resource_accountant(Connection_manager &connection, Storage_backend &storage,
		double vcpu_overcommit_ratio, std::chrono::milliseconds allocation_cache_ttl) :
	connection(connection),
	storage(storage),
	vcpu_overcommit_ratio(vcpu_overcommit_ratio),
	allocation_cache_ttl(allocation_cache_ttl),
	generation(0),
	reserved_vcpus(0),
	reserved_memory_kb(0),
	reserved_disk_gb(0)
{
	if (vcpu_overcommit_ratio <= 0.0)
		throw std::invalid_argument("vcpu overcommit ratio must be positive.");
}

Host_capacity Resource_accountant::host_capacity()
{
	auto node = connection.execute("read node info", [](Hypervisor_client &client)
	{
		return client.get_node_info();
	});
	Host_capacity capacity;
	capacity.cpus = node.cpus;
	capacity.memory_kb = node.memory_kb;
	capacity.mhz = node.mhz;
	capacity.numa_nodes = node.nodes;
	capacity.numa_free_memory_kb = node.cells_free_memory_kb;
	capacity.sockets = node.sockets;
	capacity.cores = node.cores;
	capacity.threads = node.threads;
	capacity.arch = node.model;
	return capacity;
}

Allocation_snapshot Resource_accountant::scan_allocation()
{
	auto domains = connection.execute("list domains", [](Hypervisor_client &client)
	{
		return client.list_domains(false);
	});
	Allocation_snapshot snapshot;
	for (const auto &domain : domains) {
		snapshot.vcpus += domain.max_vcpus;
		snapshot.memory_kb += domain.max_memory_kb;
		if (domain.active)
			++snapshot.active_domains;
	}
	snapshot.total_domains = static_cast<unsigned int>(domains.size());
	return snapshot;
}

Allocation_snapshot Resource_accountant::allocated()
{
	unsigned long long scan_generation;
	{
		std::lock_guard<std::mutex> lock(cache_mutex);
		if (cached_allocation && std::chrono::steady_clock::now() - cached_at < allocation_cache_ttl)
			return *cached_allocation;
		scan_generation = generation;
	}
	auto snapshot = scan_allocation();
	{
		std::lock_guard<std::mutex> lock(cache_mutex);
		// A scan overtaken by an invalidation is returned but not cached.
		if (allocation_cache_ttl.count() > 0 && scan_generation == generation) {
			cached_allocation = snapshot;
			cached_at = std::chrono::steady_clock::now();
		}
	}
	return snapshot;
}

void Resource_accountant::invalidate()
{
	std::lock_guard<std::mutex> lock(cache_mutex);
	cached_allocation = boost::none;
	++generation;
	FASTLIB_LOG(accountant_log, trace) << "Allocation cache invalidated.";
}

Resource_accountant::Observation Resource_accountant::observe()
{
	auto lock = lock_pool();
	Observation observation;
	observation.capacity = host_capacity();
	observation.allocated = allocated();
	auto &available = observation.available;
	available.vcpus = static_cast<long long>(observation.capacity.cpus) - static_cast<long long>(observation.allocated.vcpus);
	available.overcommitted_vcpus = static_cast<long long>(observation.capacity.cpus * vcpu_overcommit_ratio)
		- static_cast<long long>(observation.allocated.vcpus);
	available.memory_kb = static_cast<long long>(observation.capacity.memory_kb) - static_cast<long long>(observation.allocated.memory_kb);
	long long disk_gb_reserved;
	{
		std::lock_guard<std::mutex> cache_lock(cache_mutex);
		available.vcpus -= reserved_vcpus;
		available.overcommitted_vcpus -= reserved_vcpus;
		available.memory_kb -= reserved_memory_kb;
		disk_gb_reserved = reserved_disk_gb;
	}
	try {
		observation.free_gb = std::max(0LL, static_cast<long long>(storage.free_bytes() / gibibyte) - disk_gb_reserved);
		available.disk_gb = std::min(max_vm_disk_gb, static_cast<long long>(observation.free_gb * 0.9));
		observation.disk_known = true;
	} catch (const Storage_error &e) {
		FASTLIB_LOG(accountant_log, warn) << "Could not check disk space: " << e.what();
		observation.disk_error = e.what();
	}
	return observation;
}

Available_resources Resource_accountant::available()
{
	return observe().available;
}

Resource_limits Resource_accountant::limits()
{
	auto observation = observe();
	Resource_limits limits;
	limits.max_cpu_cores = std::min(max_vm_cores, observation.capacity.cpus);
	limits.max_memory_mb = std::min(max_vm_memory_mb,
			static_cast<unsigned long long>(observation.capacity.memory_kb / 1024 * 0.8));
	limits.max_disk_gb = static_cast<unsigned long long>(std::max(0LL, observation.available.disk_gb));
	limits.max_disks = max_vm_disks;
	limits.max_networks = max_vm_networks;
	limits.capacity = observation.capacity;
	limits.allocated = observation.allocated;
	limits.available = observation.available;
	limits.vcpu_overcommit_ratio = vcpu_overcommit_ratio;
	return limits;
}

void Resource_accountant::cross_check(const Observation &observation, long long vcpus, long long memory_kb,
		long long disk_gb, bool check_disk, Validation_result &result) const
{
	const auto &available = observation.available;
	if (vcpus > available.overcommitted_vcpus) {
		result.add_error("Not enough CPU cores available (requested: " + std::to_string(vcpus) + ", available: " + std::to_string(available.overcommitted_vcpus) + ")");
		result.insufficient_resources = true;
	}
	if (memory_kb > available.memory_kb) {
		result.add_error("Not enough memory available (requested: " + std::to_string(memory_kb / 1024) + "MB, available: " + std::to_string(available.memory_kb / 1024) + "MB)");
		result.insufficient_resources = true;
	}
	if (check_disk && disk_gb > available.disk_gb) {
		result.add_error("Not enough disk space available (requested: " + std::to_string(disk_gb) + "GB, available: " + std::to_string(available.disk_gb) + "GB)");
		result.insufficient_resources = true;
	}
}

Validation_result Resource_accountant::validate(const Vm_spec &spec)
{
	FASTLIB_LOG(accountant_log, trace) << "Validate resources of " << spec.name << ".";
	auto lock = lock_pool();
	auto observation = observe();
	Validation_result result;
	if (spec.name.empty())
		result.add_error("VM name must not be empty");
	else if (!is_valid_name(spec.name))
		result.add_error("Invalid VM name: '" + spec.name + "'");
	validate_cpu(spec.cpu, observation.capacity.cpus, result);
	validate_memory(spec.memory, observation.capacity.memory_kb, result);
	boost::optional<long long> free_gb;
	if (observation.disk_known)
		free_gb = observation.free_gb;
	else
		result.add_warning("Could not check disk space: " + observation.disk_error);
	validate_disks(spec.disks, free_gb, result);
	validate_networks(spec.networks, result);
	cross_check(observation, spec.cpu.total_vcpus(), spec.memory.size_mb * 1024, spec.total_disk_gb(),
			observation.disk_known, result);
	if (!result.valid)
		FASTLIB_LOG(accountant_log, debug) << "Validation of " << spec.name << " failed: " << result.summary();
	return result;
}

Validation_result Resource_accountant::check_allocation(long long vcpus, long long memory_kb, long long disk_gb)
{
	auto lock = lock_pool();
	auto observation = observe();
	Validation_result result;
	if (disk_gb > 0 && !observation.disk_known)
		result.add_warning("Could not check disk space: " + observation.disk_error);
	cross_check(observation, vcpus, memory_kb, disk_gb, observation.disk_known, result);
	return result;
}

std::unique_lock<std::recursive_mutex> Resource_accountant::lock_pool()
{
	return std::unique_lock<std::recursive_mutex>(pool_mutex);
}

std::unique_ptr<Resource_reservation> Resource_accountant::reserve(const std::string &name, long long vcpus,
		long long memory_kb, long long disk_gb)
{
	std::unique_ptr<Resource_reservation> reservation(new Resource_reservation(*this, name, vcpus, memory_kb, disk_gb));
	std::lock_guard<std::mutex> lock(cache_mutex);
	reserved_names.insert(name);
	reserved_vcpus += vcpus;
	reserved_memory_kb += memory_kb;
	reserved_disk_gb += disk_gb;
	FASTLIB_LOG(accountant_log, trace) << "Reserved " << vcpus << " vcpus, " << memory_kb / 1024 << "MB and " << disk_gb << "GB for " << name << ".";
	return reservation;
}

bool Resource_accountant::is_reserved(const std::string &name)
{
	std::lock_guard<std::mutex> lock(cache_mutex);
	return reserved_names.count(name) != 0;
}

void Resource_accountant::release(const Resource_reservation &reservation) noexcept
{
	std::lock_guard<std::mutex> lock(cache_mutex);
	auto it = reserved_names.find(reservation.name);
	if (it != reserved_names.end())
		reserved_names.erase(it);
	reserved_vcpus -= reservation.vcpus;
	reserved_memory_kb -= reservation.memory_kb;
	reserved_disk_gb -= reservation.disk_gb;
}

double Resource_accountant::get_vcpu_overcommit_ratio() const
{
	return vcpu_overcommit_ratio;
}

Resource_reservation::Resource_reservation(Resource_accountant &accountant, std::string name, long long vcpus,
		long long memory_kb, long long disk_gb) :
	accountant(accountant),
	name(std::move(name)),
	vcpus(vcpus),
	memory_kb(memory_kb),
	disk_gb(disk_gb)
{
}

Resource_reservation::~Resource_reservation()
{
	accountant.release(*this);
}

const std::string & Resource_reservation::get_name() const
{
	return name;
}
