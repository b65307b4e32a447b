/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "vm_types.hpp"

#include "serialization_utility.hpp"

#include <boost/algorithm/string/join.hpp>

#include <stdexcept>
#include <utility>

std::string to_string(Vm_state state)
{
	switch (state) {
		case Vm_state::undefined:
			return "undefined";
		case Vm_state::stopped:
			return "stopped";
		case Vm_state::starting:
			return "starting";
		case Vm_state::running:
			return "running";
		case Vm_state::paused:
			return "paused";
		case Vm_state::suspended:
			return "suspended";
		case Vm_state::stopping:
			return "stopping";
		case Vm_state::error:
			return "error";
	}
	return "error";
}

Vm_state vm_state_from_string(const std::string &str)
{
	for (auto state : {Vm_state::undefined, Vm_state::stopped, Vm_state::starting, Vm_state::running,
			Vm_state::paused, Vm_state::suspended, Vm_state::stopping, Vm_state::error}) {
		if (to_string(state) == str)
			return state;
	}
	throw std::invalid_argument("Unknown vm state: " + str);
}

bool is_active(Vm_state state)
{
	return state != Vm_state::undefined && state != Vm_state::stopped && state != Vm_state::error;
}

//
// Vm_id
//

Vm_id::Vm_id(boost::optional<std::string> name, boost::optional<std::string> uuid) :
	name(std::move(name)),
	uuid(std::move(uuid))
{
	if (this->name && this->uuid)
		throw std::invalid_argument("Either name or uuid must be given, not both.");
	if (!this->name && !this->uuid)
		throw std::invalid_argument("Either name or uuid must be given.");
	if (value().empty())
		throw std::invalid_argument("Empty vm identifier.");
}

Vm_id Vm_id::by_name(const std::string &name)
{
	return Vm_id(name, boost::none);
}

Vm_id Vm_id::by_uuid(const std::string &uuid)
{
	return Vm_id(boost::none, uuid);
}

std::string Vm_id::str() const
{
	return name ? "name '" + *name + "'" : "uuid '" + *uuid + "'";
}

const std::string & Vm_id::value() const
{
	return name ? *name : *uuid;
}

//
// Host_capacity
//

YAML::Node Host_capacity::emit() const
{
	YAML::Node node;
	node["cpus"] = cpus;
	node["memory-kb"] = memory_kb;
	node["mhz"] = mhz;
	node["numa-nodes"] = numa_nodes;
	node["numa-free-memory-kb"] = numa_free_memory_kb;
	node["sockets"] = sockets;
	node["cores"] = cores;
	node["threads"] = threads;
	node["arch"] = arch;
	return node;
}

void Host_capacity::load(const YAML::Node &node)
{
	load_field(cpus, node["cpus"]);
	load_field(memory_kb, node["memory-kb"]);
	load_field(mhz, node["mhz"], 0);
	load_field(numa_nodes, node["numa-nodes"], 1);
	load_field(numa_free_memory_kb, node["numa-free-memory-kb"], {});
	load_field(sockets, node["sockets"], 1);
	load_field(cores, node["cores"], 1);
	load_field(threads, node["threads"], 1);
	load_field(arch, node["arch"], "");
}

//
// Allocation_snapshot
//

YAML::Node Allocation_snapshot::emit() const
{
	YAML::Node node;
	node["vcpus"] = vcpus;
	node["memory-kb"] = memory_kb;
	node["active-domains"] = active_domains;
	node["total-domains"] = total_domains;
	return node;
}

void Allocation_snapshot::load(const YAML::Node &node)
{
	load_field(vcpus, node["vcpus"]);
	load_field(memory_kb, node["memory-kb"]);
	load_field(active_domains, node["active-domains"], 0);
	load_field(total_domains, node["total-domains"], 0);
}

//
// Available_resources
//

YAML::Node Available_resources::emit() const
{
	YAML::Node node;
	node["vcpus"] = vcpus;
	node["overcommitted-vcpus"] = overcommitted_vcpus;
	node["memory-kb"] = memory_kb;
	node["disk-gb"] = disk_gb;
	return node;
}

void Available_resources::load(const YAML::Node &node)
{
	load_field(vcpus, node["vcpus"]);
	load_field(overcommitted_vcpus, node["overcommitted-vcpus"]);
	load_field(memory_kb, node["memory-kb"]);
	load_field(disk_gb, node["disk-gb"]);
}

//
// Resource_limits
//

YAML::Node Resource_limits::emit() const
{
	YAML::Node node;
	node["max-cpu-cores"] = max_cpu_cores;
	node["max-memory-mb"] = max_memory_mb;
	node["max-disk-gb"] = max_disk_gb;
	node["max-disks"] = max_disks;
	node["max-networks"] = max_networks;
	node["vcpu-overcommit-ratio"] = vcpu_overcommit_ratio;
	node["capacity"] = capacity;
	node["allocated"] = allocated;
	node["available"] = available;
	return node;
}

void Resource_limits::load(const YAML::Node &node)
{
	load_field(max_cpu_cores, node["max-cpu-cores"]);
	load_field(max_memory_mb, node["max-memory-mb"]);
	load_field(max_disk_gb, node["max-disk-gb"]);
	load_field(max_disks, node["max-disks"]);
	load_field(max_networks, node["max-networks"]);
	load_field(vcpu_overcommit_ratio, node["vcpu-overcommit-ratio"]);
	load_field(capacity, node["capacity"]);
	load_field(allocated, node["allocated"]);
	load_field(available, node["available"]);
}

//
// Validation_result
//

void Validation_result::add_error(const std::string &error)
{
	valid = false;
	errors.push_back(error);
}

void Validation_result::add_warning(const std::string &warning)
{
	warnings.push_back(warning);
}

std::string Validation_result::summary() const
{
	return boost::algorithm::join(errors, "; ");
}

YAML::Node Validation_result::emit() const
{
	YAML::Node node;
	node["valid"] = valid;
	node["errors"] = errors;
	node["warnings"] = warnings;
	node["insufficient-resources"] = insufficient_resources;
	return node;
}

void Validation_result::load(const YAML::Node &node)
{
	load_field(valid, node["valid"]);
	load_field(errors, node["errors"], {});
	load_field(warnings, node["warnings"], {});
	load_field(insufficient_resources, node["insufficient-resources"], false);
}

//
// Operation_result
//

Operation_result::Operation_result(std::string name, std::string uuid, std::string operation, std::string status) :
	name(std::move(name)),
	uuid(std::move(uuid)),
	operation(std::move(operation)),
	status(std::move(status))
{
}

YAML::Node Operation_result::emit() const
{
	YAML::Node node;
	node["vm-name"] = name;
	node["uuid"] = uuid;
	node["operation"] = operation;
	node["status"] = status;
	if (details && !details.IsNull())
		node["details"] = details;
	if (!time_measurement.empty())
		node["time-measurement"] = time_measurement;
	return node;
}

void Operation_result::load(const YAML::Node &node)
{
	load_field(name, node["vm-name"]);
	load_field(uuid, node["uuid"], "");
	load_field(operation, node["operation"]);
	load_field(status, node["status"]);
	if (node["details"])
		details = YAML::Clone(node["details"]);
	if (node["time-measurement"])
		time_measurement.load(node["time-measurement"]);
}

//
// Vm_status
//

Vm_status::Vm_status(const Domain_info &info) :
	name(info.name),
	uuid(info.uuid),
	state(info.state),
	state_reason(info.state_reason),
	max_memory_kb(info.max_memory_kb),
	memory_kb(info.memory_kb),
	vcpus(info.vcpus),
	cpu_time_ns(info.cpu_time_ns)
{
}

YAML::Node Vm_status::emit() const
{
	YAML::Node node;
	node["vm-name"] = name;
	node["uuid"] = uuid;
	node["state"] = ::to_string(state);
	node["state-reason"] = state_reason;
	node["max-memory-kb"] = max_memory_kb;
	node["memory-kb"] = memory_kb;
	node["vcpus"] = vcpus;
	node["cpu-time-ns"] = cpu_time_ns;
	return node;
}

void Vm_status::load(const YAML::Node &node)
{
	load_field(name, node["vm-name"]);
	load_field(uuid, node["uuid"]);
	state = vm_state_from_string(node["state"].as<std::string>());
	load_field(state_reason, node["state-reason"], 0);
	load_field(max_memory_kb, node["max-memory-kb"]);
	load_field(memory_kb, node["memory-kb"]);
	load_field(vcpus, node["vcpus"]);
	load_field(cpu_time_ns, node["cpu-time-ns"], 0);
}

//
// Vm_summary
//

Vm_summary::Vm_summary(const Domain_info &info) :
	name(info.name),
	uuid(info.uuid),
	state(info.state),
	vcpus(info.max_vcpus ? info.max_vcpus : info.vcpus),
	memory_mb(info.max_memory_kb / 1024)
{
}

YAML::Node Vm_summary::emit() const
{
	YAML::Node node;
	node["vm-name"] = name;
	node["uuid"] = uuid;
	node["state"] = ::to_string(state);
	node["vcpus"] = vcpus;
	node["memory-mb"] = memory_mb;
	return node;
}

void Vm_summary::load(const YAML::Node &node)
{
	load_field(name, node["vm-name"]);
	load_field(uuid, node["uuid"]);
	state = vm_state_from_string(node["state"].as<std::string>());
	load_field(vcpus, node["vcpus"]);
	load_field(memory_mb, node["memory-mb"]);
}

//
// Health_status
//

YAML::Node Health_status::emit() const
{
	YAML::Node node;
	node["healthy"] = healthy;
	node["uri"] = uri;
	node["timestamp"] = timestamp;
	if (healthy) {
		node["hostname"] = hostname;
		node["active-domains"] = active_domains;
		node["total-domains"] = total_domains;
	} else {
		node["error"] = error;
	}
	return node;
}

void Health_status::load(const YAML::Node &node)
{
	load_field(healthy, node["healthy"]);
	load_field(uri, node["uri"]);
	load_field(timestamp, node["timestamp"], "");
	load_field(hostname, node["hostname"], "");
	load_field(active_domains, node["active-domains"], 0);
	load_field(total_domains, node["total-domains"], 0);
	load_field(error, node["error"], "");
}
