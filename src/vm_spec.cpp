/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "vm_spec.hpp"

#include "serialization_utility.hpp"

#include <boost/regex.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <mutex>

std::string generate_uuid()
{
	static std::mutex generator_mutex;
	static boost::uuids::random_generator generator;
	std::lock_guard<std::mutex> lock(generator_mutex);
	return boost::uuids::to_string(generator());
}

bool is_valid_uuid(const std::string &uuid)
{
	static const boost::regex pattern("^[0-9A-Fa-f]{8}-[0-9A-Fa-f]{4}-[0-9A-Fa-f]{4}-[0-9A-Fa-f]{4}-[0-9A-Fa-f]{12}$");
	return boost::regex_match(uuid, pattern);
}

long long Cpu_config::total_vcpus() const
{
	return static_cast<long long>(cores) * sockets * threads;
}

YAML::Node Cpu_config::emit() const
{
	YAML::Node node;
	node["cores"] = cores;
	node["sockets"] = sockets;
	node["threads"] = threads;
	if (!pinning.empty())
		node["pinning"] = pinning;
	emit_optional(node, "shares", shares);
	emit_optional(node, "limit", limit);
	emit_optional(node, "model", model);
	return node;
}

void Cpu_config::load(const YAML::Node &node)
{
	load_field(cores, node["cores"], 1);
	load_field(sockets, node["sockets"], 1);
	load_field(threads, node["threads"], 1);
	load_field(pinning, node["pinning"], {});
	load_field(shares, node["shares"]);
	load_field(limit, node["limit"]);
	load_field(model, node["model"]);
}

YAML::Node Memory_config::emit() const
{
	YAML::Node node;
	node["size-mb"] = size_mb;
	node["hugepages"] = hugepages;
	node["balloon"] = balloon;
	emit_optional(node, "shares", shares);
	emit_optional(node, "overcommit-ratio", overcommit_ratio);
	return node;
}

void Memory_config::load(const YAML::Node &node)
{
	load_field(size_mb, node["size-mb"]);
	load_field(hugepages, node["hugepages"], false);
	load_field(balloon, node["balloon"], true);
	load_field(shares, node["shares"]);
	load_field(overcommit_ratio, node["overcommit-ratio"]);
}

YAML::Node Disk_config::emit() const
{
	YAML::Node node;
	node["name"] = name;
	node["size-gb"] = size_gb;
	node["format"] = format;
	node["cache"] = cache;
	node["bootable"] = bootable;
	node["readonly"] = readonly;
	emit_optional(node, "base-image", base_image);
	return node;
}

void Disk_config::load(const YAML::Node &node)
{
	load_field(name, node["name"]);
	load_field(size_gb, node["size-gb"]);
	load_field(format, node["format"], "qcow2");
	load_field(cache, node["cache"], "none");
	load_field(bootable, node["bootable"], false);
	load_field(readonly, node["readonly"], false);
	load_field(base_image, node["base-image"]);
}

YAML::Node Network_config::emit() const
{
	YAML::Node node;
	node["name"] = name;
	node["type"] = type;
	emit_optional(node, "bridge", bridge);
	emit_optional(node, "vlan", vlan);
	emit_optional(node, "ip", ip);
	emit_optional(node, "prefix", prefix);
	emit_optional(node, "mac", mac);
	emit_optional(node, "bandwidth-mbps", bandwidth_mbps);
	return node;
}

void Network_config::load(const YAML::Node &node)
{
	load_field(name, node["name"]);
	load_field(type, node["type"], "nat");
	load_field(bridge, node["bridge"]);
	load_field(vlan, node["vlan"]);
	load_field(ip, node["ip"]);
	load_field(prefix, node["prefix"]);
	load_field(mac, node["mac"]);
	load_field(bandwidth_mbps, node["bandwidth-mbps"]);
}

bool Limits_config::empty() const
{
	return !cpu_shares && !vcpu_period && !vcpu_quota && !memory_hard_limit_mb && !memory_soft_limit_mb;
}

YAML::Node Limits_config::emit() const
{
	YAML::Node node;
	emit_optional(node, "cpu-shares", cpu_shares);
	emit_optional(node, "vcpu-period", vcpu_period);
	emit_optional(node, "vcpu-quota", vcpu_quota);
	emit_optional(node, "memory-hard-limit-mb", memory_hard_limit_mb);
	emit_optional(node, "memory-soft-limit-mb", memory_soft_limit_mb);
	return node;
}

void Limits_config::load(const YAML::Node &node)
{
	load_field(cpu_shares, node["cpu-shares"]);
	load_field(vcpu_period, node["vcpu-period"]);
	load_field(vcpu_quota, node["vcpu-quota"]);
	load_field(memory_hard_limit_mb, node["memory-hard-limit-mb"]);
	load_field(memory_soft_limit_mb, node["memory-soft-limit-mb"]);
}

long long Vm_spec::total_disk_gb() const
{
	long long total = 0;
	for (const auto &disk : disks)
		total += disk.size_gb;
	return total;
}

void Vm_spec::ensure_uuid()
{
	if (uuid.empty())
		uuid = generate_uuid();
}

YAML::Node Vm_spec::emit() const
{
	YAML::Node node;
	node["name"] = name;
	node["uuid"] = uuid;
	node["cpu"] = cpu;
	node["memory"] = memory;
	node["disks"] = disks;
	node["networks"] = networks;
	return node;
}

void Vm_spec::load(const YAML::Node &node)
{
	load_field(name, node["name"]);
	load_field(uuid, node["uuid"], "");
	load_field(cpu, node["cpu"], Cpu_config());
	load_field(memory, node["memory"]);
	load_field(disks, node["disks"], {});
	load_field(networks, node["networks"], {});
	ensure_uuid();
}
