/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "config.hpp"

#include "serialization_utility.hpp"
#include "utility.hpp"

#include <fast-lib/log.hpp>

#include <cmath>
#include <stdexcept>

FASTLIB_LOG_INIT(config_log, "Engine_config")
FASTLIB_LOG_SET_LEVEL_GLOBAL(config_log, trace);

// Durations are configured in (fractional) seconds.
std::chrono::milliseconds load_duration(const YAML::Node &node, std::chrono::milliseconds default_value)
{
	if (!node)
		return default_value;
	auto seconds = node.as<double>();
	if (seconds < 0)
		throw std::invalid_argument("Negative duration in configuration.");
	return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000)));
}

double to_seconds(std::chrono::milliseconds duration)
{
	return duration.count() / 1000.0;
}

YAML::Node Engine_config::emit() const
{
	YAML::Node node;
	auto comm_node = node["communicator"];
	comm_node["type"] = communicator.type;
	comm_node["id"] = communicator.id;
	comm_node["subscribe-topic"] = communicator.subscribe_topic;
	comm_node["publish-topic"] = communicator.publish_topic;
	if (!communicator.event_topic.empty())
		comm_node["event-topic"] = communicator.event_topic;
	comm_node["host"] = communicator.host;
	comm_node["port"] = communicator.port;
	comm_node["keepalive"] = communicator.keepalive;

	auto hypervisor_node = node["hypervisor"];
	hypervisor_node["type"] = hypervisor.type;
	hypervisor_node["uri"] = hypervisor.uri;
	hypervisor_node["liveness-interval"] = hypervisor.liveness_interval.count();
	hypervisor_node["stop-timeout"] = hypervisor.stop_timeout.count();
	if (hypervisor.type == "dummy") {
		hypervisor_node["cpus"] = hypervisor.dummy_cpus;
		hypervisor_node["memory-mb"] = hypervisor.dummy_memory_mb;
	}

	auto storage_node = node["storage"];
	storage_node["type"] = storage.type;
	storage_node["path"] = storage.path;
	if (storage.type == "dummy")
		storage_node["capacity-gb"] = storage.dummy_capacity_gb;

	node["resources"]["vcpu-overcommit-ratio"] = resources.vcpu_overcommit_ratio;
	node["resources"]["allocation-cache-ttl"] = to_seconds(resources.allocation_cache_ttl);

	auto monitoring_node = node["monitoring"];
	monitoring_node["enabled"] = monitoring.enabled;
	monitoring_node["interval"] = to_seconds(monitoring.interval);
	monitoring_node["lifecycle-events"] = monitoring.lifecycle_events;
	monitoring_node["memory-alert-threshold"] = monitoring.memory_alert_threshold;

	node["workers"]["threads"] = workers.threads;
	node["workers"]["queue-size"] = workers.queue_size;

	auto domain_node = node["domain"];
	domain_node["type"] = domain.domain_type;
	domain_node["arch"] = domain.arch;
	domain_node["machine"] = domain.machine;
	domain_node["emulator"] = domain.emulator;
	domain_node["nat-network"] = domain.nat_network;
	domain_node["vnc"] = domain.vnc;
	return node;
}

void Engine_config::load(const YAML::Node &node)
{
	if (!node["communicator"])
		throw std::invalid_argument("No configuration for communication interface.");
	{
		auto comm_node = node["communicator"];
		if (!comm_node["type"])
			throw std::invalid_argument("No type for communication interface in configuration found.");
		load_field(communicator.type, comm_node["type"]);
		if (communicator.type != "mqtt")
			throw std::invalid_argument("Unknown communication type in configuration found.");
		if (!comm_node["id"] || !comm_node["subscribe-topic"] || !comm_node["publish-topic"]
				|| !comm_node["host"] || !comm_node["port"] || !comm_node["keepalive"])
			throw std::invalid_argument("Defective configuration for mqtt communicator.");
		load_field(communicator.id, comm_node["id"]);
		load_field(communicator.subscribe_topic, comm_node["subscribe-topic"]);
		load_field(communicator.publish_topic, comm_node["publish-topic"]);
		load_field(communicator.event_topic, comm_node["event-topic"], "");
		load_field(communicator.host, comm_node["host"]);
		load_field(communicator.port, comm_node["port"]);
		load_field(communicator.keepalive, comm_node["keepalive"]);
	}
	if (node["hypervisor"]) {
		auto hypervisor_node = node["hypervisor"];
		load_field(hypervisor.type, hypervisor_node["type"], "libvirt");
		if (hypervisor.type != "libvirt" && hypervisor.type != "dummy")
			throw std::invalid_argument("Unknown hypervisor type in configuration found.");
		load_field(hypervisor.uri, hypervisor_node["uri"], hypervisor.type == "dummy" ? "dummy:///" : "qemu:///system");
		hypervisor.liveness_interval = std::chrono::seconds(hypervisor_node["liveness-interval"]
				? hypervisor_node["liveness-interval"].as<long long>() : 300);
		hypervisor.stop_timeout = std::chrono::seconds(hypervisor_node["stop-timeout"]
				? hypervisor_node["stop-timeout"].as<long long>() : 60);
		load_field(hypervisor.dummy_cpus, hypervisor_node["cpus"], 8u);
		load_field(hypervisor.dummy_memory_mb, hypervisor_node["memory-mb"], 16384ull);
	}
	if (node["storage"]) {
		auto storage_node = node["storage"];
		load_field(storage.type, storage_node["type"], "qemu-img");
		if (storage.type != "qemu-img" && storage.type != "dummy")
			throw std::invalid_argument("Unknown storage type in configuration found.");
		load_field(storage.path, storage_node["path"], "/var/lib/libvirt/images");
		load_field(storage.dummy_capacity_gb, storage_node["capacity-gb"], 500ull);
	}
	if (node["resources"]) {
		auto resources_node = node["resources"];
		load_field(resources.vcpu_overcommit_ratio, resources_node["vcpu-overcommit-ratio"], 4.0);
		if (resources.vcpu_overcommit_ratio <= 0)
			throw std::invalid_argument("vcpu-overcommit-ratio must be positive.");
		resources.allocation_cache_ttl = load_duration(resources_node["allocation-cache-ttl"], std::chrono::milliseconds(2000));
	}
	if (node["monitoring"]) {
		auto monitoring_node = node["monitoring"];
		load_field(monitoring.enabled, monitoring_node["enabled"], true);
		monitoring.interval = load_duration(monitoring_node["interval"], std::chrono::milliseconds(5000));
		if (monitoring.interval.count() == 0)
			throw std::invalid_argument("Monitoring interval must be positive.");
		load_field(monitoring.lifecycle_events, monitoring_node["lifecycle-events"], false);
		load_field(monitoring.memory_alert_threshold, monitoring_node["memory-alert-threshold"], 90.0);
	}
	if (node["workers"]) {
		auto workers_node = node["workers"];
		load_field(workers.threads, workers_node["threads"], 4u);
		load_field(workers.queue_size, workers_node["queue-size"], static_cast<size_t>(64));
		if (workers.threads == 0 || workers.queue_size == 0)
			throw std::invalid_argument("Defective configuration for workers.");
	}
	if (node["domain"]) {
		auto domain_node = node["domain"];
		Template_generator::Options defaults;
		load_field(domain.domain_type, domain_node["type"], defaults.domain_type);
		load_field(domain.arch, domain_node["arch"], defaults.arch);
		load_field(domain.machine, domain_node["machine"], defaults.machine);
		load_field(domain.emulator, domain_node["emulator"], defaults.emulator);
		load_field(domain.nat_network, domain_node["nat-network"], defaults.nat_network);
		load_field(domain.vnc, domain_node["vnc"], defaults.vnc);
	}
}

Engine_config load_config_file(const std::string &file_name)
{
	FASTLIB_LOG(config_log, trace) << "Load configuration from " << file_name << ".";
	auto config = replace_hostname_placeholder(read_file(file_name), get_hostname());
	Engine_config engine_config;
	engine_config.from_string(config);
	return engine_config;
}
