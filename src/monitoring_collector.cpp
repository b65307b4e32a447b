/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "monitoring_collector.hpp"

#include "domain_xml.hpp"
#include "errors.hpp"
#include "serialization_utility.hpp"
#include "utility.hpp"

#include <fast-lib/log.hpp>

#include <exception>
#include <stdexcept>
#include <utility>

FASTLIB_LOG_INIT(monitoring_log, "Monitoring_collector")
FASTLIB_LOG_SET_LEVEL_GLOBAL(monitoring_log, trace);

YAML::Node emit_block_stats(const Block_stats &stats)
{
	YAML::Node node;
	node["rd-req"] = stats.rd_req;
	node["rd-bytes"] = stats.rd_bytes;
	node["wr-req"] = stats.wr_req;
	node["wr-bytes"] = stats.wr_bytes;
	node["errs"] = stats.errs;
	return node;
}

Block_stats load_block_stats(const YAML::Node &node)
{
	Block_stats stats;
	load_field(stats.rd_req, node["rd-req"]);
	load_field(stats.rd_bytes, node["rd-bytes"]);
	load_field(stats.wr_req, node["wr-req"]);
	load_field(stats.wr_bytes, node["wr-bytes"]);
	load_field(stats.errs, node["errs"]);
	return stats;
}

YAML::Node emit_interface_stats(const Interface_stats &stats)
{
	YAML::Node node;
	node["rx-bytes"] = stats.rx_bytes;
	node["rx-packets"] = stats.rx_packets;
	node["rx-errs"] = stats.rx_errs;
	node["rx-drop"] = stats.rx_drop;
	node["tx-bytes"] = stats.tx_bytes;
	node["tx-packets"] = stats.tx_packets;
	node["tx-errs"] = stats.tx_errs;
	node["tx-drop"] = stats.tx_drop;
	return node;
}

Interface_stats load_interface_stats(const YAML::Node &node)
{
	Interface_stats stats;
	load_field(stats.rx_bytes, node["rx-bytes"]);
	load_field(stats.rx_packets, node["rx-packets"]);
	load_field(stats.rx_errs, node["rx-errs"]);
	load_field(stats.rx_drop, node["rx-drop"]);
	load_field(stats.tx_bytes, node["tx-bytes"]);
	load_field(stats.tx_packets, node["tx-packets"]);
	load_field(stats.tx_errs, node["tx-errs"]);
	load_field(stats.tx_drop, node["tx-drop"]);
	return stats;
}

YAML::Node Vm_metrics::emit() const
{
	YAML::Node node;
	node["vm-name"] = name;
	node["uuid"] = uuid;
	node["timestamp"] = timestamp;
	node["state"] = ::to_string(state);
	node["max-memory-kb"] = max_memory_kb;
	node["memory-kb"] = memory_kb;
	node["vcpus"] = vcpus;
	emit_optional(node, "uptime-s", uptime_s);
	node["cpu"]["time-ns"] = cpu.cpu_time_ns;
	node["cpu"]["user-ns"] = cpu.user_time_ns;
	node["cpu"]["system-ns"] = cpu.system_time_ns;
	node["memory"]["total-kb"] = memory_total_kb;
	node["memory"]["available-kb"] = memory_available_kb;
	node["memory"]["used-kb"] = memory_used_kb;
	node["disks"] = YAML::Node(YAML::NodeType::Map);
	for (const auto &disk : disks)
		node["disks"][disk.first] = emit_block_stats(disk.second);
	node["interfaces"] = YAML::Node(YAML::NodeType::Map);
	for (const auto &interface : interfaces)
		node["interfaces"][interface.first] = emit_interface_stats(interface.second);
	return node;
}

void Vm_metrics::load(const YAML::Node &node)
{
	load_field(name, node["vm-name"]);
	load_field(uuid, node["uuid"]);
	load_field(timestamp, node["timestamp"]);
	state = vm_state_from_string(node["state"].as<std::string>());
	load_field(max_memory_kb, node["max-memory-kb"], 0);
	load_field(memory_kb, node["memory-kb"], 0);
	load_field(vcpus, node["vcpus"], 0);
	load_field(uptime_s, node["uptime-s"]);
	load_field(cpu.cpu_time_ns, node["cpu"]["time-ns"]);
	load_field(cpu.user_time_ns, node["cpu"]["user-ns"]);
	load_field(cpu.system_time_ns, node["cpu"]["system-ns"]);
	load_field(memory_total_kb, node["memory"]["total-kb"]);
	load_field(memory_available_kb, node["memory"]["available-kb"]);
	load_field(memory_used_kb, node["memory"]["used-kb"]);
	disks.clear();
	for (const auto &disk : node["disks"])
		disks[disk.first.as<std::string>()] = load_block_stats(disk.second);
	interfaces.clear();
	for (const auto &interface : node["interfaces"])
		interfaces[interface.first.as<std::string>()] = load_interface_stats(interface.second);
}

YAML::Node Host_metrics::emit() const
{
	YAML::Node node;
	node["hostname"] = hostname;
	node["timestamp"] = timestamp;
	node["arch"] = arch;
	node["cpus"] = cpus;
	node["memory-kb"] = memory_kb;
	node["active-vms"] = active_vms;
	node["total-vms"] = total_vms;
	node["allocated-vcpus"] = allocated_vcpus;
	node["allocated-memory-kb"] = allocated_memory_kb;
	node["hypervisor-type"] = hypervisor_type;
	node["hypervisor-version"] = hypervisor_version;
	node["library-version"] = library_version;
	return node;
}

void Host_metrics::load(const YAML::Node &node)
{
	load_field(hostname, node["hostname"]);
	load_field(timestamp, node["timestamp"]);
	load_field(arch, node["arch"]);
	load_field(cpus, node["cpus"]);
	load_field(memory_kb, node["memory-kb"]);
	load_field(active_vms, node["active-vms"]);
	load_field(total_vms, node["total-vms"]);
	load_field(allocated_vcpus, node["allocated-vcpus"]);
	load_field(allocated_memory_kb, node["allocated-memory-kb"]);
	load_field(hypervisor_type, node["hypervisor-type"]);
	load_field(hypervisor_version, node["hypervisor-version"]);
	load_field(library_version, node["library-version"]);
}

// State a vm is in after a lifecycle event.
Vm_state state_after_event(const std::string &type)
{
	if (type == "started" || type == "resumed")
		return Vm_state::running;
	if (type == "defined" || type == "stopped")
		return Vm_state::stopped;
	if (type == "suspended")
		return Vm_state::paused;
	if (type == "shutdown")
		return Vm_state::stopping;
	if (type == "pmsuspended")
		return Vm_state::suspended;
	if (type == "undefined")
		return Vm_state::undefined;
	return Vm_state::error;
}

Monitoring_collector::Monitoring_collector(Connection_manager &connection, Resource_accountant &accountant,
		Event_sink &events, Options options) :
	connection(connection),
	accountant(accountant),
	events(events),
	options(options),
	running(false)
{
	if (options.interval.count() <= 0)
		throw std::invalid_argument("Monitoring interval must be positive.");
}

Monitoring_collector::~Monitoring_collector()
{
	stop();
}

void Monitoring_collector::start()
{
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (running)
			return;
		running = true;
	}
	if (options.lifecycle_events) {
		try {
			connection.subscribe_lifecycle_events([this](const Lifecycle_event &event) {forward(event);});
		} catch (const Engine_error &e) {
			FASTLIB_LOG(monitoring_log, warn) << "Lifecycle events unavailable: " << e.what();
		}
	}
	FASTLIB_LOG(monitoring_log, trace) << "Start polling every " << options.interval.count() << "ms.";
	poller = std::thread(&Monitoring_collector::run, this);
}

void Monitoring_collector::stop() noexcept
{
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (!running)
			return;
		running = false;
	}
	cv.notify_all();
	if (poller.joinable())
		poller.join();
	if (options.lifecycle_events)
		connection.unsubscribe_lifecycle_events();
	FASTLIB_LOG(monitoring_log, trace) << "Polling stopped.";
}

bool Monitoring_collector::is_running()
{
	std::lock_guard<std::mutex> lock(mutex);
	return running;
}

void Monitoring_collector::run()
{
	std::unique_lock<std::mutex> lock(mutex);
	while (running) {
		lock.unlock();
		tick();
		lock.lock();
		cv.wait_for(lock, options.interval, [this] {return !running;});
	}
}

void Monitoring_collector::tick() noexcept
{
	try {
		auto domains = connection.execute("list running domains", [](Hypervisor_client &client)
		{
			return client.list_domains(true);
		});
		for (const auto &domain : domains) {
			if (domain.state != Vm_state::running)
				continue;
			try {
				auto metrics = collect(domain);
				publish_nothrow(events, Event("vm_metrics", domain.name, domain.uuid, metrics.emit()));
			} catch (const Connection_error &) {
				throw;
			} catch (const Engine_error &e) {
				FASTLIB_LOG(monitoring_log, debug) << "Skip metrics of " << domain.name << ": " << e.what();
			}
		}
		auto host = collect_host_metrics();
		publish_nothrow(events, Event("host_metrics", "", "", host.emit()));
		check_alerts(host);
	} catch (const Connection_error &e) {
		FASTLIB_LOG(monitoring_log, warn) << "Hypervisor unreachable: " << e.what();
		publish_alert("critical", std::string("Hypervisor unreachable: ") + e.what());
	} catch (const std::exception &e) {
		FASTLIB_LOG(monitoring_log, warn) << "Metrics collection failed: " << e.what();
	}
}

Vm_metrics make_basic_metrics(const Domain_info &info)
{
	Vm_metrics metrics;
	metrics.name = info.name;
	metrics.uuid = info.uuid;
	metrics.timestamp = get_timestamp();
	metrics.state = info.state;
	metrics.max_memory_kb = info.max_memory_kb;
	metrics.memory_kb = info.memory_kb;
	metrics.vcpus = info.vcpus;
	metrics.cpu.cpu_time_ns = info.cpu_time_ns;
	return metrics;
}

Vm_metrics Monitoring_collector::collect(const Domain_info &info)
{
	auto metrics = make_basic_metrics(info);
	auto xml = connection.execute("collect metrics of", info.name, [&info](Hypervisor_client &client)
	{
		return client.get_xml_desc(info.uuid);
	});
	Domain_manifest manifest;
	try {
		manifest = parse_domain_manifest(xml);
	} catch (const Template_error &e) {
		throw Operation_error("collect metrics of", info.name, e.what());
	}
	metrics.cpu = connection.execute("collect metrics of", info.name, [&info](Hypervisor_client &client)
	{
		return client.get_cpu_stats(info.uuid);
	});
	// Estimated at an average load of 10% per vcpu.
	if (info.vcpus != 0)
		metrics.uptime_s = metrics.cpu.cpu_time_ns / (info.vcpus * 100000000ULL);
	try {
		auto memory = connection.execute("collect metrics of", info.name, [&info](Hypervisor_client &client)
		{
			return client.get_memory_stats(info.uuid);
		});
		metrics.memory_total_kb = memory.actual_balloon_kb;
		metrics.memory_available_kb = memory.available_kb != 0 ? memory.available_kb : memory.actual_balloon_kb;
		if (memory.unused_kb != 0 && memory.unused_kb <= metrics.memory_available_kb)
			metrics.memory_used_kb = metrics.memory_available_kb - memory.unused_kb;
		else
			metrics.memory_used_kb = memory.rss_kb;
	} catch (const Operation_error &e) {
		FASTLIB_LOG(monitoring_log, debug) << "No memory stats of " << info.name << ": " << e.what();
	}
	for (const auto &disk : manifest.disks) {
		if (disk.target.empty())
			continue;
		try {
			metrics.disks[disk.target] = connection.execute("collect metrics of", info.name, [&](Hypervisor_client &client)
			{
				return client.get_block_stats(info.uuid, disk.target);
			});
		} catch (const Operation_error &e) {
			FASTLIB_LOG(monitoring_log, debug) << "No block stats of " << info.name << "/" << disk.target << ": " << e.what();
		}
	}
	for (const auto &interface : manifest.interfaces) {
		if (interface.target.empty())
			continue;
		try {
			metrics.interfaces[interface.target] = connection.execute("collect metrics of", info.name, [&](Hypervisor_client &client)
			{
				return client.get_interface_stats(info.uuid, interface.target);
			});
		} catch (const Operation_error &e) {
			FASTLIB_LOG(monitoring_log, debug) << "No interface stats of " << info.name << "/" << interface.target << ": " << e.what();
		}
	}
	return metrics;
}

Vm_metrics Monitoring_collector::collect_vm_metrics(const Vm_id &id)
{
	auto info = connection.lookup(id);
	if (info.state != Vm_state::running)
		return make_basic_metrics(info);
	return collect(info);
}

Host_metrics Monitoring_collector::collect_host_metrics()
{
	Host_metrics host;
	host.timestamp = get_timestamp();
	auto version = connection.execute("collect host metrics", [&host](Hypervisor_client &client)
	{
		host.hostname = client.get_hostname();
		return client.get_version();
	});
	host.hypervisor_type = version.type;
	host.hypervisor_version = version.version;
	host.library_version = version.lib_version;
	auto capacity = accountant.host_capacity();
	host.arch = capacity.arch;
	host.cpus = capacity.cpus;
	host.memory_kb = capacity.memory_kb;
	auto allocated = accountant.allocated();
	host.active_vms = allocated.active_domains;
	host.total_vms = allocated.total_domains;
	host.allocated_vcpus = allocated.vcpus;
	host.allocated_memory_kb = allocated.memory_kb;
	return host;
}

void Monitoring_collector::check_alerts(const Host_metrics &host)
{
	if (host.memory_kb != 0) {
		auto percent = 100.0 * host.allocated_memory_kb / host.memory_kb;
		if (percent >= options.memory_alert_threshold)
			publish_alert("warning", "Allocated memory at " + std::to_string(static_cast<int>(percent)) + "% of host memory");
	}
	auto vcpu_limit = static_cast<unsigned long long>(host.cpus * accountant.get_vcpu_overcommit_ratio());
	if (host.allocated_vcpus > vcpu_limit)
		publish_alert("warning", "Allocated vCPUs (" + std::to_string(host.allocated_vcpus) + ") exceed overcommit limit (" + std::to_string(vcpu_limit) + ")");
}

void Monitoring_collector::publish_alert(const std::string &severity, const std::string &message)
{
	YAML::Node data;
	data["severity"] = severity;
	data["message"] = message;
	publish_nothrow(events, Event("host_alert", "", "", data));
}

void Monitoring_collector::forward(const Lifecycle_event &event)
{
	YAML::Node data;
	data["new-state"] = to_string(state_after_event(event.type));
	data["lifecycle-event"] = event.type;
	data["detail"] = event.detail;
	publish_nothrow(events, Event("vm_status_changed", event.name, event.uuid, data));
}
