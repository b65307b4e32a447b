/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef MONITORING_COLLECTOR_HPP
#define MONITORING_COLLECTOR_HPP

#include "connection_manager.hpp"
#include "event_sink.hpp"
#include "hypervisor_client.hpp"
#include "resource_accountant.hpp"
#include "vm_types.hpp"

#include <fast-lib/serialization/serializable.hpp>
#include <boost/optional.hpp>

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>

/**
 * \brief Snapshot of a vm.
 *
 * Identity, state, memory and vcpus are reported in every state. The cumulative counters of cpu,
 * memory, disks and interfaces as well as the uptime are only filled while the vm is running.
 */
struct Vm_metrics :
	public fast::Serializable
{
	std::string name;
	std::string uuid;
	std::string timestamp;
	Vm_state state = Vm_state::undefined;
	unsigned long long max_memory_kb = 0;
	unsigned long long memory_kb = 0;
	unsigned int vcpus = 0;
	boost::optional<unsigned long long> uptime_s;
	Cpu_stats cpu;
	unsigned long long memory_total_kb = 0;
	unsigned long long memory_available_kb = 0;
	unsigned long long memory_used_kb = 0;
	// Keyed by target device (e.g. vda, vnet0).
	std::map<std::string, Block_stats> disks;
	std::map<std::string, Interface_stats> interfaces;

	YAML::Node emit() const override;
	void load(const YAML::Node &node) override;
};
YAML_CONVERT_IMPL(Vm_metrics)

struct Host_metrics :
	public fast::Serializable
{
	std::string hostname;
	std::string timestamp;
	std::string arch;
	unsigned int cpus = 0;
	unsigned long long memory_kb = 0;
	unsigned int active_vms = 0;
	unsigned int total_vms = 0;
	unsigned long long allocated_vcpus = 0;
	unsigned long long allocated_memory_kb = 0;
	std::string hypervisor_type;
	unsigned long hypervisor_version = 0;
	unsigned long library_version = 0;

	YAML::Node emit() const override;
	void load(const YAML::Node &node) override;
};
YAML_CONVERT_IMPL(Host_metrics)

/**
 * \brief Polls metrics of all running vms and the host and publishes them.
 *
 * Every interval a vm_metrics event is published per running vm and one host_metrics event.
 * host_alert events are raised if the hypervisor is unreachable or the allocation crosses its thresholds.
 * Counters are cumulative, no rates are computed.
 * Failures of single vms, devices or publishes are logged and skipped.
 */
class Monitoring_collector
{
public:
	struct Options
	{
		std::chrono::milliseconds interval = std::chrono::milliseconds(5000);
		// Forward hypervisor lifecycle events as vm_status_changed.
		bool lifecycle_events = false;
		// Percentage of host memory allocated to domains which raises a warning.
		double memory_alert_threshold = 90.0;
	};

	Monitoring_collector(Connection_manager &connection, Resource_accountant &accountant, Event_sink &events,
			Options options);
	/**
	 * \brief Stops the polling thread.
	 */
	~Monitoring_collector();

	/**
	 * \brief Start the polling thread and subscribe to lifecycle events if enabled.
	 */
	void start();
	void stop() noexcept;
	bool is_running();

	/**
	 * \brief Run one collection round. Never throws.
	 */
	void tick() noexcept;

	/**
	 * \brief Collect the metrics of a single vm on demand.
	 *
	 * A vm which is not running gets a snapshot without counters.
	 */
	Vm_metrics collect_vm_metrics(const Vm_id &id);
	Host_metrics collect_host_metrics();
private:
	void run();
	Vm_metrics collect(const Domain_info &info);
	void check_alerts(const Host_metrics &host);
	void publish_alert(const std::string &severity, const std::string &message);
	void forward(const Lifecycle_event &event);

	Connection_manager &connection;
	Resource_accountant &accountant;
	Event_sink &events;
	const Options options;

	std::mutex mutex;
	std::condition_variable cv;
	bool running;
	std::thread poller;
};

#endif
