/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef VM_TYPES_HPP
#define VM_TYPES_HPP

#include "time_measurement.hpp"

#include <fast-lib/serialization/serializable.hpp>
#include <boost/optional.hpp>

#include <string>
#include <vector>

/**
 * \brief Lifecycle state of a virtual machine.
 *
 * The state is never cached, it is always read from the hypervisor when asked for.
 * A domain which is not known to the hypervisor is undefined.
 */
enum class Vm_state
{
	undefined,
	stopped,
	starting,
	running,
	paused,
	suspended,
	stopping,
	error
};

std::string to_string(Vm_state state);

Vm_state vm_state_from_string(const std::string &str);

// True for every state in which the domain occupies a running hypervisor process.
bool is_active(Vm_state state);

/**
 * \brief Identifies a virtual machine by exactly one of name or uuid.
 */
struct Vm_id
{
	/**
	 * \brief Construct from optional name and uuid.
	 *
	 * Throws std::invalid_argument if neither or both are given.
	 */
	Vm_id(boost::optional<std::string> name, boost::optional<std::string> uuid);

	static Vm_id by_name(const std::string &name);
	static Vm_id by_uuid(const std::string &uuid);

	// Human readable form for messages, e.g. "name 'web-1'".
	std::string str() const;
	// The name or uuid, whichever is set.
	const std::string & value() const;

	boost::optional<std::string> name;
	boost::optional<std::string> uuid;
};

/**
 * \brief Snapshot of a domain as reported by the hypervisor.
 */
struct Domain_info
{
	std::string name;
	std::string uuid;
	Vm_state state = Vm_state::undefined;
	int state_reason = 0;
	unsigned long long max_memory_kb = 0;
	unsigned long long memory_kb = 0;
	unsigned int vcpus = 0;
	unsigned int max_vcpus = 0;
	unsigned long long cpu_time_ns = 0;
	bool persistent = true;
	// Reported by the hypervisor, a crashed domain in state error may still be active.
	bool active = false;
};

/**
 * \brief Capacity of the host, read live from the hypervisor.
 */
struct Host_capacity :
	public fast::Serializable
{
	unsigned int cpus = 0;
	unsigned long long memory_kb = 0;
	unsigned int mhz = 0;
	unsigned int numa_nodes = 0;
	std::vector<unsigned long long> numa_free_memory_kb;
	unsigned int sockets = 0;
	unsigned int cores = 0;
	unsigned int threads = 0;
	std::string arch;

	YAML::Node emit() const override;
	void load(const YAML::Node &node) override;
};
YAML_CONVERT_IMPL(Host_capacity)

/**
 * \brief Sum of the configured maximum resources of all defined domains.
 */
struct Allocation_snapshot :
	public fast::Serializable
{
	unsigned long long vcpus = 0;
	unsigned long long memory_kb = 0;
	unsigned int active_domains = 0;
	unsigned int total_domains = 0;

	YAML::Node emit() const override;
	void load(const YAML::Node &node) override;
};
YAML_CONVERT_IMPL(Allocation_snapshot)

/**
 * \brief Remaining resources derived from one capacity/allocation observation.
 *
 * Values are signed since an over-committed host may report negative availability.
 */
struct Available_resources :
	public fast::Serializable
{
	long long vcpus = 0;
	long long overcommitted_vcpus = 0;
	long long memory_kb = 0;
	long long disk_gb = 0;

	YAML::Node emit() const override;
	void load(const YAML::Node &node) override;
};
YAML_CONVERT_IMPL(Available_resources)

/**
 * \brief Limits for a single VM together with current availability.
 */
struct Resource_limits :
	public fast::Serializable
{
	unsigned int max_cpu_cores = 0;
	unsigned long long max_memory_mb = 0;
	unsigned long long max_disk_gb = 0;
	unsigned int max_disks = 0;
	unsigned int max_networks = 0;
	Host_capacity capacity;
	Allocation_snapshot allocated;
	Available_resources available;
	double vcpu_overcommit_ratio = 0.0;

	YAML::Node emit() const override;
	void load(const YAML::Node &node) override;
};
YAML_CONVERT_IMPL(Resource_limits)

/**
 * \brief Aggregated outcome of a validation.
 */
struct Validation_result :
	public fast::Serializable
{
	bool valid = true;
	std::vector<std::string> errors;
	std::vector<std::string> warnings;
	bool insufficient_resources = false;

	void add_error(const std::string &error);
	void add_warning(const std::string &warning);
	// Errors joined with "; ".
	std::string summary() const;

	YAML::Node emit() const override;
	void load(const YAML::Node &node) override;
};
YAML_CONVERT_IMPL(Validation_result)

/**
 * \brief Result of a lifecycle operation.
 */
struct Operation_result :
	public fast::Serializable
{
	Operation_result() = default;
	Operation_result(std::string name, std::string uuid, std::string operation, std::string status);

	std::string name;
	std::string uuid;
	std::string operation;
	std::string status;
	YAML::Node details;
	Time_measurement time_measurement;

	YAML::Node emit() const override;
	void load(const YAML::Node &node) override;
};
YAML_CONVERT_IMPL(Operation_result)

struct Vm_status :
	public fast::Serializable
{
	Vm_status() = default;
	explicit Vm_status(const Domain_info &info);

	std::string name;
	std::string uuid;
	Vm_state state = Vm_state::undefined;
	int state_reason = 0;
	unsigned long long max_memory_kb = 0;
	unsigned long long memory_kb = 0;
	unsigned int vcpus = 0;
	unsigned long long cpu_time_ns = 0;

	YAML::Node emit() const override;
	void load(const YAML::Node &node) override;
};
YAML_CONVERT_IMPL(Vm_status)

struct Vm_summary :
	public fast::Serializable
{
	Vm_summary() = default;
	explicit Vm_summary(const Domain_info &info);

	std::string name;
	std::string uuid;
	Vm_state state = Vm_state::undefined;
	unsigned int vcpus = 0;
	unsigned long long memory_mb = 0;

	YAML::Node emit() const override;
	void load(const YAML::Node &node) override;
};
YAML_CONVERT_IMPL(Vm_summary)

/**
 * \brief Outcome of a connection health check.
 */
struct Health_status :
	public fast::Serializable
{
	bool healthy = false;
	std::string hostname;
	std::string uri;
	unsigned int active_domains = 0;
	unsigned int total_domains = 0;
	std::string error;
	std::string timestamp;

	YAML::Node emit() const override;
	void load(const YAML::Node &node) override;
};
YAML_CONVERT_IMPL(Health_status)

#endif
