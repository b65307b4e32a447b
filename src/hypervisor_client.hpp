/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef HYPERVISOR_CLIENT_HPP
#define HYPERVISOR_CLIENT_HPP

#include "vm_types.hpp"

#include <boost/optional.hpp>

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * \brief Raised by Hypervisor_client implementations.
 *
 * The category lets the Connection_manager decide between reconnecting, reporting a missing domain or
 * wrapping the failure as an operation error.
 */
class Hypervisor_error :
	public std::runtime_error
{
public:
	enum class Category
	{
		connection,
		no_domain,
		operation
	};

	Hypervisor_error(Category category, const std::string &what_arg);

	Category get_category() const;
private:
	Category category;
};

struct Node_info
{
	std::string model;
	unsigned long long memory_kb = 0;
	unsigned int cpus = 0;
	unsigned int mhz = 0;
	unsigned int nodes = 0;
	unsigned int sockets = 0;
	unsigned int cores = 0;
	unsigned int threads = 0;
	std::vector<unsigned long long> cells_free_memory_kb;
};

struct Hypervisor_version
{
	std::string type;
	unsigned long version = 0;
	unsigned long lib_version = 0;
};

// Cumulative cpu counters in nanoseconds.
struct Cpu_stats
{
	unsigned long long cpu_time_ns = 0;
	unsigned long long user_time_ns = 0;
	unsigned long long system_time_ns = 0;
};

// Guest memory as reported by the balloon driver in KiB.
struct Memory_stats
{
	unsigned long long actual_balloon_kb = 0;
	unsigned long long available_kb = 0;
	unsigned long long unused_kb = 0;
	unsigned long long rss_kb = 0;
};

struct Block_stats
{
	long long rd_req = 0;
	long long rd_bytes = 0;
	long long wr_req = 0;
	long long wr_bytes = 0;
	long long errs = 0;
};

struct Interface_stats
{
	long long rx_bytes = 0;
	long long rx_packets = 0;
	long long rx_errs = 0;
	long long rx_drop = 0;
	long long tx_bytes = 0;
	long long tx_packets = 0;
	long long tx_errs = 0;
	long long tx_drop = 0;
};

struct Scheduler_params
{
	boost::optional<unsigned long long> cpu_shares;
	boost::optional<unsigned long long> vcpu_period;
	boost::optional<long long> vcpu_quota;
};

struct Memory_params
{
	boost::optional<unsigned long long> hard_limit_kb;
	boost::optional<unsigned long long> soft_limit_kb;
};

struct Lifecycle_event
{
	std::string name;
	std::string uuid;
	// One of defined, undefined, started, suspended, resumed, stopped, shutdown, pmsuspended or crashed.
	std::string type;
	int detail = 0;
};

using Lifecycle_callback = std::function<void(const Lifecycle_event &)>;

/**
 * \brief An abstract class to provide an interface for the native virtualization API.
 *
 * Domains are addressed by uuid once they have been looked up.
 * Implementations are not required to be thread safe, the Connection_manager serializes all calls.
 * Failures are reported as Hypervisor_error.
 */
class Hypervisor_client
{
public:
	/**
	 * \brief Default virtual destructor.
	 */
	virtual ~Hypervisor_client() = default;

	/**
	 * \brief Open a connection to the hypervisor.
	 *
	 * \param uri The uri of the hypervisor (e.g., qemu:///system).
	 */
	virtual void open(const std::string &uri) = 0;
	/**
	 * \brief Close the connection, does nothing if not open.
	 */
	virtual void close() noexcept = 0;
	virtual bool is_open() const = 0;

	virtual std::string get_hostname() = 0;
	virtual Node_info get_node_info() = 0;
	virtual Hypervisor_version get_version() = 0;

	/**
	 * \brief List all domains, defined and active.
	 *
	 * \param active_only Only list running, paused or otherwise active domains.
	 */
	virtual std::vector<Domain_info> list_domains(bool active_only = false) = 0;
	/**
	 * \brief Look up a domain.
	 *
	 * \returns boost::none if no such domain exists.
	 */
	virtual boost::optional<Domain_info> lookup_by_name(const std::string &name) = 0;
	virtual boost::optional<Domain_info> lookup_by_uuid(const std::string &uuid) = 0;
	virtual std::string get_xml_desc(const std::string &uuid) = 0;

	/**
	 * \brief Define a persistent domain without starting it.
	 *
	 * \returns The info of the defined domain.
	 */
	virtual Domain_info define_xml(const std::string &xml) = 0;
	virtual void create(const std::string &uuid) = 0;
	virtual void destroy(const std::string &uuid) = 0;
	virtual void shutdown(const std::string &uuid) = 0;
	virtual void suspend(const std::string &uuid) = 0;
	virtual void resume(const std::string &uuid) = 0;
	/**
	 * \brief Undefine a domain together with its managed save image and snapshot metadata.
	 */
	virtual void undefine(const std::string &uuid) = 0;

	/**
	 * \brief Set the maximum memory of the persistent config.
	 */
	virtual void set_max_memory(const std::string &uuid, unsigned long long memory_kb) = 0;
	/**
	 * \brief Set the current memory.
	 *
	 * \param live Apply to the running domain in addition to the persistent config.
	 */
	virtual void set_memory(const std::string &uuid, unsigned long long memory_kb, bool live) = 0;
	virtual void set_max_vcpus(const std::string &uuid, unsigned int vcpus) = 0;
	virtual void set_vcpus(const std::string &uuid, unsigned int vcpus, bool live) = 0;
	virtual void set_scheduler_params(const std::string &uuid, const Scheduler_params &params) = 0;
	virtual void set_memory_params(const std::string &uuid, const Memory_params &params) = 0;

	virtual Cpu_stats get_cpu_stats(const std::string &uuid) = 0;
	virtual Memory_stats get_memory_stats(const std::string &uuid) = 0;
	virtual Block_stats get_block_stats(const std::string &uuid, const std::string &device) = 0;
	virtual Interface_stats get_interface_stats(const std::string &uuid, const std::string &device) = 0;

	/**
	 * \brief Register a callback for domain lifecycle events.
	 *
	 * Only one callback is registered at a time, a second call replaces the first.
	 * The callback may be invoked from a different thread.
	 */
	virtual void register_lifecycle_callback(Lifecycle_callback callback) = 0;
	virtual void deregister_lifecycle_callback() noexcept = 0;
};

#endif
