/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef DUMMY_CLIENT_HPP
#define DUMMY_CLIENT_HPP

#include "hypervisor_client.hpp"

#include <map>
#include <mutex>
#include <string>
#include <vector>

/**
 * \brief Implementation of the Hypervisor_client interface simulating a host in memory.
 *
 * Domains are kept in a map and follow the same state transitions as with libvirt.
 * A graceful shutdown settles after a configurable number of state queries.
 * Failures can be injected per operation and the whole hypervisor can be made unreachable.
 * Only for test purposes.
 */
class Dummy_client :
	public Hypervisor_client
{
public:
	/**
	 * \brief Constructor of Dummy_client.
	 *
	 * \param node The capacity of the simulated host.
	 * \param hostname The hostname reported by the simulated hypervisor.
	 */
	explicit Dummy_client(Node_info node, std::string hostname = "dummy-host");

	void open(const std::string &uri) override;
	void close() noexcept override;
	bool is_open() const override;

	std::string get_hostname() override;
	Node_info get_node_info() override;
	Hypervisor_version get_version() override;

	std::vector<Domain_info> list_domains(bool active_only) override;
	boost::optional<Domain_info> lookup_by_name(const std::string &name) override;
	boost::optional<Domain_info> lookup_by_uuid(const std::string &uuid) override;
	std::string get_xml_desc(const std::string &uuid) override;

	Domain_info define_xml(const std::string &xml) override;
	void create(const std::string &uuid) override;
	void destroy(const std::string &uuid) override;
	void shutdown(const std::string &uuid) override;
	void suspend(const std::string &uuid) override;
	void resume(const std::string &uuid) override;
	void undefine(const std::string &uuid) override;

	void set_max_memory(const std::string &uuid, unsigned long long memory_kb) override;
	void set_memory(const std::string &uuid, unsigned long long memory_kb, bool live) override;
	void set_max_vcpus(const std::string &uuid, unsigned int vcpus) override;
	void set_vcpus(const std::string &uuid, unsigned int vcpus, bool live) override;
	void set_scheduler_params(const std::string &uuid, const Scheduler_params &params) override;
	void set_memory_params(const std::string &uuid, const Memory_params &params) override;

	Cpu_stats get_cpu_stats(const std::string &uuid) override;
	Memory_stats get_memory_stats(const std::string &uuid) override;
	Block_stats get_block_stats(const std::string &uuid, const std::string &device) override;
	Interface_stats get_interface_stats(const std::string &uuid, const std::string &device) override;

	void register_lifecycle_callback(Lifecycle_callback callback) override;
	void deregister_lifecycle_callback() noexcept override;

	//
	// Test controls
	//

	// While unreachable every call fails with a connection error.
	void set_reachable(bool reachable);
	// Let the next call of operation (e.g. "create") fail.
	void fail_next(const std::string &operation, Hypervisor_error::Category category = Hypervisor_error::Category::operation);
	// Number of state queries until a graceful shutdown has finished, 0 lets the guest ignore it.
	void set_shutdown_delay(unsigned int state_queries);
	// Number of calls of operation since construction.
	unsigned int call_count(const std::string &operation) const;
	unsigned int open_count() const;
	// All calls in the order they were made.
	std::vector<std::string> call_history() const;
	// Crash a running domain. It keeps running as far as the hypervisor is concerned, like on_crash=preserve.
	void set_crashed(const std::string &uuid);
	Scheduler_params get_scheduler_params(const std::string &uuid) const;
	Memory_params get_memory_params(const std::string &uuid) const;
private:
	struct Dummy_domain
	{
		Domain_info info;
		std::string xml;
		// Remaining state queries until a pending shutdown finishes.
		unsigned int shutdown_countdown = 0;
		bool shutdown_pending = false;
		Scheduler_params scheduler_params;
		Memory_params memory_params;
		unsigned long long stats_counter = 0;
	};

	// Count the call and throw if unreachable or a failure was injected. Expects mutex to be locked.
	void enter(const std::string &operation);
	// Expects mutex to be locked.
	Dummy_domain & get_domain(const std::string &uuid);
	// Advance pending shutdowns. Expects mutex to be locked.
	void settle(Dummy_domain &domain);
	void notify(const std::string &type, const Domain_info &info);

	mutable std::mutex mutex;
	Node_info node;
	std::string hostname;
	bool opened;
	bool reachable;
	unsigned int opens;
	unsigned int shutdown_delay;
	unsigned int next_interface;
	std::map<std::string, Dummy_domain> domains;
	std::map<std::string, Hypervisor_error::Category> injected_failures;
	std::map<std::string, unsigned int> calls;
	std::vector<std::string> history;
	Lifecycle_callback callback;
};

#endif
