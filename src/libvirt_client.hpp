/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef LIBVIRT_CLIENT_HPP
#define LIBVIRT_CLIENT_HPP

#include "hypervisor_client.hpp"

#include <libvirt/libvirt.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

/**
 * \brief Implementation of the Hypervisor_client interface using libvirt.
 *
 * Holds one virConnect handle. Lifecycle events are dispatched by the libvirt default event loop which runs
 * in a dedicated thread as long as a callback is registered.
 */
class Libvirt_client :
	public Hypervisor_client
{
public:
	Libvirt_client();
	~Libvirt_client();

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
private:
	static int lifecycle_event_handler(virConnectPtr conn, virDomainPtr domain, int event, int detail, void *opaque);

	virConnectPtr connection() const;
	void start_event_loop();
	void stop_event_loop() noexcept;

	std::shared_ptr<virConnect> conn;
	std::string uri;
	int callback_id;
	std::mutex callback_mutex;
	Lifecycle_callback callback;
	std::atomic<bool> event_loop_running;
	std::thread event_loop_thread;
};

#endif
