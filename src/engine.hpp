/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef ENGINE_HPP
#define ENGINE_HPP

#include "config.hpp"
#include "connection_manager.hpp"
#include "event_sink.hpp"
#include "hypervisor_client.hpp"
#include "monitoring_collector.hpp"
#include "resource_accountant.hpp"
#include "storage_backend.hpp"
#include "template_generator.hpp"
#include "time_measurement.hpp"
#include "vm_lifecycle_controller.hpp"
#include "vm_lock_registry.hpp"
#include "vm_spec.hpp"
#include "vm_types.hpp"

#include <boost/optional.hpp>

#include <memory>
#include <string>
#include <vector>

/**
 * \brief The orchestration engine.
 *
 * Owns one instance of every component and wires them together. Constructed once by the application
 * and handed to whoever needs it.
 */
class Engine
{
public:
	/**
	 * \brief Build all components from the configuration.
	 *
	 * \param events The sink for notification events.
	 */
	Engine(const Engine_config &config, std::shared_ptr<Event_sink> events);
	/**
	 * \brief Build the engine around given hypervisor client and storage backend.
	 */
	Engine(const Engine_config &config, std::unique_ptr<Hypervisor_client> client,
			std::unique_ptr<Storage_backend> storage, std::shared_ptr<Event_sink> events);
	/**
	 * \brief Stops monitoring and disconnects.
	 */
	~Engine();

	Engine(const Engine &) = delete;
	Engine & operator=(const Engine &) = delete;

	Operation_result create_vm(const Vm_spec &spec, Time_measurement time_measurement = Time_measurement());
	Operation_result start_vm(const Vm_id &id, Time_measurement time_measurement = Time_measurement());
	Operation_result stop_vm(const Vm_id &id, bool force, Time_measurement time_measurement = Time_measurement());
	Operation_result restart_vm(const Vm_id &id, bool force, Time_measurement time_measurement = Time_measurement());
	Operation_result pause_vm(const Vm_id &id, Time_measurement time_measurement = Time_measurement());
	Operation_result resume_vm(const Vm_id &id, Time_measurement time_measurement = Time_measurement());
	Operation_result delete_vm(const Vm_id &id, bool delete_disks, Time_measurement time_measurement = Time_measurement());
	Operation_result clone_vm(const Vm_id &source, const std::string &new_name, const std::string &new_uuid,
			Time_measurement time_measurement = Time_measurement());
	Operation_result resize_vm(const Vm_id &id, boost::optional<int> cpu_cores, boost::optional<long long> memory_mb,
			bool live, Time_measurement time_measurement = Time_measurement());
	Operation_result set_vm_limits(const Vm_id &id, const Limits_config &limits,
			Time_measurement time_measurement = Time_measurement());

	std::vector<Vm_summary> list_vms();
	Vm_status get_vm_status(const Vm_id &id);
	Vm_metrics get_vm_metrics(const Vm_id &id);
	Host_metrics get_host_metrics();
	Resource_limits get_resource_limits();
	Validation_result validate_resources(const Vm_spec &spec);
	Health_status health_check();

	/**
	 * \brief Start the monitoring thread if enabled in the configuration.
	 */
	void start_monitoring();
	void stop_monitoring();

	Connection_manager & get_connection_manager();
	Resource_accountant & get_resource_accountant();
	Monitoring_collector & get_monitoring_collector();
private:
	const Engine_config config;
	std::shared_ptr<Event_sink> events;
	std::unique_ptr<Storage_backend> storage;
	std::unique_ptr<Connection_manager> connection;
	Template_generator templates;
	Vm_lock_registry locks;
	std::unique_ptr<Resource_accountant> accountant;
	std::unique_ptr<Vm_lifecycle_controller> controller;
	std::unique_ptr<Monitoring_collector> monitor;
};

/**
 * \brief Create the hypervisor client named in the configuration.
 */
std::unique_ptr<Hypervisor_client> make_hypervisor_client(const Hypervisor_config &config);
/**
 * \brief Create the storage backend named in the configuration.
 */
std::unique_ptr<Storage_backend> make_storage_backend(const Storage_config &config);

#endif
