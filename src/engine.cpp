/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "engine.hpp"

#include "dummy_client.hpp"
#include "dummy_storage.hpp"
#include "libvirt_client.hpp"

#include <fast-lib/log.hpp>

#include <stdexcept>
#include <utility>

FASTLIB_LOG_INIT(engine_log, "Engine")
FASTLIB_LOG_SET_LEVEL_GLOBAL(engine_log, trace);

std::unique_ptr<Hypervisor_client> make_hypervisor_client(const Hypervisor_config &config)
{
	if (config.type == "libvirt")
		return std::unique_ptr<Hypervisor_client>(new Libvirt_client());
	if (config.type == "dummy") {
		Node_info node;
		node.model = "x86_64";
		node.cpus = config.dummy_cpus;
		node.memory_kb = config.dummy_memory_mb * 1024;
		node.mhz = 2400;
		node.nodes = 1;
		node.sockets = 1;
		node.cores = config.dummy_cpus;
		node.threads = 1;
		node.cells_free_memory_kb = {node.memory_kb};
		return std::unique_ptr<Hypervisor_client>(new Dummy_client(node));
	}
	throw std::invalid_argument("Unknown hypervisor type: " + config.type);
}

std::unique_ptr<Storage_backend> make_storage_backend(const Storage_config &config)
{
	if (config.type == "qemu-img")
		return std::unique_ptr<Storage_backend>(new Image_storage(config.path));
	if (config.type == "dummy")
		return std::unique_ptr<Storage_backend>(new Dummy_storage(config.path, config.dummy_capacity_gb * 1024 * 1024 * 1024));
	throw std::invalid_argument("Unknown storage type: " + config.type);
}

Engine::Engine(const Engine_config &config, std::shared_ptr<Event_sink> events) :
	Engine(config, make_hypervisor_client(config.hypervisor), make_storage_backend(config.storage), std::move(events))
{
}

Engine::Engine(const Engine_config &config, std::unique_ptr<Hypervisor_client> client,
		std::unique_ptr<Storage_backend> storage, std::shared_ptr<Event_sink> events) :
	config(config),
	events(std::move(events)),
	storage(std::move(storage)),
	connection(new Connection_manager(std::move(client), config.hypervisor.uri, config.hypervisor.liveness_interval)),
	templates(this->storage ? this->storage->get_storage_path() : "", config.domain)
{
	if (!this->events || !this->storage)
		throw std::invalid_argument("Engine requires an event sink and a storage backend.");
	accountant.reset(new Resource_accountant(*connection, *this->storage,
			config.resources.vcpu_overcommit_ratio, config.resources.allocation_cache_ttl));
	controller.reset(new Vm_lifecycle_controller(*connection, *accountant, *this->storage, templates, locks,
			*this->events, config.hypervisor.stop_timeout));
	Monitoring_collector::Options monitoring_options;
	monitoring_options.interval = config.monitoring.interval;
	monitoring_options.lifecycle_events = config.monitoring.lifecycle_events;
	monitoring_options.memory_alert_threshold = config.monitoring.memory_alert_threshold;
	monitor.reset(new Monitoring_collector(*connection, *accountant, *this->events, monitoring_options));
	FASTLIB_LOG(engine_log, trace) << "Engine for " << config.hypervisor.uri << " ready.";
}

Engine::~Engine()
{
	monitor->stop();
	connection->disconnect();
}

Operation_result Engine::create_vm(const Vm_spec &spec, Time_measurement time_measurement)
{
	return controller->create(spec, std::move(time_measurement));
}

Operation_result Engine::start_vm(const Vm_id &id, Time_measurement time_measurement)
{
	return controller->start(id, std::move(time_measurement));
}

Operation_result Engine::stop_vm(const Vm_id &id, bool force, Time_measurement time_measurement)
{
	return controller->stop(id, force, std::move(time_measurement));
}

Operation_result Engine::restart_vm(const Vm_id &id, bool force, Time_measurement time_measurement)
{
	return controller->restart(id, force, std::move(time_measurement));
}

Operation_result Engine::pause_vm(const Vm_id &id, Time_measurement time_measurement)
{
	return controller->pause(id, std::move(time_measurement));
}

Operation_result Engine::resume_vm(const Vm_id &id, Time_measurement time_measurement)
{
	return controller->resume(id, std::move(time_measurement));
}

Operation_result Engine::delete_vm(const Vm_id &id, bool delete_disks, Time_measurement time_measurement)
{
	return controller->remove(id, delete_disks, std::move(time_measurement));
}

Operation_result Engine::clone_vm(const Vm_id &source, const std::string &new_name, const std::string &new_uuid,
		Time_measurement time_measurement)
{
	return controller->clone(source, new_name, new_uuid, std::move(time_measurement));
}

Operation_result Engine::resize_vm(const Vm_id &id, boost::optional<int> cpu_cores, boost::optional<long long> memory_mb,
		bool live, Time_measurement time_measurement)
{
	return controller->resize(id, cpu_cores, memory_mb, live, std::move(time_measurement));
}

Operation_result Engine::set_vm_limits(const Vm_id &id, const Limits_config &limits, Time_measurement time_measurement)
{
	return controller->set_limits(id, limits, std::move(time_measurement));
}

std::vector<Vm_summary> Engine::list_vms()
{
	return controller->list();
}

Vm_status Engine::get_vm_status(const Vm_id &id)
{
	return controller->status(id);
}

Vm_metrics Engine::get_vm_metrics(const Vm_id &id)
{
	return monitor->collect_vm_metrics(id);
}

Host_metrics Engine::get_host_metrics()
{
	return monitor->collect_host_metrics();
}

Resource_limits Engine::get_resource_limits()
{
	return accountant->limits();
}

Validation_result Engine::validate_resources(const Vm_spec &spec)
{
	return accountant->validate(spec);
}

Health_status Engine::health_check()
{
	return connection->health_check();
}

void Engine::start_monitoring()
{
	if (config.monitoring.enabled)
		monitor->start();
}

void Engine::stop_monitoring()
{
	monitor->stop();
}

Connection_manager & Engine::get_connection_manager()
{
	return *connection;
}

Resource_accountant & Engine::get_resource_accountant()
{
	return *accountant;
}

Monitoring_collector & Engine::get_monitoring_collector()
{
	return *monitor;
}
