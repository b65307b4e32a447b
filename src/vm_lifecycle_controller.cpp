/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "vm_lifecycle_controller.hpp"

#include "domain_xml.hpp"
#include "errors.hpp"

#include <fast-lib/log.hpp>

#include <algorithm>
#include <map>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>

FASTLIB_LOG_INIT(lifecycle_log, "Vm_lifecycle_controller")
FASTLIB_LOG_SET_LEVEL_GLOBAL(lifecycle_log, trace);

/**
 * \brief Removes disk images on destruction unless committed.
 */
class Image_rollback
{
public:
	explicit Image_rollback(Storage_backend &storage) :
		storage(storage),
		committed(false)
	{
	}
	~Image_rollback()
	{
		if (committed)
			return;
		for (const auto &path : paths) {
			try {
				storage.remove_image(path);
				FASTLIB_LOG(lifecycle_log, debug) << "Rolled back disk image " << path << ".";
			} catch (const Storage_error &e) {
				FASTLIB_LOG(lifecycle_log, warn) << "Rollback of disk image " << path << " failed: " << e.what();
			}
		}
	}
	Image_rollback(const Image_rollback &) = delete;
	Image_rollback & operator=(const Image_rollback &) = delete;

	void add(const std::string &path)
	{
		paths.push_back(path);
	}
	void commit()
	{
		committed = true;
	}
	const std::vector<std::string> & get_paths() const
	{
		return paths;
	}
private:
	Storage_backend &storage;
	std::vector<std::string> paths;
	bool committed;
};

std::string base_name(const std::string &path)
{
	auto pos = path.find_last_of('/');
	return pos == std::string::npos ? path : path.substr(pos + 1);
}

Vm_lifecycle_controller::Vm_lifecycle_controller(Connection_manager &connection,
		Resource_accountant &accountant,
		Storage_backend &storage,
		const Template_generator &templates,
		Vm_lock_registry &locks,
		Event_sink &events,
		std::chrono::seconds stop_timeout,
		std::chrono::milliseconds poll_interval) :
	connection(connection),
	accountant(accountant),
	storage(storage),
	templates(templates),
	locks(locks),
	events(events),
	stop_timeout(stop_timeout),
	poll_interval(poll_interval)
{
}

Vm_lock_registry::Vm_lock Vm_lifecycle_controller::lock_vm(const Vm_id &id, Domain_info &info)
{
	info = connection.lookup(id);
	auto lock = locks.lock(info.uuid);
	// The vm may have changed or vanished while waiting for the lock.
	info = refresh(info);
	return lock;
}

Domain_info Vm_lifecycle_controller::refresh(const Domain_info &info)
{
	auto current = connection.find(Vm_id::by_uuid(info.uuid));
	if (!current)
		throw Not_found_error(Vm_id::by_name(info.name));
	return *current;
}

void Vm_lifecycle_controller::publish_state_change(const Domain_info &before, Vm_state after, const std::string &operation)
{
	if (before.state == after)
		return;
	publish_nothrow(events, make_status_changed_event(before.name, before.uuid, before.state, after, operation));
}

void Vm_lifecycle_controller::check_unused(const std::string &operation, const std::string &name, const std::string &uuid)
{
	if (accountant.is_reserved(name) || connection.find(Vm_id::by_name(name)) || connection.find(Vm_id::by_uuid(uuid))) {
		FASTLIB_LOG(lifecycle_log, warn) << "Cannot " << operation << " " << name << " (" << uuid << "): VM already exists.";
		throw Operation_error(operation, name, "VM already exists");
	}
}

Operation_result Vm_lifecycle_controller::create(Vm_spec spec, Time_measurement time_measurement)
{
	time_measurement.tick("overall");
	spec.ensure_uuid();
	FASTLIB_LOG(lifecycle_log, trace) << "Create " << spec.name << " (" << spec.uuid << ").";
	if (spec.name.empty())
		throw std::invalid_argument("VM spec requires a name.");
	auto vm_lock = locks.lock(spec.uuid);
	std::unique_ptr<Resource_reservation> reservation;
	{
		auto pool_lock = accountant.lock_pool();
		check_unused("create", spec.name, spec.uuid);
		Timer_guard guard(time_measurement, "validate");
		auto validation = accountant.validate(spec);
		if (!validation.valid) {
			FASTLIB_LOG(lifecycle_log, warn) << "Rejected " << spec.name << ": " << validation.summary();
			if (validation.insufficient_resources)
				throw Resource_allocation_error(validation);
			throw Validation_error(validation);
		}
		reservation = accountant.reserve(spec.name, spec.cpu.total_vcpus(), spec.memory.size_mb * 1024, spec.total_disk_gb());
	}
	// Disks are created without the pool lock, the reservation keeps the resources and the name.
	Image_rollback rollback(storage);
	Domain_info info;
	try {
		{
			Timer_guard guard(time_measurement, "create-disks");
			for (const auto &disk : spec.disks) {
				auto path = templates.disk_image_path(spec.name, disk);
				storage.create_image(path, disk.format, disk.size_gb, disk.base_image);
				rollback.add(path);
			}
		}
		auto xml = templates.generate(spec);
		Timer_guard guard(time_measurement, "define");
		info = connection.execute("create", spec.name, [&xml](Hypervisor_client &client)
		{
			return client.define_xml(xml);
		});
	} catch (const Storage_error &e) {
		FASTLIB_LOG(lifecycle_log, warn) << "Creating disks of " << spec.name << " failed: " << e.what();
		throw Operation_error("create", spec.name, e.what());
	} catch (const Template_error &e) {
		FASTLIB_LOG(lifecycle_log, warn) << "Generating domain of " << spec.name << " failed: " << e.what();
		throw Operation_error("create", spec.name, e.what());
	}
	rollback.commit();
	accountant.invalidate();
	reservation.reset();

	YAML::Node details;
	details["vcpus"] = info.max_vcpus;
	details["memory-mb"] = info.max_memory_kb / 1024;
	details["disks"] = rollback.get_paths();
	publish_nothrow(events, Event("vm_created", info.name, info.uuid, details));
	publish_state_change(Domain_info{spec.name, spec.uuid}, info.state, "create");
	time_measurement.tock("overall");
	Operation_result result(info.name, info.uuid, "create", "created");
	result.details = details;
	result.time_measurement = std::move(time_measurement);
	return result;
}

Operation_result Vm_lifecycle_controller::start(const Vm_id &id, Time_measurement time_measurement)
{
	time_measurement.tick("overall");
	Domain_info info;
	auto vm_lock = lock_vm(id, info);
	FASTLIB_LOG(lifecycle_log, trace) << "Start " << info.name << ".";
	if (info.state == Vm_state::running) {
		time_measurement.tock("overall");
		Operation_result result(info.name, info.uuid, "start", "already_running");
		result.time_measurement = std::move(time_measurement);
		return result;
	}
	if (info.state != Vm_state::stopped)
		throw State_error(info.name, info.state, Vm_state::stopped);
	{
		Timer_guard guard(time_measurement, "start");
		connection.execute("start", info.name, [&info](Hypervisor_client &client)
		{
			client.create(info.uuid);
		});
	}
	accountant.invalidate();
	auto after = refresh(info);
	publish_state_change(info, after.state, "start");
	time_measurement.tock("overall");
	Operation_result result(info.name, info.uuid, "start", "started");
	result.time_measurement = std::move(time_measurement);
	return result;
}

Operation_result Vm_lifecycle_controller::stop(const Vm_id &id, bool force, Time_measurement time_measurement)
{
	time_measurement.tick("overall");
	Domain_info info;
	auto vm_lock = lock_vm(id, info);
	FASTLIB_LOG(lifecycle_log, trace) << "Stop " << info.name << (force ? " (forced)." : ".");
	std::string status;
	if (info.state == Vm_state::stopped) {
		status = "already_stopped";
	} else if (info.state == Vm_state::stopping && !force) {
		status = "already_stopping";
	} else {
		Timer_guard guard(time_measurement, "stop");
		if (force) {
			connection.execute("stop", info.name, [&info](Hypervisor_client &client)
			{
				client.destroy(info.uuid);
			});
			status = "destroyed";
		} else {
			connection.execute("stop", info.name, [&info](Hypervisor_client &client)
			{
				client.shutdown(info.uuid);
			});
			status = "shutdown";
		}
		accountant.invalidate();
		// A destroyed transient vm is gone.
		auto after = connection.find(Vm_id::by_uuid(info.uuid));
		publish_state_change(info, after ? after->state : Vm_state::undefined, "stop");
	}
	time_measurement.tock("overall");
	Operation_result result(info.name, info.uuid, "stop", status);
	result.time_measurement = std::move(time_measurement);
	return result;
}

Vm_state Vm_lifecycle_controller::wait_for_stopped(const Domain_info &info, std::chrono::milliseconds timeout)
{
	auto start = std::chrono::steady_clock::now();
	auto state = refresh(info).state;
	while (state != Vm_state::stopped) {
		if (std::chrono::steady_clock::now() - start >= timeout)
			break;
		std::this_thread::sleep_for(poll_interval);
		state = refresh(info).state;
	}
	return state;
}

Operation_result Vm_lifecycle_controller::restart(const Vm_id &id, bool force, Time_measurement time_measurement)
{
	time_measurement.tick("overall");
	Domain_info info;
	auto vm_lock = lock_vm(id, info);
	FASTLIB_LOG(lifecycle_log, trace) << "Restart " << info.name << (force ? " (forced)." : ".");
	bool destroyed_after_timeout = false;
	{
		Timer_guard guard(time_measurement, "stop");
		if (info.state != Vm_state::stopped) {
			// A paused or crashed guest does not react to a shutdown request.
			bool graceful = !force && (info.state == Vm_state::running || info.state == Vm_state::stopping);
			if (!graceful) {
				if (!force)
					FASTLIB_LOG(lifecycle_log, debug) << info.name << " is " << to_string(info.state) << ", destroying it.";
				connection.execute("restart", info.name, [&info](Hypervisor_client &client)
				{
					client.destroy(info.uuid);
				});
			} else if (info.state != Vm_state::stopping) {
				connection.execute("restart", info.name, [&info](Hypervisor_client &client)
				{
					client.shutdown(info.uuid);
				});
			}
			auto state = wait_for_stopped(info, stop_timeout);
			if (state != Vm_state::stopped) {
				FASTLIB_LOG(lifecycle_log, warn) << info.name << " did not stop within " << stop_timeout.count() << "s, destroying it.";
				connection.execute("restart", info.name, [&info](Hypervisor_client &client)
				{
					client.destroy(info.uuid);
				});
				destroyed_after_timeout = true;
				state = refresh(info).state;
				if (state != Vm_state::stopped)
					throw State_error(info.name, state, Vm_state::stopped);
			}
		}
	}
	{
		Timer_guard guard(time_measurement, "start");
		connection.execute("restart", info.name, [&info](Hypervisor_client &client)
		{
			client.create(info.uuid);
		});
	}
	accountant.invalidate();
	auto after = refresh(info);
	publish_state_change(info, after.state, "restart");
	time_measurement.tock("overall");
	Operation_result result(info.name, info.uuid, "restart", "restarted");
	result.details["destroyed-after-timeout"] = destroyed_after_timeout;
	result.time_measurement = std::move(time_measurement);
	return result;
}

Operation_result Vm_lifecycle_controller::pause(const Vm_id &id, Time_measurement time_measurement)
{
	time_measurement.tick("overall");
	Domain_info info;
	auto vm_lock = lock_vm(id, info);
	FASTLIB_LOG(lifecycle_log, trace) << "Pause " << info.name << ".";
	Operation_result result(info.name, info.uuid, "pause", "paused");
	if (info.state != Vm_state::running) {
		result.status = "invalid_state";
		result.details["reason"] = "VM is " + to_string(info.state) + ", pause requires running";
	} else {
		connection.execute("pause", info.name, [&info](Hypervisor_client &client)
		{
			client.suspend(info.uuid);
		});
		publish_state_change(info, refresh(info).state, "pause");
	}
	time_measurement.tock("overall");
	result.time_measurement = std::move(time_measurement);
	return result;
}

Operation_result Vm_lifecycle_controller::resume(const Vm_id &id, Time_measurement time_measurement)
{
	time_measurement.tick("overall");
	Domain_info info;
	auto vm_lock = lock_vm(id, info);
	FASTLIB_LOG(lifecycle_log, trace) << "Resume " << info.name << ".";
	Operation_result result(info.name, info.uuid, "resume", "resumed");
	if (info.state != Vm_state::paused) {
		result.status = "invalid_state";
		result.details["reason"] = "VM is " + to_string(info.state) + ", resume requires paused";
	} else {
		connection.execute("resume", info.name, [&info](Hypervisor_client &client)
		{
			client.resume(info.uuid);
		});
		publish_state_change(info, refresh(info).state, "resume");
	}
	time_measurement.tock("overall");
	result.time_measurement = std::move(time_measurement);
	return result;
}

Operation_result Vm_lifecycle_controller::remove(const Vm_id &id, bool delete_disks, Time_measurement time_measurement)
{
	time_measurement.tick("overall");
	Domain_info info;
	auto vm_lock = lock_vm(id, info);
	FASTLIB_LOG(lifecycle_log, trace) << "Delete " << info.name << (delete_disks ? " with disks." : ".");
	auto xml = connection.execute("delete", info.name, [&info](Hypervisor_client &client)
	{
		return client.get_xml_desc(info.uuid);
	});
	std::vector<std::string> disk_paths;
	try {
		disk_paths = parse_domain_manifest(xml).disk_paths();
	} catch (const Template_error &e) {
		throw Operation_error("delete", info.name, e.what());
	}
	{
		Timer_guard guard(time_measurement, "undefine");
		connection.execute("delete", info.name, [&info](Hypervisor_client &client)
		{
			// A crashed domain may still be active.
			if (info.active)
				client.destroy(info.uuid);
			// Destroying a transient domain already removed it.
			if (client.lookup_by_uuid(info.uuid))
				client.undefine(info.uuid);
		});
	}
	accountant.invalidate();
	YAML::Node deleted_disks(YAML::NodeType::Sequence);
	YAML::Node failed_disks(YAML::NodeType::Map);
	if (delete_disks) {
		Timer_guard guard(time_measurement, "delete-disks");
		for (const auto &path : disk_paths) {
			try {
				storage.remove_image(path);
				deleted_disks.push_back(path);
			} catch (const Storage_error &e) {
				FASTLIB_LOG(lifecycle_log, warn) << "Could not delete disk " << path << " of " << info.name << ": " << e.what();
				failed_disks[path] = e.what();
			}
		}
	}
	YAML::Node details;
	details["deleted-disks"] = deleted_disks;
	details["failed-disks"] = failed_disks;
	publish_nothrow(events, Event("vm_deleted", info.name, info.uuid, details));
	publish_state_change(info, Vm_state::undefined, "delete");
	time_measurement.tock("overall");
	Operation_result result(info.name, info.uuid, "delete", "deleted");
	result.details = details;
	result.time_measurement = std::move(time_measurement);
	return result;
}

Operation_result Vm_lifecycle_controller::clone(const Vm_id &source, const std::string &new_name,
		const std::string &new_uuid, Time_measurement time_measurement)
{
	time_measurement.tick("overall");
	if (new_name.empty())
		throw std::invalid_argument("Clone requires a new name.");
	if (!is_valid_name(new_name)) {
		Validation_result validation;
		validation.add_error("Invalid VM name: '" + new_name + "'");
		throw Validation_error(validation);
	}
	auto uuid = new_uuid.empty() ? generate_uuid() : new_uuid;
	auto info = connection.lookup(source);
	if (info.uuid == uuid)
		throw Operation_error("clone", new_name, "VM already exists");
	auto vm_lock = locks.lock(info.uuid, uuid);
	info = refresh(info);
	FASTLIB_LOG(lifecycle_log, trace) << "Clone " << info.name << " to " << new_name << " (" << uuid << ").";
	if (info.state != Vm_state::stopped)
		throw State_error(info.name, info.state, Vm_state::stopped);
	std::unique_ptr<Resource_reservation> reservation;
	{
		auto pool_lock = accountant.lock_pool();
		check_unused("clone", new_name, uuid);
		auto validation = accountant.check_allocation(info.max_vcpus, info.max_memory_kb);
		if (!validation.valid) {
			FASTLIB_LOG(lifecycle_log, warn) << "Rejected clone " << new_name << ": " << validation.summary();
			throw Resource_allocation_error(validation);
		}
		reservation = accountant.reserve(new_name, info.max_vcpus, info.max_memory_kb);
	}
	auto xml = connection.execute("clone", info.name, [&info](Hypervisor_client &client)
	{
		return client.get_xml_desc(info.uuid);
	});
	Image_rollback rollback(storage);
	Domain_info clone_info;
	try {
		std::map<std::string, std::string> disk_sources;
		{
			Timer_guard guard(time_measurement, "copy-disks");
			for (const auto &path : parse_domain_manifest(xml).disk_paths()) {
				auto destination = storage.get_storage_path() + "/" + new_name + "_" + base_name(path);
				storage.copy_image(path, destination);
				rollback.add(destination);
				disk_sources[path] = destination;
			}
		}
		auto clone_xml = rewrite_domain_identity(xml, new_name, uuid, disk_sources);
		Timer_guard guard(time_measurement, "define");
		clone_info = connection.execute("clone", new_name, [&clone_xml](Hypervisor_client &client)
		{
			return client.define_xml(clone_xml);
		});
	} catch (const Storage_error &e) {
		FASTLIB_LOG(lifecycle_log, warn) << "Copying disks of " << info.name << " failed: " << e.what();
		throw Operation_error("clone", info.name, e.what());
	} catch (const Template_error &e) {
		throw Operation_error("clone", info.name, e.what());
	}
	rollback.commit();
	accountant.invalidate();
	reservation.reset();

	YAML::Node details;
	details["source-name"] = info.name;
	details["source-uuid"] = info.uuid;
	details["vcpus"] = clone_info.max_vcpus;
	details["memory-mb"] = clone_info.max_memory_kb / 1024;
	details["disks"] = rollback.get_paths();
	publish_nothrow(events, Event("vm_created", clone_info.name, clone_info.uuid, details));
	publish_state_change(Domain_info{new_name, uuid}, clone_info.state, "clone");
	time_measurement.tock("overall");
	Operation_result result(clone_info.name, clone_info.uuid, "clone", "cloned");
	result.details = details;
	result.time_measurement = std::move(time_measurement);
	return result;
}

Operation_result Vm_lifecycle_controller::resize(const Vm_id &id, boost::optional<int> cpu_cores,
		boost::optional<long long> memory_mb, bool live, Time_measurement time_measurement)
{
	time_measurement.tick("overall");
	if (!cpu_cores && !memory_mb)
		throw std::invalid_argument("Resize requires cpu cores or memory.");
	Domain_info info;
	auto vm_lock = lock_vm(id, info);
	FASTLIB_LOG(lifecycle_log, trace) << "Resize " << info.name << (live ? " (live)." : ".");
	Validation_result validation;
	if (cpu_cores && (*cpu_cores < 1 || *cpu_cores > 32))
		validation.add_error("CPU cores must be between 1 and 32");
	if (memory_mb && *memory_mb < 512)
		validation.add_error("Memory size must be at least 512MB");
	if (memory_mb && *memory_mb > 65536)
		validation.add_error("Memory size cannot exceed 64GB");
	if (!validation.valid)
		throw Validation_error(validation);

	bool stopped = !info.active;
	auto new_memory_kb = memory_mb ? static_cast<unsigned long long>(*memory_mb) * 1024 : info.max_memory_kb;
	auto new_vcpus = cpu_cores ? static_cast<unsigned int>(*cpu_cores) : info.max_vcpus;
	if (!stopped) {
		if (!live)
			throw State_error(info.name, info.state, Vm_state::stopped);
		if (new_memory_kb > info.max_memory_kb || new_vcpus > info.max_vcpus)
			throw Operation_error("resize", info.name, "VM must be stopped to raise maximum memory or vcpus");
	}

	auto pool_lock = accountant.lock_pool();
	long long extra_vcpus = static_cast<long long>(new_vcpus) - static_cast<long long>(info.max_vcpus);
	long long extra_memory_kb = static_cast<long long>(new_memory_kb) - static_cast<long long>(info.max_memory_kb);
	if (extra_vcpus > 0 || extra_memory_kb > 0) {
		auto check = accountant.check_allocation(std::max(0LL, extra_vcpus), std::max(0LL, extra_memory_kb));
		if (!check.valid) {
			FASTLIB_LOG(lifecycle_log, warn) << "Rejected resize of " << info.name << ": " << check.summary();
			throw Resource_allocation_error(check);
		}
	}
	std::vector<std::string> changes;
	{
		Timer_guard guard(time_measurement, "resize");
		connection.execute("resize", info.name, [&](Hypervisor_client &client)
		{
			if (memory_mb) {
				if (stopped) {
					// Lower the current value first so it never exceeds a reduced maximum.
					if (new_memory_kb < info.memory_kb)
						client.set_memory(info.uuid, new_memory_kb, false);
					client.set_max_memory(info.uuid, new_memory_kb);
					changes.push_back("Maximum memory set to " + std::to_string(*memory_mb) + "MB");
					client.set_memory(info.uuid, new_memory_kb, false);
					changes.push_back("Current memory set to " + std::to_string(*memory_mb) + "MB");
				} else {
					client.set_memory(info.uuid, new_memory_kb, true);
					changes.push_back("Current memory set to " + std::to_string(*memory_mb) + "MB (live)");
				}
			}
			if (cpu_cores) {
				if (stopped) {
					if (new_vcpus < info.vcpus)
						client.set_vcpus(info.uuid, new_vcpus, false);
					client.set_max_vcpus(info.uuid, new_vcpus);
					client.set_vcpus(info.uuid, new_vcpus, false);
					changes.push_back("vCPUs set to " + std::to_string(new_vcpus));
				} else {
					client.set_vcpus(info.uuid, new_vcpus, true);
					changes.push_back("vCPUs set to " + std::to_string(new_vcpus) + " (live)");
				}
			}
		});
	}
	accountant.invalidate();
	pool_lock.unlock();

	time_measurement.tock("overall");
	Operation_result result(info.name, info.uuid, "resize", "resized");
	result.details["changes"] = changes;
	result.time_measurement = std::move(time_measurement);
	return result;
}

Operation_result Vm_lifecycle_controller::set_limits(const Vm_id &id, const Limits_config &limits,
		Time_measurement time_measurement)
{
	time_measurement.tick("overall");
	auto validation = validate_limits(limits);
	if (!validation.valid)
		throw Validation_error(validation);
	Domain_info info;
	auto vm_lock = lock_vm(id, info);
	FASTLIB_LOG(lifecycle_log, trace) << "Set limits of " << info.name << ".";
	Scheduler_params scheduler_params;
	if (limits.cpu_shares)
		scheduler_params.cpu_shares = static_cast<unsigned long long>(*limits.cpu_shares);
	if (limits.vcpu_period)
		scheduler_params.vcpu_period = static_cast<unsigned long long>(*limits.vcpu_period);
	scheduler_params.vcpu_quota = limits.vcpu_quota;
	Memory_params memory_params;
	if (limits.memory_hard_limit_mb)
		memory_params.hard_limit_kb = static_cast<unsigned long long>(*limits.memory_hard_limit_mb) * 1024;
	if (limits.memory_soft_limit_mb)
		memory_params.soft_limit_kb = static_cast<unsigned long long>(*limits.memory_soft_limit_mb) * 1024;
	connection.execute("set limits of", info.name, [&](Hypervisor_client &client)
	{
		if (scheduler_params.cpu_shares || scheduler_params.vcpu_period || scheduler_params.vcpu_quota)
			client.set_scheduler_params(info.uuid, scheduler_params);
		if (memory_params.hard_limit_kb || memory_params.soft_limit_kb)
			client.set_memory_params(info.uuid, memory_params);
	});
	time_measurement.tock("overall");
	Operation_result result(info.name, info.uuid, "set limits", "limits_set");
	result.details["limits"] = limits.emit();
	result.time_measurement = std::move(time_measurement);
	return result;
}

Vm_status Vm_lifecycle_controller::status(const Vm_id &id)
{
	return Vm_status(connection.lookup(id));
}

std::vector<Vm_summary> Vm_lifecycle_controller::list()
{
	auto domains = connection.execute("list domains", [](Hypervisor_client &client)
	{
		return client.list_domains(false);
	});
	std::vector<Vm_summary> summaries;
	for (const auto &domain : domains)
		summaries.emplace_back(domain);
	return summaries;
}
