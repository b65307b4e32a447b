/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef VM_LIFECYCLE_CONTROLLER_HPP
#define VM_LIFECYCLE_CONTROLLER_HPP

#include "connection_manager.hpp"
#include "event_sink.hpp"
#include "resource_accountant.hpp"
#include "storage_backend.hpp"
#include "template_generator.hpp"
#include "time_measurement.hpp"
#include "vm_lock_registry.hpp"
#include "vm_spec.hpp"
#include "vm_types.hpp"

#include <boost/optional.hpp>

#include <chrono>
#include <string>
#include <vector>

/**
 * \brief Drives the state machine of vms.
 *
 * Every mutating operation holds the lock of the vm (keyed by uuid) for its whole duration.
 * Operations adding a domain validate and reserve its resources under the resource pool lock and keep
 * the reservation until the domain is defined. Disk images are prepared without holding the pool lock.
 * Lock order is vm lock(s), pool lock, connection.
 *
 * Every operation takes an optional Time_measurement which is returned inside the Operation_result.
 */
class Vm_lifecycle_controller
{
public:
	/**
	 * \brief Construct a Vm_lifecycle_controller.
	 *
	 * \param stop_timeout Maximum time restart() waits for a graceful shutdown before destroying the vm.
	 * \param poll_interval Interval of state queries while waiting for a shutdown.
	 */
	Vm_lifecycle_controller(Connection_manager &connection,
			Resource_accountant &accountant,
			Storage_backend &storage,
			const Template_generator &templates,
			Vm_lock_registry &locks,
			Event_sink &events,
			std::chrono::seconds stop_timeout = std::chrono::seconds(60),
			std::chrono::milliseconds poll_interval = std::chrono::milliseconds(1000));

	/**
	 * \brief Define a new vm with fresh disk images.
	 *
	 * A spec without uuid gets a random one. Throws Validation_error or Resource_allocation_error before
	 * anything is touched. Disk images created before a failure are removed.
	 */
	Operation_result create(Vm_spec spec, Time_measurement time_measurement = Time_measurement());
	Operation_result start(const Vm_id &id, Time_measurement time_measurement = Time_measurement());
	/**
	 * \brief Shut down or destroy a vm.
	 *
	 * A graceful shutdown returns immediately, the vm may still be stopping.
	 */
	Operation_result stop(const Vm_id &id, bool force, Time_measurement time_measurement = Time_measurement());
	/**
	 * \brief Stop a vm, wait until it is stopped and start it again.
	 *
	 * A vm not stopped within the stop timeout is destroyed. A paused or crashed vm is destroyed right away.
	 */
	Operation_result restart(const Vm_id &id, bool force, Time_measurement time_measurement = Time_measurement());
	// Returns status invalid_state unless the vm is running.
	Operation_result pause(const Vm_id &id, Time_measurement time_measurement = Time_measurement());
	// Returns status invalid_state unless the vm is paused.
	Operation_result resume(const Vm_id &id, Time_measurement time_measurement = Time_measurement());
	/**
	 * \brief Destroy if active and undefine a vm.
	 *
	 * With delete_disks the disk images from the device manifest are removed. Removal failures are reported
	 * in details["failed-disks"] and do not abort the operation.
	 */
	Operation_result remove(const Vm_id &id, bool delete_disks, Time_measurement time_measurement = Time_measurement());
	/**
	 * \brief Copy a stopped vm with all of its file disks.
	 *
	 * \param new_uuid The uuid of the clone, an empty string generates one.
	 */
	Operation_result clone(const Vm_id &source, const std::string &new_name, const std::string &new_uuid,
			Time_measurement time_measurement = Time_measurement());
	/**
	 * \brief Change the vcpus and/or the memory of a vm.
	 *
	 * Maximum values can only change while the vm is stopped. With live the current values of an active vm
	 * are changed within its maximum.
	 */
	Operation_result resize(const Vm_id &id, boost::optional<int> cpu_cores, boost::optional<long long> memory_mb,
			bool live, Time_measurement time_measurement = Time_measurement());
	Operation_result set_limits(const Vm_id &id, const Limits_config &limits,
			Time_measurement time_measurement = Time_measurement());

	Vm_status status(const Vm_id &id);
	std::vector<Vm_summary> list();
private:
	// Lock the vm and read its current info. The vm is resolved before and after locking.
	Vm_lock_registry::Vm_lock lock_vm(const Vm_id &id, Domain_info &info);
	Domain_info refresh(const Domain_info &info);
	// Poll until the vm is stopped or the timeout expired, returns the last state.
	Vm_state wait_for_stopped(const Domain_info &info, std::chrono::milliseconds timeout);
	void publish_state_change(const Domain_info &before, Vm_state after, const std::string &operation);
	void check_unused(const std::string &operation, const std::string &name, const std::string &uuid);

	Connection_manager &connection;
	Resource_accountant &accountant;
	Storage_backend &storage;
	const Template_generator &templates;
	Vm_lock_registry &locks;
	Event_sink &events;
	const std::chrono::seconds stop_timeout;
	const std::chrono::milliseconds poll_interval;
};

#endif
