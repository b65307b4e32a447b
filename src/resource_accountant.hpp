/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef RESOURCE_ACCOUNTANT_HPP
#define RESOURCE_ACCOUNTANT_HPP

#include "connection_manager.hpp"
#include "storage_backend.hpp"
#include "vm_spec.hpp"
#include "vm_types.hpp"

#include <boost/optional.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>

class Resource_accountant;

/**
 * \brief Resources and a vm name promised to an operation whose domain is not defined yet.
 *
 * Counted against the available resources until destroyed. Obtained from Resource_accountant::reserve().
 */
class Resource_reservation
{
public:
	~Resource_reservation();
	Resource_reservation(const Resource_reservation &) = delete;
	Resource_reservation & operator=(const Resource_reservation &) = delete;

	const std::string & get_name() const;
private:
	friend class Resource_accountant;
	Resource_reservation(Resource_accountant &accountant, std::string name, long long vcpus, long long memory_kb, long long disk_gb);

	Resource_accountant &accountant;
	const std::string name;
	const long long vcpus;
	const long long memory_kb;
	const long long disk_gb;
};

/**
 * \brief Tracks host capacity against the resources configured for all domains.
 *
 * The allocation is the sum of the configured maximum vcpus and memory of every domain
 * known to the hypervisor, active or not. Available resources and limits are always derived from
 * a single observation of capacity and allocation.
 *
 * Validation followed by a reservation is made atomic by holding the resource pool lock (see lock_pool()).
 * Reserved resources count as unavailable until the reservation is dropped, so the pool lock need not be
 * held while disk images are prepared.
 */
class Resource_accountant
{
public:
	/**
	 * \brief Construct a Resource_accountant.
	 *
	 * \param connection The connection to query capacity and domains with.
	 * \param storage The storage backend queried for free disk space.
	 * \param vcpu_overcommit_ratio Factor by which the vcpus of all domains may exceed the host cpus.
	 * \param allocation_cache_ttl Time an allocation scan is reused, zero disables caching.
	 */
	Resource_accountant(Connection_manager &connection, Storage_backend &storage,
			double vcpu_overcommit_ratio = 4.0,
			std::chrono::milliseconds allocation_cache_ttl = std::chrono::milliseconds(2000));

	Host_capacity host_capacity();
	Allocation_snapshot allocated();
	Available_resources available();
	Resource_limits limits();

	/**
	 * \brief Validate a vm specification against static limits and the available resources.
	 *
	 * All violations are collected. Failures of the availability cross-check set insufficient_resources.
	 */
	Validation_result validate(const Vm_spec &spec);
	/**
	 * \brief Check additional vcpus, memory and disk against the available resources only.
	 */
	Validation_result check_allocation(long long vcpus, long long memory_kb, long long disk_gb = 0);

	/**
	 * \brief Acquire the resource pool lock.
	 *
	 * Hold it from validation until the allocation is visible to the hypervisor.
	 * The lock is recursive, the accountant takes it itself while computing an observation.
	 */
	std::unique_lock<std::recursive_mutex> lock_pool();
	/**
	 * \brief Reserve resources and a vm name until the new domain is defined.
	 *
	 * Call with the pool lock held, after validation succeeded. Drop the reservation after invalidate().
	 */
	std::unique_ptr<Resource_reservation> reserve(const std::string &name, long long vcpus, long long memory_kb,
			long long disk_gb = 0);
	// True while a reservation for name exists.
	bool is_reserved(const std::string &name);
	/**
	 * \brief Drop the cached allocation. Call after every change of domain resources.
	 */
	void invalidate();

	double get_vcpu_overcommit_ratio() const;
private:
	friend class Resource_reservation;

	struct Observation
	{
		Host_capacity capacity;
		Allocation_snapshot allocated;
		Available_resources available;
		bool disk_known = false;
		long long free_gb = 0;
		std::string disk_error;
	};

	Observation observe();
	Allocation_snapshot scan_allocation();
	void release(const Resource_reservation &reservation) noexcept;
	void cross_check(const Observation &observation, long long vcpus, long long memory_kb,
			long long disk_gb, bool check_disk, Validation_result &result) const;

	Connection_manager &connection;
	Storage_backend &storage;
	const double vcpu_overcommit_ratio;
	const std::chrono::milliseconds allocation_cache_ttl;

	std::recursive_mutex pool_mutex;
	// Guards the allocation cache and the reservations, never held during hypervisor calls.
	std::mutex cache_mutex;
	boost::optional<Allocation_snapshot> cached_allocation;
	std::chrono::steady_clock::time_point cached_at;
	unsigned long long generation;
	std::multiset<std::string> reserved_names;
	long long reserved_vcpus;
	long long reserved_memory_kb;
	long long reserved_disk_gb;
};

/**
 * \brief Check a vm or disk name.
 *
 * Names become part of disk image file names. Allowed are letters, digits, '.', '_' and '-',
 * starting with a letter or digit.
 */
bool is_valid_name(const std::string &name);

/**
 * \brief Check the ranges of runtime limits. Needs no host information.
 */
Validation_result validate_limits(const Limits_config &limits);

#endif
