/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef VM_LOCK_REGISTRY_HPP
#define VM_LOCK_REGISTRY_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * \brief Hands out one mutex per vm uuid.
 *
 * A mutex lives as long as a Vm_lock refers to it.
 */
class Vm_lock_registry
{
public:
	/**
	 * \brief Holds the locks of one or two vms until destruction.
	 */
	class Vm_lock
	{
	public:
		Vm_lock() = default;
		Vm_lock(Vm_lock &&other) noexcept;
		Vm_lock & operator=(Vm_lock &&) = delete;
		~Vm_lock();

		bool owns_lock() const;
	private:
		friend class Vm_lock_registry;

		std::vector<std::shared_ptr<std::mutex>> mutexes;
		bool locked = false;
	};

	Vm_lock lock(const std::string &uuid);
	/**
	 * \brief Lock two vms without risking a deadlock with other two-vm locks.
	 */
	Vm_lock lock(const std::string &first_uuid, const std::string &second_uuid);
	/**
	 * \brief Number of uuids with a live mutex.
	 */
	size_t size();
private:
	std::shared_ptr<std::mutex> get_mutex(const std::string &uuid);

	std::mutex registry_mutex;
	std::map<std::string, std::weak_ptr<std::mutex>> mutexes;
};

#endif
