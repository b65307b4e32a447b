/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "vm_lock_registry.hpp"

#include <stdexcept>
#include <utility>

Vm_lock_registry::Vm_lock::Vm_lock(Vm_lock &&other) noexcept :
	mutexes(std::move(other.mutexes)),
	locked(other.locked)
{
	other.locked = false;
}

Vm_lock_registry::Vm_lock::~Vm_lock()
{
	if (!locked)
		return;
	for (auto it = mutexes.rbegin(); it != mutexes.rend(); ++it)
		(*it)->unlock();
}

bool Vm_lock_registry::Vm_lock::owns_lock() const
{
	return locked;
}

std::shared_ptr<std::mutex> Vm_lock_registry::get_mutex(const std::string &uuid)
{
	if (uuid.empty())
		throw std::invalid_argument("Cannot lock a vm without uuid.");
	std::lock_guard<std::mutex> lock(registry_mutex);
	// Drop entries nobody refers to anymore.
	for (auto it = mutexes.begin(); it != mutexes.end();) {
		if (it->second.expired())
			it = mutexes.erase(it);
		else
			++it;
	}
	auto &entry = mutexes[uuid];
	auto mutex = entry.lock();
	if (!mutex) {
		mutex = std::make_shared<std::mutex>();
		entry = mutex;
	}
	return mutex;
}

Vm_lock_registry::Vm_lock Vm_lock_registry::lock(const std::string &uuid)
{
	Vm_lock vm_lock;
	vm_lock.mutexes.push_back(get_mutex(uuid));
	vm_lock.mutexes.front()->lock();
	vm_lock.locked = true;
	return vm_lock;
}

Vm_lock_registry::Vm_lock Vm_lock_registry::lock(const std::string &first_uuid, const std::string &second_uuid)
{
	if (first_uuid == second_uuid)
		return lock(first_uuid);
	Vm_lock vm_lock;
	vm_lock.mutexes.push_back(get_mutex(first_uuid));
	vm_lock.mutexes.push_back(get_mutex(second_uuid));
	std::lock(*vm_lock.mutexes[0], *vm_lock.mutexes[1]);
	vm_lock.locked = true;
	return vm_lock;
}

size_t Vm_lock_registry::size()
{
	std::lock_guard<std::mutex> lock(registry_mutex);
	size_t count = 0;
	for (const auto &entry : mutexes) {
		if (!entry.second.expired())
			++count;
	}
	return count;
}
