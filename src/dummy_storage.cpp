/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "dummy_storage.hpp"

#include "errors.hpp"

#include <thread>
#include <utility>

const unsigned long long gigabyte = 1000ULL * 1000 * 1000;

Dummy_storage::Dummy_storage(std::string storage_path, unsigned long long capacity_bytes) :
	storage_path(std::move(storage_path)),
	capacity_bytes(capacity_bytes),
	copy_delay(0)
{
}

const std::string & Dummy_storage::get_storage_path() const
{
	return storage_path;
}

unsigned long long Dummy_storage::free_bytes()
{
	std::lock_guard<std::mutex> lock(mutex);
	unsigned long long used = 0;
	for (const auto &image : image_sizes)
		used += image.second;
	return used > capacity_bytes ? 0 : capacity_bytes - used;
}

void Dummy_storage::check_failure(const std::string &path) const
{
	if (failing_paths.count(path))
		throw Storage_error("Injected storage failure for " + path);
}

void Dummy_storage::create_image(const std::string &path, const std::string &format, long long size_gb,
		const boost::optional<std::string> &base_image)
{
	(void) format;
	std::lock_guard<std::mutex> lock(mutex);
	check_failure(path);
	if (image_sizes.count(path))
		throw Storage_error("Disk image " + path + " already exists.");
	if (base_image && !image_sizes.count(*base_image))
		throw Storage_error("Base image " + *base_image + " does not exist.");
	image_sizes[path] = static_cast<unsigned long long>(size_gb) * gigabyte;
}

void Dummy_storage::copy_image(const std::string &source, const std::string &destination)
{
	std::chrono::milliseconds delay;
	{
		std::lock_guard<std::mutex> lock(mutex);
		delay = copy_delay;
	}
	std::this_thread::sleep_for(delay);
	std::lock_guard<std::mutex> lock(mutex);
	check_failure(source);
	check_failure(destination);
	auto it = image_sizes.find(source);
	if (it == image_sizes.end())
		throw Storage_error("Disk image " + source + " does not exist.");
	if (image_sizes.count(destination))
		throw Storage_error("Disk image " + destination + " already exists.");
	image_sizes[destination] = it->second;
}

void Dummy_storage::remove_image(const std::string &path)
{
	std::lock_guard<std::mutex> lock(mutex);
	check_failure(path);
	if (image_sizes.erase(path) == 0)
		throw Storage_error("Error removing " + path + ": No such file or directory");
}

bool Dummy_storage::exists(const std::string &path)
{
	std::lock_guard<std::mutex> lock(mutex);
	return image_sizes.count(path) != 0;
}

void Dummy_storage::fail_on(const std::string &path)
{
	std::lock_guard<std::mutex> lock(mutex);
	failing_paths.insert(path);
}

void Dummy_storage::set_copy_delay(std::chrono::milliseconds delay)
{
	std::lock_guard<std::mutex> lock(mutex);
	copy_delay = delay;
}

std::set<std::string> Dummy_storage::images() const
{
	std::lock_guard<std::mutex> lock(mutex);
	std::set<std::string> paths;
	for (const auto &image : image_sizes)
		paths.insert(image.first);
	return paths;
}
