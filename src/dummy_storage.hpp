/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef DUMMY_STORAGE_HPP
#define DUMMY_STORAGE_HPP

#include "storage_backend.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <set>

/**
 * \brief Implementation of the Storage_backend interface keeping images in memory.
 *
 * Free space shrinks by the virtual size of each image. Failures can be injected per path.
 * Only for test purposes.
 */
class Dummy_storage :
	public Storage_backend
{
public:
	Dummy_storage(std::string storage_path, unsigned long long capacity_bytes);

	const std::string & get_storage_path() const override;
	unsigned long long free_bytes() override;
	void create_image(const std::string &path, const std::string &format, long long size_gb,
			const boost::optional<std::string> &base_image) override;
	void copy_image(const std::string &source, const std::string &destination) override;
	void remove_image(const std::string &path) override;
	bool exists(const std::string &path) override;

	// Let every operation on path fail.
	void fail_on(const std::string &path);
	// Let every copy take this long, like a large image.
	void set_copy_delay(std::chrono::milliseconds delay);
	std::set<std::string> images() const;
private:
	void check_failure(const std::string &path) const;

	mutable std::mutex mutex;
	std::string storage_path;
	unsigned long long capacity_bytes;
	std::map<std::string, unsigned long long> image_sizes;
	std::set<std::string> failing_paths;
	std::chrono::milliseconds copy_delay;
};

#endif
