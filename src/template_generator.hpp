/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef TEMPLATE_GENERATOR_HPP
#define TEMPLATE_GENERATOR_HPP

#include "vm_spec.hpp"

#include <string>

/**
 * \brief Generates libvirt domain xml from a Vm_spec.
 *
 * Pure formatting, no hypervisor access.
 * Disk images are expected at <storage_path>/<vm name>-<disk name>.<format>.
 * Memory shares are validated but have no counterpart in the domain xml.
 */
class Template_generator
{
public:
	struct Options
	{
		std::string domain_type = "kvm";
		std::string arch = "x86_64";
		std::string machine = "pc-q35-4.2";
		std::string emulator = "/usr/bin/qemu-system-x86_64";
		std::string nat_network = "default";
		bool vnc = true;
	};

	explicit Template_generator(std::string storage_path);
	Template_generator(std::string storage_path, Options options);

	/**
	 * \brief Generate the domain xml.
	 *
	 * Throws Template_error if name or uuid are missing.
	 */
	std::string generate(const Vm_spec &spec) const;

	std::string disk_image_path(const std::string &vm_name, const Disk_config &disk) const;
	const std::string & get_storage_path() const;
private:
	std::string storage_path;
	Options options;
};

// Target device of the n-th virtio disk (vda, vdb, ...).
std::string disk_target_name(size_t index);

#endif
