/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef DOMAIN_XML_HPP
#define DOMAIN_XML_HPP

#include <boost/property_tree/ptree.hpp>

#include <map>
#include <string>
#include <vector>

// Convert xml string to ptree.
boost::property_tree::ptree read_xml_from_string(const std::string &str);

// Convert ptree to xml string.
std::string write_xml_to_string(const boost::property_tree::ptree &ptree, bool pretty = true);

struct Disk_device
{
	std::string device;
	std::string target;
	// Path of the image file, empty for non file disks.
	std::string source;
	std::string format;
};

struct Interface_device
{
	std::string type;
	// Host side device (e.g., vnet0), only present while the domain is running.
	std::string target;
	std::string mac;
};

/**
 * \brief Identity, size and devices of a domain as described by its xml.
 */
struct Domain_manifest
{
	std::string name;
	std::string uuid;
	unsigned long long memory_kb = 0;
	unsigned int vcpus = 0;
	std::vector<Disk_device> disks;
	std::vector<Interface_device> interfaces;

	// Source files of all file backed disks.
	std::vector<std::string> disk_paths() const;
};

/**
 * \brief Parse the device manifest of a domain.
 *
 * Throws Template_error if the xml is malformed.
 */
Domain_manifest parse_domain_manifest(const std::string &xml);

/**
 * \brief Give a domain xml a new identity.
 *
 * Replaces name and uuid, replaces disk sources according to disk_sources (old path to new path) and
 * removes mac addresses and host side interface names so that the hypervisor assigns fresh ones.
 */
std::string rewrite_domain_identity(const std::string &xml, const std::string &name, const std::string &uuid,
		const std::map<std::string, std::string> &disk_sources);

#endif
