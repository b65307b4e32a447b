/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "domain_xml.hpp"

#include "errors.hpp"

#include <boost/property_tree/xml_parser.hpp>

#include <sstream>

using boost::property_tree::ptree;

ptree read_xml_from_string(const std::string &str)
{
	ptree pt;
	std::stringstream ss(str);
	try {
		read_xml(ss, pt, boost::property_tree::xml_parser::trim_whitespace);
	} catch (const boost::property_tree::xml_parser_error &e) {
		throw Template_error(std::string("Error parsing domain xml: ") + e.what());
	}
	return pt;
}

std::string write_xml_to_string(const ptree &ptree, bool pretty)
{
	std::stringstream ss;
	if (pretty) {
		boost::property_tree::xml_parser::xml_writer_settings<std::string> settings('\t', 1);
		write_xml(ss, ptree, settings);
	} else {
		write_xml(ss, ptree);
	}
	return ss.str();
}

// Converts a libvirt scaled integer to KiB.
unsigned long long to_kib(unsigned long long value, const std::string &unit)
{
	if (unit == "b" || unit == "bytes")
		return value / 1024;
	if (unit == "KB")
		return value * 1000 / 1024;
	if (unit == "MB")
		return value * 1000 * 1000 / 1024;
	if (unit == "M" || unit == "MiB")
		return value * 1024;
	if (unit == "G" || unit == "GiB")
		return value * 1024 * 1024;
	if (unit == "GB")
		return value * 1000 * 1000 * 1000 / 1024;
	return value;
}

std::vector<std::string> Domain_manifest::disk_paths() const
{
	std::vector<std::string> paths;
	for (const auto &disk : disks) {
		if (!disk.source.empty())
			paths.push_back(disk.source);
	}
	return paths;
}

Domain_manifest parse_domain_manifest(const std::string &xml)
{
	auto pt = read_xml_from_string(xml);
	auto domain = pt.get_child_optional("domain");
	if (!domain)
		throw Template_error("Domain xml has no domain element.");
	Domain_manifest manifest;
	manifest.name = domain->get<std::string>("name", "");
	manifest.uuid = domain->get<std::string>("uuid", "");
	manifest.memory_kb = to_kib(domain->get<unsigned long long>("memory", 0),
			domain->get<std::string>("memory.<xmlattr>.unit", "KiB"));
	manifest.vcpus = domain->get<unsigned int>("vcpu", 0);
	auto devices = domain->get_child_optional("devices");
	if (!devices)
		return manifest;
	for (const auto &device : *devices) {
		if (device.first == "disk") {
			Disk_device disk;
			disk.device = device.second.get<std::string>("<xmlattr>.device", "disk");
			disk.target = device.second.get<std::string>("target.<xmlattr>.dev", "");
			disk.source = device.second.get<std::string>("source.<xmlattr>.file", "");
			disk.format = device.second.get<std::string>("driver.<xmlattr>.type", "");
			manifest.disks.push_back(disk);
		} else if (device.first == "interface") {
			Interface_device interface;
			interface.type = device.second.get<std::string>("<xmlattr>.type", "");
			interface.target = device.second.get<std::string>("target.<xmlattr>.dev", "");
			interface.mac = device.second.get<std::string>("mac.<xmlattr>.address", "");
			manifest.interfaces.push_back(interface);
		}
	}
	return manifest;
}

std::string rewrite_domain_identity(const std::string &xml, const std::string &name, const std::string &uuid,
		const std::map<std::string, std::string> &disk_sources)
{
	auto pt = read_xml_from_string(xml);
	auto domain = pt.get_child_optional("domain");
	if (!domain)
		throw Template_error("Domain xml has no domain element.");
	domain->put("name", name);
	domain->put("uuid", uuid);
	auto devices = domain->get_child_optional("devices");
	if (devices) {
		for (auto &device : *devices) {
			if (device.first == "disk") {
				auto source = device.second.get_optional<std::string>("source.<xmlattr>.file");
				if (!source)
					continue;
				auto it = disk_sources.find(*source);
				if (it != disk_sources.end())
					device.second.put("source.<xmlattr>.file", it->second);
			} else if (device.first == "interface") {
				device.second.erase("mac");
				device.second.erase("target");
			}
		}
	}
	return write_xml_to_string(pt);
}
