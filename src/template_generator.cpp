/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "template_generator.hpp"

#include "domain_xml.hpp"
#include "errors.hpp"

#include <boost/property_tree/ptree.hpp>

#include <utility>

using boost::property_tree::ptree;

std::string disk_target_name(size_t index)
{
	std::string suffix;
	// Same scheme as libvirt: vda..vdz, vdaa, vdab, ...
	++index;
	while (index > 0) {
		--index;
		suffix.insert(suffix.begin(), static_cast<char>('a' + index % 26));
		index /= 26;
	}
	return "vd" + suffix;
}

Template_generator::Template_generator(std::string storage_path) :
	Template_generator(std::move(storage_path), Options())
{
}

Template_generator::Template_generator(std::string storage_path, Options options) :
	storage_path(std::move(storage_path)),
	options(std::move(options))
{
}

const std::string & Template_generator::get_storage_path() const
{
	return storage_path;
}

std::string Template_generator::disk_image_path(const std::string &vm_name, const Disk_config &disk) const
{
	return storage_path + "/" + vm_name + "-" + disk.name + "." + disk.format;
}

ptree make_cpu_ptree(const Cpu_config &cpu)
{
	ptree cpu_pt;
	if (cpu.model) {
		cpu_pt.put("<xmlattr>.mode", "custom");
		cpu_pt.put("<xmlattr>.match", "exact");
		cpu_pt.put("model", *cpu.model);
	} else {
		cpu_pt.put("<xmlattr>.mode", "host-model");
		cpu_pt.put("<xmlattr>.check", "partial");
	}
	cpu_pt.put("topology.<xmlattr>.sockets", cpu.sockets);
	cpu_pt.put("topology.<xmlattr>.cores", cpu.cores);
	cpu_pt.put("topology.<xmlattr>.threads", cpu.threads);
	return cpu_pt;
}

// Returns an empty ptree if no tuning is requested.
ptree make_cputune_ptree(const Cpu_config &cpu)
{
	ptree cputune;
	for (size_t vcpu = 0; vcpu != cpu.pinning.size(); ++vcpu) {
		ptree vcpupin;
		vcpupin.put("<xmlattr>.vcpu", vcpu);
		vcpupin.put("<xmlattr>.cpuset", cpu.pinning[vcpu]);
		cputune.add_child("vcpupin", vcpupin);
	}
	if (cpu.shares)
		cputune.put("shares", *cpu.shares);
	if (cpu.limit) {
		// Quota is the share of one period each vcpu may run.
		cputune.put("period", 100000);
		cputune.put("quota", *cpu.limit * 1000);
	}
	return cputune;
}

ptree make_disk_ptree(const Disk_config &disk, const std::string &path, size_t index)
{
	ptree disk_pt;
	disk_pt.put("<xmlattr>.type", "file");
	disk_pt.put("<xmlattr>.device", "disk");
	disk_pt.put("driver.<xmlattr>.name", "qemu");
	disk_pt.put("driver.<xmlattr>.type", disk.format);
	disk_pt.put("driver.<xmlattr>.cache", disk.cache);
	disk_pt.put("source.<xmlattr>.file", path);
	disk_pt.put("target.<xmlattr>.dev", disk_target_name(index));
	disk_pt.put("target.<xmlattr>.bus", "virtio");
	if (disk.bootable)
		disk_pt.put("boot.<xmlattr>.order", 1);
	if (disk.readonly)
		disk_pt.put_child("readonly", ptree());
	return disk_pt;
}

ptree make_interface_ptree(const Network_config &network, const std::string &nat_network)
{
	ptree interface;
	if (network.type == "bridge" || (network.type == "vlan" && network.bridge)) {
		interface.put("<xmlattr>.type", "bridge");
		interface.put("source.<xmlattr>.bridge", network.bridge ? *network.bridge : "");
	} else {
		interface.put("<xmlattr>.type", "network");
		interface.put("source.<xmlattr>.network", nat_network);
	}
	if (network.type == "vlan" && network.vlan)
		interface.put("vlan.tag.<xmlattr>.id", *network.vlan);
	if (network.mac)
		interface.put("mac.<xmlattr>.address", *network.mac);
	interface.put("model.<xmlattr>.type", "virtio");
	if (network.ip) {
		interface.put("ip.<xmlattr>.address", *network.ip);
		auto is_ipv6 = network.ip->find(':') != std::string::npos;
		interface.put("ip.<xmlattr>.prefix", network.prefix ? *network.prefix : (is_ipv6 ? 64 : 24));
	}
	if (network.bandwidth_mbps) {
		// libvirt expects kilobytes per second.
		auto average = *network.bandwidth_mbps * 125;
		interface.put("bandwidth.inbound.<xmlattr>.average", average);
		interface.put("bandwidth.outbound.<xmlattr>.average", average);
	}
	return interface;
}

std::string Template_generator::generate(const Vm_spec &spec) const
{
	if (spec.name.empty())
		throw Template_error("VM name is required.");
	if (spec.uuid.empty())
		throw Template_error("VM uuid is required.");
	ptree domain;
	domain.put("<xmlattr>.type", options.domain_type);
	domain.put("name", spec.name);
	domain.put("uuid", spec.uuid);
	domain.put("memory", spec.memory.size_mb);
	domain.put("memory.<xmlattr>.unit", "MiB");
	domain.put("currentMemory", spec.memory.size_mb);
	domain.put("currentMemory.<xmlattr>.unit", "MiB");
	if (spec.memory.hugepages)
		domain.put_child("memoryBacking.hugepages", ptree());
	domain.put("vcpu", spec.cpu.total_vcpus());
	domain.put("vcpu.<xmlattr>.placement", "static");
	auto cputune = make_cputune_ptree(spec.cpu);
	if (!cputune.empty())
		domain.put_child("cputune", cputune);
	domain.put("os.type", "hvm");
	domain.put("os.type.<xmlattr>.arch", options.arch);
	domain.put("os.type.<xmlattr>.machine", options.machine);
	domain.put_child("features.acpi", ptree());
	domain.put_child("features.apic", ptree());
	domain.put_child("cpu", make_cpu_ptree(spec.cpu));
	domain.put("clock.<xmlattr>.offset", "utc");
	domain.put("on_poweroff", "destroy");
	domain.put("on_reboot", "restart");
	domain.put("on_crash", "destroy");
	domain.put("pm.suspend-to-mem.<xmlattr>.enabled", "no");
	domain.put("pm.suspend-to-disk.<xmlattr>.enabled", "no");

	ptree devices;
	devices.put("emulator", options.emulator);
	for (size_t i = 0; i != spec.disks.size(); ++i) {
		const auto &disk = spec.disks[i];
		devices.add_child("disk", make_disk_ptree(disk, disk_image_path(spec.name, disk), i));
	}
	for (const auto &network : spec.networks)
		devices.add_child("interface", make_interface_ptree(network, options.nat_network));
	devices.put("console.<xmlattr>.type", "pty");
	devices.put("console.target.<xmlattr>.type", "serial");
	devices.put("console.target.<xmlattr>.port", 0);
	devices.put("channel.<xmlattr>.type", "unix");
	devices.put("channel.target.<xmlattr>.type", "virtio");
	devices.put("channel.target.<xmlattr>.name", "org.qemu.guest_agent.0");
	if (options.vnc) {
		devices.put("graphics.<xmlattr>.type", "vnc");
		devices.put("graphics.<xmlattr>.port", -1);
		devices.put("graphics.<xmlattr>.autoport", "yes");
		devices.put("graphics.<xmlattr>.listen", "0.0.0.0");
	}
	devices.put("memballoon.<xmlattr>.model", spec.memory.balloon ? "virtio" : "none");
	domain.put_child("devices", devices);

	ptree pt;
	pt.put_child("domain", domain);
	return write_xml_to_string(pt);
}
