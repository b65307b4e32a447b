/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "dummy_client.hpp"

#include "domain_xml.hpp"
#include "errors.hpp"

#include <fast-lib/log.hpp>

#include <utility>

FASTLIB_LOG_INIT(dummy_client_log, "Dummy_client")
FASTLIB_LOG_SET_LEVEL_GLOBAL(dummy_client_log, trace);

using boost::property_tree::ptree;

Hypervisor_error no_domain_error(const std::string &uuid)
{
	return Hypervisor_error(Hypervisor_error::Category::no_domain, "Domain not found: no domain with matching uuid '" + uuid + "'");
}

Hypervisor_error invalid_operation_error(const std::string &what)
{
	return Hypervisor_error(Hypervisor_error::Category::operation, "Requested operation is not valid: " + what);
}

// Add host side interface names while running, remove them when stopped.
std::string update_interface_targets(const std::string &xml, bool running, unsigned int &next_interface)
{
	auto pt = read_xml_from_string(xml);
	auto devices = pt.get_child_optional("domain.devices");
	if (!devices)
		return xml;
	for (auto &device : *devices) {
		if (device.first != "interface")
			continue;
		if (running)
			device.second.put("target.<xmlattr>.dev", "vnet" + std::to_string(next_interface++));
		else
			device.second.erase("target");
	}
	return write_xml_to_string(pt);
}

Dummy_client::Dummy_client(Node_info node, std::string hostname) :
	node(std::move(node)),
	hostname(std::move(hostname)),
	opened(false),
	reachable(true),
	opens(0),
	shutdown_delay(1),
	next_interface(0)
{
}

void Dummy_client::enter(const std::string &operation)
{
	++calls[operation];
	history.push_back(operation);
	if (!reachable) {
		opened = false;
		throw Hypervisor_error(Hypervisor_error::Category::connection, "Cannot recv data: Connection reset by peer");
	}
	if (!opened && operation != "open")
		throw Hypervisor_error(Hypervisor_error::Category::connection, "Connection to hypervisor is not open.");
	auto it = injected_failures.find(operation);
	if (it != injected_failures.end()) {
		auto category = it->second;
		injected_failures.erase(it);
		if (category == Hypervisor_error::Category::connection)
			opened = false;
		throw Hypervisor_error(category, "Injected failure of " + operation);
	}
}

Dummy_client::Dummy_domain & Dummy_client::get_domain(const std::string &uuid)
{
	auto it = domains.find(uuid);
	if (it == domains.end())
		throw no_domain_error(uuid);
	settle(it->second);
	return it->second;
}

void Dummy_client::settle(Dummy_domain &domain)
{
	if (!domain.shutdown_pending || domain.shutdown_countdown == 0)
		return;
	if (--domain.shutdown_countdown == 0) {
		domain.shutdown_pending = false;
		domain.info.state = Vm_state::stopped;
		domain.info.active = false;
		domain.xml = update_interface_targets(domain.xml, false, next_interface);
	}
}

void Dummy_client::notify(const std::string &type, const Domain_info &info)
{
	Lifecycle_callback cb;
	{
		std::lock_guard<std::mutex> lock(mutex);
		cb = callback;
	}
	if (!cb)
		return;
	Lifecycle_event event;
	event.name = info.name;
	event.uuid = info.uuid;
	event.type = type;
	cb(event);
}

void Dummy_client::open(const std::string &uri)
{
	std::lock_guard<std::mutex> lock(mutex);
	enter("open");
	FASTLIB_LOG(dummy_client_log, trace) << "Open dummy connection " << uri << ".";
	opened = true;
	++opens;
}

void Dummy_client::close() noexcept
{
	std::lock_guard<std::mutex> lock(mutex);
	opened = false;
}

bool Dummy_client::is_open() const
{
	std::lock_guard<std::mutex> lock(mutex);
	return opened;
}

std::string Dummy_client::get_hostname()
{
	std::lock_guard<std::mutex> lock(mutex);
	enter("get_hostname");
	return hostname;
}

Node_info Dummy_client::get_node_info()
{
	std::lock_guard<std::mutex> lock(mutex);
	enter("get_node_info");
	return node;
}

Hypervisor_version Dummy_client::get_version()
{
	std::lock_guard<std::mutex> lock(mutex);
	enter("get_version");
	Hypervisor_version version;
	version.type = "QEMU";
	version.version = 6002000;
	version.lib_version = 8000000;
	return version;
}

std::vector<Domain_info> Dummy_client::list_domains(bool active_only)
{
	std::lock_guard<std::mutex> lock(mutex);
	enter("list_domains");
	std::vector<Domain_info> infos;
	for (auto &entry : domains) {
		settle(entry.second);
		if (!active_only || entry.second.info.active)
			infos.push_back(entry.second.info);
	}
	return infos;
}

boost::optional<Domain_info> Dummy_client::lookup_by_name(const std::string &name)
{
	std::lock_guard<std::mutex> lock(mutex);
	enter("lookup_by_name");
	for (auto &entry : domains) {
		if (entry.second.info.name == name) {
			settle(entry.second);
			return entry.second.info;
		}
	}
	return boost::none;
}

boost::optional<Domain_info> Dummy_client::lookup_by_uuid(const std::string &uuid)
{
	std::lock_guard<std::mutex> lock(mutex);
	enter("lookup_by_uuid");
	auto it = domains.find(uuid);
	if (it == domains.end())
		return boost::none;
	settle(it->second);
	return it->second.info;
}

std::string Dummy_client::get_xml_desc(const std::string &uuid)
{
	std::lock_guard<std::mutex> lock(mutex);
	enter("get_xml_desc");
	return get_domain(uuid).xml;
}

Domain_info Dummy_client::define_xml(const std::string &xml)
{
	Domain_info info;
	{
		std::lock_guard<std::mutex> lock(mutex);
		enter("define_xml");
		Domain_manifest manifest;
		try {
			manifest = parse_domain_manifest(xml);
		} catch (const Template_error &e) {
			throw Hypervisor_error(Hypervisor_error::Category::operation, std::string("XML error: ") + e.what());
		}
		if (manifest.name.empty() || manifest.uuid.empty())
			throw Hypervisor_error(Hypervisor_error::Category::operation, "XML error: missing domain name or uuid");
		for (const auto &entry : domains) {
			if (entry.second.info.name == manifest.name && entry.first != manifest.uuid)
				throw Hypervisor_error(Hypervisor_error::Category::operation,
						"operation failed: domain '" + manifest.name + "' already exists with uuid " + entry.first);
		}
		auto &domain = domains[manifest.uuid];
		domain.xml = xml;
		domain.info.name = manifest.name;
		domain.info.uuid = manifest.uuid;
		if (domain.info.state == Vm_state::undefined)
			domain.info.state = Vm_state::stopped;
		domain.info.max_memory_kb = manifest.memory_kb;
		domain.info.memory_kb = manifest.memory_kb;
		domain.info.vcpus = manifest.vcpus;
		domain.info.max_vcpus = manifest.vcpus;
		domain.info.persistent = true;
		info = domain.info;
	}
	notify("defined", info);
	return info;
}

void Dummy_client::create(const std::string &uuid)
{
	Domain_info info;
	{
		std::lock_guard<std::mutex> lock(mutex);
		enter("create");
		auto &domain = get_domain(uuid);
		if (domain.info.active)
			throw invalid_operation_error("domain is already running");
		domain.info.state = Vm_state::running;
		domain.info.active = true;
		domain.xml = update_interface_targets(domain.xml, true, next_interface);
		info = domain.info;
	}
	notify("started", info);
}

void Dummy_client::destroy(const std::string &uuid)
{
	Domain_info info;
	{
		std::lock_guard<std::mutex> lock(mutex);
		enter("destroy");
		auto &domain = get_domain(uuid);
		if (!domain.info.active)
			throw invalid_operation_error("domain is not running");
		domain.shutdown_pending = false;
		domain.info.state = Vm_state::stopped;
		domain.info.active = false;
		domain.xml = update_interface_targets(domain.xml, false, next_interface);
		info = domain.info;
		// Transient domains vanish once stopped.
		if (!domain.info.persistent)
			domains.erase(uuid);
	}
	notify("stopped", info);
}

void Dummy_client::shutdown(const std::string &uuid)
{
	std::lock_guard<std::mutex> lock(mutex);
	enter("shutdown");
	auto &domain = get_domain(uuid);
	if (domain.info.state != Vm_state::running)
		throw invalid_operation_error("domain is not running");
	domain.info.state = Vm_state::stopping;
	domain.shutdown_pending = true;
	domain.shutdown_countdown = shutdown_delay;
}

void Dummy_client::suspend(const std::string &uuid)
{
	Domain_info info;
	{
		std::lock_guard<std::mutex> lock(mutex);
		enter("suspend");
		auto &domain = get_domain(uuid);
		if (domain.info.state != Vm_state::running)
			throw invalid_operation_error("domain is not running");
		domain.info.state = Vm_state::paused;
		info = domain.info;
	}
	notify("suspended", info);
}

void Dummy_client::resume(const std::string &uuid)
{
	Domain_info info;
	{
		std::lock_guard<std::mutex> lock(mutex);
		enter("resume");
		auto &domain = get_domain(uuid);
		if (domain.info.state != Vm_state::paused)
			throw invalid_operation_error("domain is not paused");
		domain.info.state = Vm_state::running;
		info = domain.info;
	}
	notify("resumed", info);
}

void Dummy_client::undefine(const std::string &uuid)
{
	Domain_info info;
	{
		std::lock_guard<std::mutex> lock(mutex);
		enter("undefine");
		auto &domain = get_domain(uuid);
		info = domain.info;
		// An active domain stays as a transient one.
		if (domain.info.active)
			domain.info.persistent = false;
		else
			domains.erase(uuid);
	}
	notify("undefined", info);
}

void Dummy_client::set_max_memory(const std::string &uuid, unsigned long long memory_kb)
{
	std::lock_guard<std::mutex> lock(mutex);
	enter("set_max_memory");
	auto &domain = get_domain(uuid);
	domain.info.max_memory_kb = memory_kb;
	if (domain.info.memory_kb > memory_kb)
		domain.info.memory_kb = memory_kb;
}

void Dummy_client::set_memory(const std::string &uuid, unsigned long long memory_kb, bool live)
{
	std::lock_guard<std::mutex> lock(mutex);
	enter("set_memory");
	auto &domain = get_domain(uuid);
	(void) live;
	if (memory_kb > domain.info.max_memory_kb)
		throw Hypervisor_error(Hypervisor_error::Category::operation, "invalid argument: cannot set memory higher than max memory");
	domain.info.memory_kb = memory_kb;
}

void Dummy_client::set_max_vcpus(const std::string &uuid, unsigned int vcpus)
{
	std::lock_guard<std::mutex> lock(mutex);
	enter("set_max_vcpus");
	auto &domain = get_domain(uuid);
	domain.info.max_vcpus = vcpus;
	if (domain.info.vcpus > vcpus)
		domain.info.vcpus = vcpus;
}

void Dummy_client::set_vcpus(const std::string &uuid, unsigned int vcpus, bool live)
{
	std::lock_guard<std::mutex> lock(mutex);
	enter("set_vcpus");
	auto &domain = get_domain(uuid);
	(void) live;
	if (vcpus > domain.info.max_vcpus)
		throw Hypervisor_error(Hypervisor_error::Category::operation, "invalid argument: requested vcpus is greater than max allowable vcpus");
	domain.info.vcpus = vcpus;
}

void Dummy_client::set_scheduler_params(const std::string &uuid, const Scheduler_params &params)
{
	std::lock_guard<std::mutex> lock(mutex);
	enter("set_scheduler_params");
	auto &domain = get_domain(uuid);
	if (params.cpu_shares)
		domain.scheduler_params.cpu_shares = params.cpu_shares;
	if (params.vcpu_period)
		domain.scheduler_params.vcpu_period = params.vcpu_period;
	if (params.vcpu_quota)
		domain.scheduler_params.vcpu_quota = params.vcpu_quota;
}

void Dummy_client::set_memory_params(const std::string &uuid, const Memory_params &params)
{
	std::lock_guard<std::mutex> lock(mutex);
	enter("set_memory_params");
	auto &domain = get_domain(uuid);
	if (params.hard_limit_kb)
		domain.memory_params.hard_limit_kb = params.hard_limit_kb;
	if (params.soft_limit_kb)
		domain.memory_params.soft_limit_kb = params.soft_limit_kb;
}

Cpu_stats Dummy_client::get_cpu_stats(const std::string &uuid)
{
	std::lock_guard<std::mutex> lock(mutex);
	enter("get_cpu_stats");
	auto &domain = get_domain(uuid);
	if (!is_active(domain.info.state))
		throw invalid_operation_error("domain is not running");
	// Counters grow with every query.
	auto counter = ++domain.stats_counter;
	Cpu_stats stats;
	stats.user_time_ns = counter * 600000000ULL;
	stats.system_time_ns = counter * 400000000ULL;
	stats.cpu_time_ns = stats.user_time_ns + stats.system_time_ns;
	domain.info.cpu_time_ns = stats.cpu_time_ns;
	return stats;
}

Memory_stats Dummy_client::get_memory_stats(const std::string &uuid)
{
	std::lock_guard<std::mutex> lock(mutex);
	enter("get_memory_stats");
	auto &domain = get_domain(uuid);
	if (!is_active(domain.info.state))
		throw invalid_operation_error("domain is not running");
	Memory_stats stats;
	stats.actual_balloon_kb = domain.info.memory_kb;
	stats.available_kb = domain.info.memory_kb;
	stats.unused_kb = domain.info.memory_kb / 2;
	stats.rss_kb = domain.info.memory_kb / 2;
	return stats;
}

Block_stats Dummy_client::get_block_stats(const std::string &uuid, const std::string &device)
{
	std::lock_guard<std::mutex> lock(mutex);
	enter("get_block_stats");
	auto &domain = get_domain(uuid);
	bool found = false;
	for (const auto &disk : parse_domain_manifest(domain.xml).disks)
		found = found || disk.target == device;
	if (!found)
		throw invalid_operation_error("invalid path: " + device + " not assigned to domain");
	auto counter = static_cast<long long>(++domain.stats_counter);
	Block_stats stats;
	stats.rd_req = counter * 10;
	stats.rd_bytes = counter * 40960;
	stats.wr_req = counter * 5;
	stats.wr_bytes = counter * 20480;
	return stats;
}

Interface_stats Dummy_client::get_interface_stats(const std::string &uuid, const std::string &device)
{
	std::lock_guard<std::mutex> lock(mutex);
	enter("get_interface_stats");
	auto &domain = get_domain(uuid);
	bool found = false;
	for (const auto &interface : parse_domain_manifest(domain.xml).interfaces)
		found = found || (!interface.target.empty() && interface.target == device);
	if (!found)
		throw invalid_operation_error("invalid argument: invalid path, '" + device + "' is not a known interface");
	auto counter = static_cast<long long>(++domain.stats_counter);
	Interface_stats stats;
	stats.rx_bytes = counter * 1500;
	stats.rx_packets = counter;
	stats.tx_bytes = counter * 750;
	stats.tx_packets = counter;
	return stats;
}

void Dummy_client::register_lifecycle_callback(Lifecycle_callback callback)
{
	std::lock_guard<std::mutex> lock(mutex);
	enter("register_lifecycle_callback");
	this->callback = std::move(callback);
}

void Dummy_client::deregister_lifecycle_callback() noexcept
{
	std::lock_guard<std::mutex> lock(mutex);
	callback = nullptr;
}

void Dummy_client::set_reachable(bool reachable)
{
	std::lock_guard<std::mutex> lock(mutex);
	this->reachable = reachable;
	if (!reachable)
		opened = false;
}

void Dummy_client::fail_next(const std::string &operation, Hypervisor_error::Category category)
{
	std::lock_guard<std::mutex> lock(mutex);
	injected_failures[operation] = category;
}

void Dummy_client::set_shutdown_delay(unsigned int state_queries)
{
	std::lock_guard<std::mutex> lock(mutex);
	shutdown_delay = state_queries;
}

unsigned int Dummy_client::call_count(const std::string &operation) const
{
	std::lock_guard<std::mutex> lock(mutex);
	auto it = calls.find(operation);
	return it == calls.end() ? 0 : it->second;
}

unsigned int Dummy_client::open_count() const
{
	std::lock_guard<std::mutex> lock(mutex);
	return opens;
}

Scheduler_params Dummy_client::get_scheduler_params(const std::string &uuid) const
{
	std::lock_guard<std::mutex> lock(mutex);
	auto it = domains.find(uuid);
	if (it == domains.end())
		throw no_domain_error(uuid);
	return it->second.scheduler_params;
}

Memory_params Dummy_client::get_memory_params(const std::string &uuid) const
{
	std::lock_guard<std::mutex> lock(mutex);
	auto it = domains.find(uuid);
	if (it == domains.end())
		throw no_domain_error(uuid);
	return it->second.memory_params;
}

void Dummy_client::set_crashed(const std::string &uuid)
{
	std::lock_guard<std::mutex> lock(mutex);
	auto &domain = get_domain(uuid);
	if (!domain.info.active)
		throw invalid_operation_error("domain is not running");
	domain.shutdown_pending = false;
	domain.info.state = Vm_state::error;
}

std::vector<std::string> Dummy_client::call_history() const
{
	std::lock_guard<std::mutex> lock(mutex);
	return history;
}
