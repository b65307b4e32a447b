/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "libvirt_client.hpp"

#include "utility.hpp"

#include <libvirt/virterror.h>
#include <fast-lib/log.hpp>

#include <cstdlib>
#include <stdexcept>
#include <utility>

FASTLIB_LOG_INIT(libvirt_client_log, "Libvirt_client")
FASTLIB_LOG_SET_LEVEL_GLOBAL(libvirt_client_log, trace);

//
// Helper functions
//

/**
 * \brief Classify the last libvirt error.
 *
 * Transport and connection failures make the Connection_manager drop the handle.
 */
Hypervisor_error::Category get_last_error_category()
{
	auto err = virGetLastError();
	if (!err)
		return Hypervisor_error::Category::operation;
	switch (err->code) {
		case VIR_ERR_NO_DOMAIN:
			return Hypervisor_error::Category::no_domain;
		case VIR_ERR_NO_CONNECT:
		case VIR_ERR_INVALID_CONN:
		case VIR_ERR_AUTH_FAILED:
		case VIR_ERR_RPC:
			return Hypervisor_error::Category::connection;
		default:
			break;
	}
	if (err->domain == VIR_FROM_RPC || err->domain == VIR_FROM_REMOTE)
		return Hypervisor_error::Category::connection;
	return Hypervisor_error::Category::operation;
}

[[noreturn]] void throw_libvirt_error(const std::string &what)
{
	auto category = get_last_error_category();
	throw Hypervisor_error(category, what + ": " + virGetLastErrorMessage());
}

Vm_state convert_domain_state(int state)
{
	switch (state) {
		case VIR_DOMAIN_RUNNING:
		case VIR_DOMAIN_BLOCKED:
			return Vm_state::running;
		case VIR_DOMAIN_PAUSED:
			return Vm_state::paused;
		case VIR_DOMAIN_SHUTDOWN:
			return Vm_state::stopping;
		case VIR_DOMAIN_SHUTOFF:
			return Vm_state::stopped;
		case VIR_DOMAIN_PMSUSPENDED:
			return Vm_state::suspended;
		case VIR_DOMAIN_NOSTATE:
		case VIR_DOMAIN_CRASHED:
		default:
			return Vm_state::error;
	}
}

std::string convert_event_type(int event)
{
	switch (event) {
		case VIR_DOMAIN_EVENT_DEFINED:
			return "defined";
		case VIR_DOMAIN_EVENT_UNDEFINED:
			return "undefined";
		case VIR_DOMAIN_EVENT_STARTED:
			return "started";
		case VIR_DOMAIN_EVENT_SUSPENDED:
			return "suspended";
		case VIR_DOMAIN_EVENT_RESUMED:
			return "resumed";
		case VIR_DOMAIN_EVENT_STOPPED:
			return "stopped";
		case VIR_DOMAIN_EVENT_SHUTDOWN:
			return "shutdown";
		case VIR_DOMAIN_EVENT_PMSUSPENDED:
			return "pmsuspended";
		case VIR_DOMAIN_EVENT_CRASHED:
			return "crashed";
		default:
			return "unknown";
	}
}

std::string get_domain_uuid(virDomainPtr domain)
{
	char uuid[VIR_UUID_STRING_BUFLEN];
	if (virDomainGetUUIDString(domain, uuid) == -1)
		throw_libvirt_error("Error getting uuid of domain");
	return std::string(uuid);
}

Domain_info get_domain_info(virDomainPtr domain)
{
	Domain_info info;
	auto name = virDomainGetName(domain);
	if (!name)
		throw_libvirt_error("Error getting name of domain");
	info.name = name;
	info.uuid = get_domain_uuid(domain);
	int state = VIR_DOMAIN_NOSTATE;
	int reason = 0;
	if (virDomainGetState(domain, &state, &reason, 0) == -1)
		throw_libvirt_error("Error getting state of domain " + info.name);
	info.state = convert_domain_state(state);
	info.state_reason = reason;
	virDomainInfo domain_info;
	if (virDomainGetInfo(domain, &domain_info) == -1)
		throw_libvirt_error("Error getting info of domain " + info.name);
	info.max_memory_kb = domain_info.maxMem;
	info.memory_kb = domain_info.memory;
	info.vcpus = domain_info.nrVirtCpu;
	info.cpu_time_ns = domain_info.cpuTime;
	// Maximum of the live config if active, else of the persistent one.
	auto max_vcpus = virDomainGetVcpusFlags(domain, VIR_DOMAIN_VCPU_MAXIMUM);
	if (max_vcpus == -1)
		throw_libvirt_error("Error getting maximum vcpus of domain " + info.name);
	info.max_vcpus = static_cast<unsigned int>(max_vcpus);
	auto persistent = virDomainIsPersistent(domain);
	if (persistent == -1)
		throw_libvirt_error("Error checking if domain is persistent");
	info.persistent = persistent == 1;
	auto active = virDomainIsActive(domain);
	if (active == -1)
		throw_libvirt_error("Error checking if domain is active");
	info.active = active == 1;
	return info;
}

/**
 * \brief Find a domain with the specified uuid.
 *
 * Throws Hypervisor_error with category no_domain if there is none.
 */
std::shared_ptr<virDomain> find_by_uuid(virConnectPtr conn, const std::string &uuid)
{
	FASTLIB_LOG(libvirt_client_log, trace) << "Get domain by uuid " << uuid << ".";
	std::shared_ptr<virDomain> domain(
		virDomainLookupByUUIDString(conn, uuid.c_str()),
		Deleter_virDomain()
	);
	if (!domain)
		throw_libvirt_error("Error looking up domain " + uuid);
	return domain;
}

// Returns an empty pointer if the lookup failed because the domain does not exist.
template<typename Lookup_func>
std::shared_ptr<virDomain> find_domain_or_null(Lookup_func lookup, const std::string &key)
{
	std::shared_ptr<virDomain> domain(lookup(), Deleter_virDomain());
	if (!domain) {
		auto category = get_last_error_category();
		if (category == Hypervisor_error::Category::no_domain)
			return domain;
		throw Hypervisor_error(category, "Error looking up domain " + key + ": " + virGetLastErrorMessage());
	}
	return domain;
}

/**
 * \brief Holds typed parameters built with virTypedParamsAdd*.
 */
struct Typed_params
{
	virTypedParameterPtr params = nullptr;
	int nparams = 0;
	int maxparams = 0;

	Typed_params() = default;
	Typed_params(const Typed_params &) = delete;
	Typed_params & operator=(const Typed_params &) = delete;
	~Typed_params()
	{
		virTypedParamsFree(params, nparams);
	}

	void add_ullong(const char *name, unsigned long long value)
	{
		if (virTypedParamsAddULLong(&params, &nparams, &maxparams, name, value) < 0)
			throw_libvirt_error(std::string("Error adding parameter ") + name);
	}

	void add_llong(const char *name, long long value)
	{
		if (virTypedParamsAddLLong(&params, &nparams, &maxparams, name, value) < 0)
			throw_libvirt_error(std::string("Error adding parameter ") + name);
	}
};

// The default event loop is wakened up regularly so that it notices when it shall stop.
void event_loop_tick(int timer, void *opaque)
{
	(void) timer; (void) opaque;
}

//
// Libvirt_client implementation
//

Libvirt_client::Libvirt_client() :
	callback_id(-1),
	event_loop_running(false)
{
	// The event implementation must be registered before the first connection is opened.
	static std::once_flag event_impl_flag;
	std::call_once(event_impl_flag, []
	{
		if (virEventRegisterDefaultImpl() == -1)
			throw std::runtime_error(std::string("Error registering libvirt event implementation: ") + virGetLastErrorMessage());
	});
}

Libvirt_client::~Libvirt_client()
{
	close();
}

void Libvirt_client::open(const std::string &uri)
{
	FASTLIB_LOG(libvirt_client_log, trace) << "Connect to " + uri;
	close();
	conn.reset(virConnectOpen(uri.c_str()), Deleter_virConnect());
	if (!conn)
		throw Hypervisor_error(Hypervisor_error::Category::connection,
				"Failed to connect to libvirt with uri " + uri + ": " + virGetLastErrorMessage());
	this->uri = uri;
}

void Libvirt_client::close() noexcept
{
	deregister_lifecycle_callback();
	if (conn) {
		FASTLIB_LOG(libvirt_client_log, trace) << "Close connection to " + uri;
		conn.reset();
	}
}

bool Libvirt_client::is_open() const
{
	return conn != nullptr;
}

virConnectPtr Libvirt_client::connection() const
{
	if (!conn)
		throw Hypervisor_error(Hypervisor_error::Category::connection, "Connection to libvirt is not open.");
	return conn.get();
}

std::string Libvirt_client::get_hostname()
{
	auto hostname = convert_and_free_cstr(virConnectGetHostname(connection()));
	if (hostname.empty())
		throw_libvirt_error("Error getting hostname of hypervisor");
	return hostname;
}

Node_info Libvirt_client::get_node_info()
{
	virNodeInfo node_info;
	if (virNodeGetInfo(connection(), &node_info) == -1)
		throw_libvirt_error("Error getting node info");
	Node_info info;
	info.model = node_info.model;
	info.memory_kb = node_info.memory;
	info.cpus = node_info.cpus;
	info.mhz = node_info.mhz;
	info.nodes = node_info.nodes;
	info.sockets = node_info.sockets;
	info.cores = node_info.cores;
	info.threads = node_info.threads;
	if (node_info.nodes > 0) {
		std::vector<unsigned long long> free_memory(node_info.nodes);
		auto cells = virNodeGetCellsFreeMemory(connection(), free_memory.data(), 0, node_info.nodes);
		if (cells < 0) {
			FASTLIB_LOG(libvirt_client_log, debug) << "Free memory per NUMA cell not available: " << virGetLastErrorMessage();
		} else {
			free_memory.resize(cells);
			for (auto bytes : free_memory)
				info.cells_free_memory_kb.push_back(bytes / 1024);
		}
	}
	return info;
}

Hypervisor_version Libvirt_client::get_version()
{
	Hypervisor_version version;
	auto type = virConnectGetType(connection());
	if (!type)
		throw_libvirt_error("Error getting hypervisor type");
	version.type = type;
	if (virConnectGetVersion(connection(), &version.version) == -1)
		throw_libvirt_error("Error getting hypervisor version");
	if (virConnectGetLibVersion(connection(), &version.lib_version) == -1)
		throw_libvirt_error("Error getting libvirt version");
	return version;
}

std::vector<Domain_info> Libvirt_client::list_domains(bool active_only)
{
	virDomainPtr *domains_carray = nullptr;
	auto num = virConnectListAllDomains(connection(), &domains_carray, active_only ? VIR_CONNECT_LIST_DOMAINS_ACTIVE : 0);
	if (num < 0)
		throw_libvirt_error("Error getting list of domains");
	// Take ownership first so that nothing leaks if reading the info throws.
	std::vector<std::unique_ptr<virDomain, Deleter_virDomain>> domains(domains_carray, domains_carray + num);
	free(domains_carray);
	std::vector<Domain_info> infos;
	infos.reserve(domains.size());
	for (const auto &domain : domains) {
		try {
			infos.push_back(get_domain_info(domain.get()));
		} catch (const Hypervisor_error &e) {
			// Domain vanished in the meantime.
			if (e.get_category() != Hypervisor_error::Category::no_domain)
				throw;
			FASTLIB_LOG(libvirt_client_log, debug) << "Skip vanished domain: " << e.what();
		}
	}
	return infos;
}

boost::optional<Domain_info> Libvirt_client::lookup_by_name(const std::string &name)
{
	auto conn_ptr = connection();
	auto domain = find_domain_or_null([conn_ptr, &name] {return virDomainLookupByName(conn_ptr, name.c_str());}, name);
	if (!domain)
		return boost::none;
	return get_domain_info(domain.get());
}

boost::optional<Domain_info> Libvirt_client::lookup_by_uuid(const std::string &uuid)
{
	auto conn_ptr = connection();
	auto domain = find_domain_or_null([conn_ptr, &uuid] {return virDomainLookupByUUIDString(conn_ptr, uuid.c_str());}, uuid);
	if (!domain)
		return boost::none;
	return get_domain_info(domain.get());
}

std::string Libvirt_client::get_xml_desc(const std::string &uuid)
{
	auto domain = find_by_uuid(connection(), uuid);
	auto xml_str = convert_and_free_cstr(virDomainGetXMLDesc(domain.get(), 0));
	if (xml_str.empty())
		throw_libvirt_error("Error getting xml description");
	return xml_str;
}

Domain_info Libvirt_client::define_xml(const std::string &xml)
{
	FASTLIB_LOG(libvirt_client_log, trace) << "Define persistent domain from xml.";
	std::shared_ptr<virDomain> domain(
		virDomainDefineXML(connection(), xml.c_str()),
		Deleter_virDomain()
	);
	if (!domain)
		throw_libvirt_error("Error defining domain from xml");
	return get_domain_info(domain.get());
}

void Libvirt_client::create(const std::string &uuid)
{
	FASTLIB_LOG(libvirt_client_log, trace) << "Create domain " << uuid << ".";
	auto domain = find_by_uuid(connection(), uuid);
	if (virDomainCreate(domain.get()) == -1)
		throw_libvirt_error("Error creating domain");
}

void Libvirt_client::destroy(const std::string &uuid)
{
	FASTLIB_LOG(libvirt_client_log, trace) << "Destroy domain " << uuid << ".";
	auto domain = find_by_uuid(connection(), uuid);
	if (virDomainDestroy(domain.get()) == -1)
		throw_libvirt_error("Error destroying domain");
}

void Libvirt_client::shutdown(const std::string &uuid)
{
	FASTLIB_LOG(libvirt_client_log, trace) << "Shutdown domain " << uuid << ".";
	auto domain = find_by_uuid(connection(), uuid);
	if (virDomainShutdown(domain.get()) == -1)
		throw_libvirt_error("Error shutting down domain");
}

void Libvirt_client::suspend(const std::string &uuid)
{
	FASTLIB_LOG(libvirt_client_log, trace) << "Suspend domain " << uuid << ".";
	auto domain = find_by_uuid(connection(), uuid);
	if (virDomainSuspend(domain.get()) == -1)
		throw_libvirt_error("Error suspending domain");
}

void Libvirt_client::resume(const std::string &uuid)
{
	FASTLIB_LOG(libvirt_client_log, trace) << "Resume domain " << uuid << ".";
	auto domain = find_by_uuid(connection(), uuid);
	if (virDomainResume(domain.get()) == -1)
		throw_libvirt_error("Error resuming domain");
}

void Libvirt_client::undefine(const std::string &uuid)
{
	FASTLIB_LOG(libvirt_client_log, trace) << "Undefine domain " << uuid << ".";
	auto domain = find_by_uuid(connection(), uuid);
	if (virDomainUndefineFlags(domain.get(), VIR_DOMAIN_UNDEFINE_MANAGED_SAVE | VIR_DOMAIN_UNDEFINE_SNAPSHOTS_METADATA) == -1)
		throw_libvirt_error("Error undefining domain");
}

void Libvirt_client::set_max_memory(const std::string &uuid, unsigned long long memory_kb)
{
	FASTLIB_LOG(libvirt_client_log, trace) << "Set maximum memory.";
	auto domain = find_by_uuid(connection(), uuid);
	if (virDomainSetMemoryFlags(domain.get(), memory_kb, VIR_DOMAIN_AFFECT_CONFIG | VIR_DOMAIN_MEM_MAXIMUM) == -1)
		throw_libvirt_error("Error setting maximum amount of memory to " + std::to_string(memory_kb) + " KiB");
}

void Libvirt_client::set_memory(const std::string &uuid, unsigned long long memory_kb, bool live)
{
	FASTLIB_LOG(libvirt_client_log, trace) << "Set memory.";
	auto domain = find_by_uuid(connection(), uuid);
	unsigned int flags = live ? (VIR_DOMAIN_AFFECT_LIVE | VIR_DOMAIN_AFFECT_CONFIG) : VIR_DOMAIN_AFFECT_CONFIG;
	if (virDomainSetMemoryFlags(domain.get(), memory_kb, flags) == -1)
		throw_libvirt_error("Error setting amount of memory to " + std::to_string(memory_kb) + " KiB");
}

void Libvirt_client::set_max_vcpus(const std::string &uuid, unsigned int vcpus)
{
	FASTLIB_LOG(libvirt_client_log, trace) << "Set maximum VCPUs.";
	auto domain = find_by_uuid(connection(), uuid);
	if (virDomainSetVcpusFlags(domain.get(), vcpus, VIR_DOMAIN_AFFECT_CONFIG | VIR_DOMAIN_VCPU_MAXIMUM) == -1)
		throw_libvirt_error("Error setting maximum number of vcpus to " + std::to_string(vcpus));
}

void Libvirt_client::set_vcpus(const std::string &uuid, unsigned int vcpus, bool live)
{
	FASTLIB_LOG(libvirt_client_log, trace) << "Set VCPUs.";
	auto domain = find_by_uuid(connection(), uuid);
	unsigned int flags = live ? (VIR_DOMAIN_AFFECT_LIVE | VIR_DOMAIN_AFFECT_CONFIG) : VIR_DOMAIN_AFFECT_CONFIG;
	if (virDomainSetVcpusFlags(domain.get(), vcpus, flags) == -1)
		throw_libvirt_error("Error setting number of vcpus to " + std::to_string(vcpus));
}

void Libvirt_client::set_scheduler_params(const std::string &uuid, const Scheduler_params &params)
{
	auto domain = find_by_uuid(connection(), uuid);
	Typed_params typed_params;
	if (params.cpu_shares)
		typed_params.add_ullong(VIR_DOMAIN_SCHEDULER_CPU_SHARES, *params.cpu_shares);
	if (params.vcpu_period)
		typed_params.add_ullong(VIR_DOMAIN_SCHEDULER_VCPU_PERIOD, *params.vcpu_period);
	if (params.vcpu_quota)
		typed_params.add_llong(VIR_DOMAIN_SCHEDULER_VCPU_QUOTA, *params.vcpu_quota);
	if (typed_params.nparams == 0)
		return;
	if (virDomainSetSchedulerParametersFlags(domain.get(), typed_params.params, typed_params.nparams, VIR_DOMAIN_AFFECT_CURRENT) == -1)
		throw_libvirt_error("Error setting scheduler parameters");
}

void Libvirt_client::set_memory_params(const std::string &uuid, const Memory_params &params)
{
	auto domain = find_by_uuid(connection(), uuid);
	Typed_params typed_params;
	if (params.hard_limit_kb)
		typed_params.add_ullong(VIR_DOMAIN_MEMORY_HARD_LIMIT, *params.hard_limit_kb);
	if (params.soft_limit_kb)
		typed_params.add_ullong(VIR_DOMAIN_MEMORY_SOFT_LIMIT, *params.soft_limit_kb);
	if (typed_params.nparams == 0)
		return;
	if (virDomainSetMemoryParameters(domain.get(), typed_params.params, typed_params.nparams, VIR_DOMAIN_AFFECT_CURRENT) == -1)
		throw_libvirt_error("Error setting memory parameters");
}

Cpu_stats Libvirt_client::get_cpu_stats(const std::string &uuid)
{
	auto domain = find_by_uuid(connection(), uuid);
	// Ask for the number of parameters of the total statistics first.
	auto nparams = virDomainGetCPUStats(domain.get(), nullptr, 0, -1, 1, 0);
	if (nparams < 0)
		throw_libvirt_error("Error getting number of cpu stats");
	std::vector<virTypedParameter> params(nparams);
	if (virDomainGetCPUStats(domain.get(), params.data(), nparams, -1, 1, 0) < 0)
		throw_libvirt_error("Error getting cpu stats");
	Cpu_stats stats;
	virTypedParamsGetULLong(params.data(), nparams, VIR_DOMAIN_CPU_STATS_CPUTIME, &stats.cpu_time_ns);
	virTypedParamsGetULLong(params.data(), nparams, VIR_DOMAIN_CPU_STATS_USERTIME, &stats.user_time_ns);
	virTypedParamsGetULLong(params.data(), nparams, VIR_DOMAIN_CPU_STATS_SYSTEMTIME, &stats.system_time_ns);
	virTypedParamsClear(params.data(), nparams);
	return stats;
}

Memory_stats Libvirt_client::get_memory_stats(const std::string &uuid)
{
	auto domain = find_by_uuid(connection(), uuid);
	virDomainMemoryStatStruct mem_stats[VIR_DOMAIN_MEMORY_STAT_NR];
	int statcnt;
	if ((statcnt = virDomainMemoryStats(domain.get(), mem_stats, VIR_DOMAIN_MEMORY_STAT_NR, 0)) == -1)
		throw_libvirt_error("Error getting memory stats");
	Memory_stats stats;
	for (int i = 0; i != statcnt; ++i) {
		if (mem_stats[i].tag == VIR_DOMAIN_MEMORY_STAT_UNUSED)
			stats.unused_kb = mem_stats[i].val;
		if (mem_stats[i].tag == VIR_DOMAIN_MEMORY_STAT_AVAILABLE)
			stats.available_kb = mem_stats[i].val;
		if (mem_stats[i].tag == VIR_DOMAIN_MEMORY_STAT_ACTUAL_BALLOON)
			stats.actual_balloon_kb = mem_stats[i].val;
		if (mem_stats[i].tag == VIR_DOMAIN_MEMORY_STAT_RSS)
			stats.rss_kb = mem_stats[i].val;
	}
	return stats;
}

Block_stats Libvirt_client::get_block_stats(const std::string &uuid, const std::string &device)
{
	auto domain = find_by_uuid(connection(), uuid);
	virDomainBlockStatsStruct block_stats;
	if (virDomainBlockStats(domain.get(), device.c_str(), &block_stats, sizeof(block_stats)) == -1)
		throw_libvirt_error("Error getting block stats of " + device);
	Block_stats stats;
	stats.rd_req = block_stats.rd_req;
	stats.rd_bytes = block_stats.rd_bytes;
	stats.wr_req = block_stats.wr_req;
	stats.wr_bytes = block_stats.wr_bytes;
	stats.errs = block_stats.errs;
	return stats;
}

Interface_stats Libvirt_client::get_interface_stats(const std::string &uuid, const std::string &device)
{
	auto domain = find_by_uuid(connection(), uuid);
	virDomainInterfaceStatsStruct if_stats;
	if (virDomainInterfaceStats(domain.get(), device.c_str(), &if_stats, sizeof(if_stats)) == -1)
		throw_libvirt_error("Error getting interface stats of " + device);
	Interface_stats stats;
	stats.rx_bytes = if_stats.rx_bytes;
	stats.rx_packets = if_stats.rx_packets;
	stats.rx_errs = if_stats.rx_errs;
	stats.rx_drop = if_stats.rx_drop;
	stats.tx_bytes = if_stats.tx_bytes;
	stats.tx_packets = if_stats.tx_packets;
	stats.tx_errs = if_stats.tx_errs;
	stats.tx_drop = if_stats.tx_drop;
	return stats;
}

void Libvirt_client::register_lifecycle_callback(Lifecycle_callback callback)
{
	{
		std::lock_guard<std::mutex> lock(callback_mutex);
		this->callback = std::move(callback);
	}
	if (callback_id >= 0)
		return;
	FASTLIB_LOG(libvirt_client_log, trace) << "Register lifecycle event callback.";
	callback_id = virConnectDomainEventRegisterAny(connection(), nullptr, VIR_DOMAIN_EVENT_ID_LIFECYCLE,
			VIR_DOMAIN_EVENT_CALLBACK(lifecycle_event_handler), this, nullptr);
	if (callback_id < 0)
		throw_libvirt_error("Error registering lifecycle event callback");
	start_event_loop();
}

void Libvirt_client::deregister_lifecycle_callback() noexcept
{
	if (callback_id >= 0 && conn) {
		if (virConnectDomainEventDeregisterAny(conn.get(), callback_id) == -1)
			FASTLIB_LOG(libvirt_client_log, warn) << "Error deregistering lifecycle event callback: " << virGetLastErrorMessage();
	}
	callback_id = -1;
	stop_event_loop();
	std::lock_guard<std::mutex> lock(callback_mutex);
	callback = nullptr;
}

int Libvirt_client::lifecycle_event_handler(virConnectPtr conn, virDomainPtr domain, int event, int detail, void *opaque)
{
	(void) conn;
	auto client = static_cast<Libvirt_client *>(opaque);
	Lifecycle_event lifecycle_event;
	auto name = virDomainGetName(domain);
	if (name)
		lifecycle_event.name = name;
	char uuid[VIR_UUID_STRING_BUFLEN];
	if (virDomainGetUUIDString(domain, uuid) == 0)
		lifecycle_event.uuid = uuid;
	lifecycle_event.type = convert_event_type(event);
	lifecycle_event.detail = detail;
	Lifecycle_callback callback;
	{
		std::lock_guard<std::mutex> lock(client->callback_mutex);
		callback = client->callback;
	}
	if (callback) {
		// Exceptions must not cross the C boundary.
		try {
			callback(lifecycle_event);
		} catch (const std::exception &e) {
			FASTLIB_LOG(libvirt_client_log, warn) << "Exception in lifecycle event callback: " << e.what();
		}
	}
	return 0;
}

void Libvirt_client::start_event_loop()
{
	if (event_loop_running)
		return;
	event_loop_running = true;
	event_loop_thread = std::thread([this]
	{
		auto timer = virEventAddTimeout(1000, event_loop_tick, nullptr, nullptr);
		if (timer < 0)
			FASTLIB_LOG(libvirt_client_log, warn) << "Error adding event loop timeout.";
		while (event_loop_running) {
			if (virEventRunDefaultImpl() < 0)
				FASTLIB_LOG(libvirt_client_log, warn) << "Error running event loop: " << virGetLastErrorMessage();
		}
		if (timer >= 0)
			virEventRemoveTimeout(timer);
	});
}

void Libvirt_client::stop_event_loop() noexcept
{
	if (!event_loop_running)
		return;
	event_loop_running = false;
	if (event_loop_thread.joinable())
		event_loop_thread.join();
}
