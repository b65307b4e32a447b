/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "connection_manager.hpp"

#include "utility.hpp"
#include "vm_spec.hpp"

#include <fast-lib/log.hpp>

#include <stdexcept>

FASTLIB_LOG_INIT(connection_manager_log, "Connection_manager")
FASTLIB_LOG_SET_LEVEL_GLOBAL(connection_manager_log, trace);

Connection_manager::Connection::Connection(std::unique_lock<std::mutex> lock, Hypervisor_client &client) :
	lock(std::move(lock)),
	client_ptr(&client)
{
}

Hypervisor_client * Connection_manager::Connection::operator->() const
{
	return client_ptr;
}

Hypervisor_client & Connection_manager::Connection::client() const
{
	return *client_ptr;
}

Connection_manager::Connection_manager(std::unique_ptr<Hypervisor_client> client, std::string uri,
		std::chrono::seconds liveness_interval) :
	client(std::move(client)),
	uri(std::move(uri)),
	liveness_interval(liveness_interval)
{
	if (!this->client)
		throw std::invalid_argument("Connection_manager requires a hypervisor client.");
}

Connection_manager::~Connection_manager()
{
	disconnect();
}

Connection_manager::Connection Connection_manager::connect()
{
	std::unique_lock<std::mutex> lock(mutex);
	ensure_connected();
	return Connection(std::move(lock), *client);
}

void Connection_manager::disconnect() noexcept
{
	std::lock_guard<std::mutex> lock(mutex);
	if (client->is_open()) {
		FASTLIB_LOG(connection_manager_log, trace) << "Disconnect from " << uri << ".";
		client->close();
	}
}

bool Connection_manager::is_connected()
{
	std::lock_guard<std::mutex> lock(mutex);
	return client->is_open();
}

const std::string & Connection_manager::get_uri() const
{
	return uri;
}

void Connection_manager::ensure_connected()
{
	auto now = std::chrono::steady_clock::now();
	if (client->is_open()) {
		if (now - last_check < liveness_interval)
			return;
		// Check the existing handle before handing it out.
		try {
			client->get_hostname();
			last_check = now;
			return;
		} catch (const Hypervisor_error &e) {
			FASTLIB_LOG(connection_manager_log, warn) << "Liveness check failed, reconnecting: " << e.what();
			drop_connection();
		}
	}
	FASTLIB_LOG(connection_manager_log, trace) << "Open connection to " << uri << ".";
	try {
		client->open(uri);
		last_check = std::chrono::steady_clock::now();
	} catch (const Hypervisor_error &e) {
		FASTLIB_LOG(connection_manager_log, warn) << "Failed to connect to " << uri << ": " << e.what();
		drop_connection();
		throw Connection_error("Failed to connect to hypervisor at " + uri + ": " + e.what());
	}
	if (lifecycle_callback) {
		try {
			client->register_lifecycle_callback(lifecycle_callback);
		} catch (const Hypervisor_error &e) {
			FASTLIB_LOG(connection_manager_log, warn) << "Failed to renew lifecycle event subscription: " << e.what();
		}
	}
}

void Connection_manager::drop_connection() noexcept
{
	client->close();
}

boost::optional<Domain_info> Connection_manager::find(const Vm_id &id)
{
	if (id.uuid && !is_valid_uuid(*id.uuid)) {
		Validation_result result;
		result.add_error("Invalid UUID format: '" + *id.uuid + "'");
		throw Validation_error(result);
	}
	return execute("lookup", id.value(), [&id](Hypervisor_client &client)
	{
		return id.name ? client.lookup_by_name(*id.name) : client.lookup_by_uuid(*id.uuid);
	});
}

Domain_info Connection_manager::lookup(const Vm_id &id)
{
	auto info = find(id);
	if (!info)
		throw Not_found_error(id);
	return *info;
}

Health_status Connection_manager::health_check() noexcept
{
	Health_status status;
	status.uri = uri;
	status.timestamp = get_timestamp();
	try {
		std::unique_lock<std::mutex> lock(mutex);
		ensure_connected();
		status.hostname = client->get_hostname();
		auto domains = client->list_domains(false);
		status.total_domains = static_cast<unsigned int>(domains.size());
		for (const auto &domain : domains) {
			if (domain.active)
				++status.active_domains;
		}
		status.healthy = true;
	} catch (const Hypervisor_error &e) {
		if (e.get_category() == Hypervisor_error::Category::connection)
			drop_connection();
		status.error = e.what();
	} catch (const std::exception &e) {
		status.error = e.what();
	}
	if (!status.healthy)
		FASTLIB_LOG(connection_manager_log, warn) << "Health check failed: " << status.error;
	return status;
}

void Connection_manager::subscribe_lifecycle_events(Lifecycle_callback callback)
{
	auto conn = connect();
	lifecycle_callback = callback;
	try {
		conn->register_lifecycle_callback(std::move(callback));
	} catch (const Hypervisor_error &e) {
		lifecycle_callback = nullptr;
		throw Connection_error(std::string("Failed to subscribe to lifecycle events: ") + e.what());
	}
}

void Connection_manager::unsubscribe_lifecycle_events() noexcept
{
	std::lock_guard<std::mutex> lock(mutex);
	lifecycle_callback = nullptr;
	if (client->is_open())
		client->deregister_lifecycle_callback();
}
