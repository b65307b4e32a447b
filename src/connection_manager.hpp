/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef CONNECTION_MANAGER_HPP
#define CONNECTION_MANAGER_HPP

#include "hypervisor_client.hpp"
#include "errors.hpp"

#include <boost/optional.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

/**
 * \brief Owns the single long-lived connection to the hypervisor.
 *
 * All hypervisor calls are serialized by one mutex. The connection is opened lazily, checked for liveness
 * at most once per liveness interval and reopened if the check fails.
 * Constructed once by the application and shared by all components.
 */
class Connection_manager
{
public:
	/**
	 * \brief Exclusive access to the open client.
	 *
	 * Holds the manager mutex for its whole lifetime.
	 */
	class Connection
	{
	public:
		Connection(std::unique_lock<std::mutex> lock, Hypervisor_client &client);
		Connection(Connection &&) = default;

		Hypervisor_client * operator->() const;
		Hypervisor_client & client() const;
	private:
		std::unique_lock<std::mutex> lock;
		Hypervisor_client *client_ptr;
	};

	/**
	 * \brief Construct a Connection_manager.
	 *
	 * \param client The client to manage, not opened yet.
	 * \param uri The uri to open the client with.
	 * \param liveness_interval Minimum time between two liveness checks, zero checks on every use.
	 */
	Connection_manager(std::unique_ptr<Hypervisor_client> client, std::string uri,
			std::chrono::seconds liveness_interval = std::chrono::seconds(300));
	/**
	 * \brief Closes the connection.
	 */
	~Connection_manager();

	Connection_manager(const Connection_manager &) = delete;
	Connection_manager & operator=(const Connection_manager &) = delete;

	/**
	 * \brief Get the active connection, opening or reopening it if required.
	 *
	 * Throws Connection_error if the hypervisor cannot be reached.
	 */
	Connection connect();
	/**
	 * \brief Close the connection. Calling it twice is harmless.
	 */
	void disconnect() noexcept;
	bool is_connected();
	const std::string & get_uri() const;

	/**
	 * \brief Run func with the client and translate failures.
	 *
	 * Connection failures drop the handle and raise Connection_error, a missing domain raises Not_found_error
	 * and other hypervisor failures raise Operation_error with the given operation and vm name.
	 */
	template<typename Func>
	auto execute(const std::string &operation, const std::string &vm_name, Func &&func)
		-> decltype(func(std::declval<Hypervisor_client &>()));
	/**
	 * \brief Run func for an operation not bound to a vm.
	 *
	 * Failures other than connection failures raise Engine_error.
	 */
	template<typename Func>
	auto execute(const std::string &operation, Func &&func)
		-> decltype(func(std::declval<Hypervisor_client &>()));

	/**
	 * \brief Resolve a vm.
	 *
	 * \returns boost::none if no such vm exists.
	 * Throws Validation_error for a malformed uuid without asking the hypervisor.
	 */
	boost::optional<Domain_info> find(const Vm_id &id);
	/**
	 * \brief Resolve a vm, throws Not_found_error if it does not exist.
	 */
	Domain_info lookup(const Vm_id &id);

	/**
	 * \brief Check the hypervisor. Never throws.
	 */
	Health_status health_check() noexcept;

	/**
	 * \brief Subscribe to domain lifecycle events.
	 *
	 * The subscription survives reconnects. The callback must not call back into the Connection_manager.
	 */
	void subscribe_lifecycle_events(Lifecycle_callback callback);
	void unsubscribe_lifecycle_events() noexcept;
private:
	// Expects mutex to be locked.
	void ensure_connected();
	// Expects mutex to be locked.
	void drop_connection() noexcept;

	std::mutex mutex;
	std::unique_ptr<Hypervisor_client> client;
	const std::string uri;
	const std::chrono::seconds liveness_interval;
	std::chrono::steady_clock::time_point last_check;
	Lifecycle_callback lifecycle_callback;
};

//
// Template implementation
//

template<typename Func>
auto Connection_manager::execute(const std::string &operation, const std::string &vm_name, Func &&func)
	-> decltype(func(std::declval<Hypervisor_client &>()))
{
	auto conn = connect();
	try {
		return func(conn.client());
	} catch (const Hypervisor_error &e) {
		if (e.get_category() == Hypervisor_error::Category::connection) {
			drop_connection();
			throw Connection_error("Lost connection to hypervisor during " + operation + " of VM '" + vm_name + "': " + e.what());
		}
		if (e.get_category() == Hypervisor_error::Category::no_domain)
			throw Not_found_error("VM '" + vm_name + "' not found: " + e.what());
		throw Operation_error(operation, vm_name, e.what());
	}
}

template<typename Func>
auto Connection_manager::execute(const std::string &operation, Func &&func)
	-> decltype(func(std::declval<Hypervisor_client &>()))
{
	auto conn = connect();
	try {
		return func(conn.client());
	} catch (const Hypervisor_error &e) {
		if (e.get_category() == Hypervisor_error::Category::connection) {
			drop_connection();
			throw Connection_error("Lost connection to hypervisor during " + operation + ": " + e.what());
		}
		throw Engine_error("Failed to " + operation + ": " + e.what());
	}
}

#endif
