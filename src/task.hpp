/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef TASK_HPP
#define TASK_HPP

#include "engine.hpp"
#include "vm_spec.hpp"

#include <fast-lib/communication/communicator.hpp>
#include <fast-lib/serialization/serializable.hpp>
#include <boost/optional.hpp>

#include <memory>
#include <string>

/**
 * \brief A request received as YAML message.
 *
 * The task names the operation (e.g. "start vm"). Parameters which do not apply to the task are ignored.
 */
struct Task :
	public fast::Serializable
{
	std::string task;
	std::string id;
	boost::optional<std::string> vm_name;
	boost::optional<std::string> uuid;
	bool force = false;
	bool delete_disks = false;
	boost::optional<Vm_spec> spec;
	boost::optional<std::string> new_name;
	boost::optional<std::string> new_uuid;
	boost::optional<int> cpu_cores;
	boost::optional<long long> memory_mb;
	bool live = false;
	boost::optional<Limits_config> limits;
	bool time_measurement = false;

	// The target vm, throws std::invalid_argument unless exactly one of vm-name and uuid is set.
	Vm_id target() const;

	YAML::Node emit() const override;
	void load(const YAML::Node &node) override;
};
YAML_CONVERT_IMPL(Task)

/**
 * \brief The answer to a Task.
 *
 * status is success or error. An error carries error_kind and message.
 */
struct Task_result :
	public fast::Serializable
{
	Task_result() = default;
	Task_result(std::string result, std::string id, std::string status);

	std::string result;
	std::string id;
	std::string status;
	std::string error_kind;
	std::string message;
	YAML::Node data;

	YAML::Node emit() const override;
	void load(const YAML::Node &node) override;
};
YAML_CONVERT_IMPL(Task_result)

/**
 * \brief Execute a task on the engine.
 *
 * Never throws, failures are returned as error result.
 */
Task_result execute(const Task &task, Engine &engine);

void send_parse_error(std::shared_ptr<fast::Communicator> comm, const std::string &msg, const std::string &id = "");

void send_parse_error_nothrow(std::shared_ptr<fast::Communicator> comm, const std::string &msg, const std::string &id = "");

void send_quit_result(std::shared_ptr<fast::Communicator> comm, const std::string &id);

#endif
