/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "task.hpp"

#include "errors.hpp"
#include "serialization_utility.hpp"

#include <fast-lib/log.hpp>

#include <exception>
#include <stdexcept>
#include <utility>
#include <vector>

FASTLIB_LOG_INIT(task_log, "Task")
FASTLIB_LOG_SET_LEVEL_GLOBAL(task_log, trace);

Vm_id Task::target() const
{
	return Vm_id(vm_name, uuid);
}

YAML::Node Task::emit() const
{
	YAML::Node node;
	node["task"] = task;
	if (!id.empty())
		node["id"] = id;
	emit_optional(node, "vm-name", vm_name);
	emit_optional(node, "uuid", uuid);
	if (force)
		node["force"] = force;
	if (delete_disks)
		node["delete-disks"] = delete_disks;
	emit_optional(node, "spec", spec);
	emit_optional(node, "new-name", new_name);
	emit_optional(node, "new-uuid", new_uuid);
	emit_optional(node, "cpu-cores", cpu_cores);
	emit_optional(node, "memory-mb", memory_mb);
	if (live)
		node["live"] = live;
	emit_optional(node, "limits", limits);
	if (time_measurement)
		node["time-measurement"] = time_measurement;
	return node;
}

void Task::load(const YAML::Node &node)
{
	load_field(task, node["task"]);
	load_field(id, node["id"], "");
	load_field(vm_name, node["vm-name"]);
	load_field(uuid, node["uuid"]);
	load_field(force, node["force"], false);
	load_field(delete_disks, node["delete-disks"], false);
	load_field(spec, node["spec"]);
	load_field(new_name, node["new-name"]);
	load_field(new_uuid, node["new-uuid"]);
	load_field(cpu_cores, node["cpu-cores"]);
	load_field(memory_mb, node["memory-mb"]);
	load_field(live, node["live"], false);
	load_field(limits, node["limits"]);
	load_field(time_measurement, node["time-measurement"], false);
}

Task_result::Task_result(std::string result, std::string id, std::string status) :
	result(std::move(result)),
	id(std::move(id)),
	status(std::move(status))
{
}

YAML::Node Task_result::emit() const
{
	YAML::Node node;
	node["result"] = result;
	if (!id.empty())
		node["id"] = id;
	node["status"] = status;
	if (!error_kind.empty())
		node["error-kind"] = error_kind;
	if (!message.empty())
		node["message"] = message;
	if (data)
		node["data"] = data;
	return node;
}

void Task_result::load(const YAML::Node &node)
{
	load_field(result, node["result"]);
	load_field(id, node["id"], "");
	load_field(status, node["status"]);
	load_field(error_kind, node["error-kind"], "");
	load_field(message, node["message"], "");
	data = node["data"] ? YAML::Clone(node["data"]) : YAML::Node();
}

template<typename T>
YAML::Node emit_sequence(const std::vector<T> &items)
{
	YAML::Node node(YAML::NodeType::Sequence);
	for (const auto &item : items)
		node.push_back(item.emit());
	return node;
}

template<typename T>
const T & require(const boost::optional<T> &value, const std::string &key)
{
	if (!value)
		throw std::invalid_argument("Task requires " + key + ".");
	return *value;
}

// Run the task, throws on failure.
YAML::Node dispatch(const Task &task, Engine &engine)
{
	Time_measurement time_measurement(task.time_measurement);
	const auto &name = task.task;
	if (name == "create vm")
		return engine.create_vm(require(task.spec, "spec"), time_measurement).emit();
	if (name == "start vm")
		return engine.start_vm(task.target(), time_measurement).emit();
	if (name == "stop vm")
		return engine.stop_vm(task.target(), task.force, time_measurement).emit();
	if (name == "restart vm")
		return engine.restart_vm(task.target(), task.force, time_measurement).emit();
	if (name == "pause vm")
		return engine.pause_vm(task.target(), time_measurement).emit();
	if (name == "resume vm")
		return engine.resume_vm(task.target(), time_measurement).emit();
	if (name == "delete vm")
		return engine.delete_vm(task.target(), task.delete_disks, time_measurement).emit();
	if (name == "clone vm")
		return engine.clone_vm(task.target(), require(task.new_name, "new-name"),
				task.new_uuid ? *task.new_uuid : "", time_measurement).emit();
	if (name == "resize vm")
		return engine.resize_vm(task.target(), task.cpu_cores, task.memory_mb, task.live, time_measurement).emit();
	if (name == "set vm limits")
		return engine.set_vm_limits(task.target(), require(task.limits, "limits"), time_measurement).emit();
	if (name == "list vms")
		return emit_sequence(engine.list_vms());
	if (name == "vm status")
		return engine.get_vm_status(task.target()).emit();
	if (name == "vm metrics")
		return engine.get_vm_metrics(task.target()).emit();
	if (name == "resource limits")
		return engine.get_resource_limits().emit();
	if (name == "validate resources")
		return engine.validate_resources(require(task.spec, "spec")).emit();
	if (name == "health check")
		return engine.health_check().emit();
	throw std::invalid_argument("Unknown task: " + name);
}

Task_result execute(const Task &task, Engine &engine)
{
	FASTLIB_LOG(task_log, trace) << "Execute " << task.task << (task.id.empty() ? "" : " (" + task.id + ")") << ".";
	Task_result result(task.task, task.id, "success");
	try {
		result.data = dispatch(task, engine);
		return result;
	} catch (const Engine_error &e) {
		result.error_kind = e.kind();
		result.message = e.what();
	} catch (const std::invalid_argument &e) {
		result.error_kind = "invalid-argument";
		result.message = e.what();
	} catch (const YAML::Exception &e) {
		result.error_kind = "invalid-argument";
		result.message = std::string("Invalid task parameters: ") + e.what();
	} catch (const std::exception &e) {
		result.error_kind = "internal";
		result.message = e.what();
	}
	FASTLIB_LOG(task_log, warn) << "Exception in task " << task.task << ": " << result.message;
	result.status = "error";
	return result;
}

void send_parse_error(std::shared_ptr<fast::Communicator> comm, const std::string &msg, const std::string &id)
{
	FASTLIB_LOG(task_log, warn) << msg;
	Task_result result("unknown", id, "error");
	result.error_kind = "invalid-argument";
	result.message = msg;
	comm->send_message(result.to_string());
}

void send_parse_error_nothrow(std::shared_ptr<fast::Communicator> comm, const std::string &msg, const std::string &id)
{
	try {
		send_parse_error(comm, msg, id);
	} catch (const std::exception &e) {
		FASTLIB_LOG(task_log, warn) << "Exception while sending error message: " << e.what();
	}
}

void send_quit_result(std::shared_ptr<fast::Communicator> comm, const std::string &id)
{
	comm->send_message(Task_result("quit", id, "success").to_string());
}
