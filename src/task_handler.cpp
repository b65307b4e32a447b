/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "task_handler.hpp"

#include "task.hpp"

#include <fast-lib/communication/mqtt_communicator.hpp>
#include <fast-lib/log.hpp>

#include <exception>
#include <stdexcept>
#include <utility>

FASTLIB_LOG_INIT(task_handler_log, "Task_handler")
FASTLIB_LOG_SET_LEVEL_GLOBAL(task_handler_log, trace);

std::shared_ptr<fast::Communicator> make_communicator(const Communicator_config &config)
{
	if (config.type != "mqtt")
		throw std::invalid_argument("Unknown communication type in configuration found.");
	return std::make_shared<fast::MQTT_communicator>(
		config.id,
		config.subscribe_topic,
		config.publish_topic,
		config.host,
		config.port,
		config.keepalive);
}

Task_handler::Task_handler(const std::string &config_file) :
	running(true)
{
	auto config = load_config_file(config_file);
	comm = make_communicator(config.communicator);
	init(config);
}

Task_handler::Task_handler(const Engine_config &config, std::shared_ptr<fast::Communicator> comm) :
	comm(std::move(comm)),
	running(true)
{
	if (!this->comm)
		throw std::invalid_argument("Task_handler requires a communicator.");
	init(config);
}

void Task_handler::init(const Engine_config &config)
{
	events = std::make_shared<Communicator_event_sink>(comm, config.communicator.event_topic);
	engine.reset(new Engine(config, events));
	workers.reset(new Worker_pool(config.workers.threads, config.workers.queue_size));
	engine->start_monitoring();
}

Task_handler::~Task_handler()
{
	FASTLIB_LOG(task_handler_log, trace) << "Waiting for tasks to finish...";
	workers->shutdown();
	engine->stop_monitoring();
	FASTLIB_LOG(task_handler_log, trace) << "All tasks are finished.";
}

void Task_handler::loop()
{
	while (running) {
		std::string msg;
		try {
			msg = comm->get_message();
			running = handle_message(msg);
		} catch (const std::exception &e) {
			send_parse_error_nothrow(comm, std::string("Exception: ") + e.what());
			FASTLIB_LOG(task_handler_log, trace) << "msg dump: " << msg;
		}
	}
	FASTLIB_LOG(task_handler_log, trace) << "Quit msg received.";
}

bool Task_handler::handle_message(const std::string &msg)
{
	Task task;
	try {
		task.from_string(msg);
	} catch (const YAML::Exception &e) {
		send_parse_error_nothrow(comm, std::string("Exception while parsing message: ") + e.what());
		FASTLIB_LOG(task_handler_log, trace) << "msg dump: " << msg;
		return true;
	}
	if (task.task == "quit") {
		send_quit_result(comm, task.id);
		return false;
	}
	auto comm = this->comm;
	auto engine = this->engine.get();
	workers->submit([task, comm, engine]
	{
		auto result = execute(task, *engine);
		try {
			comm->send_message(result.to_string());
		} catch (const std::exception &e) {
			FASTLIB_LOG(task_handler_log, warn) << "Failed to send result of " << task.task << ": " << e.what();
		}
	});
	return true;
}

Engine & Task_handler::get_engine()
{
	return *engine;
}
