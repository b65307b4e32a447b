/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef TASK_HANDLER_HPP
#define TASK_HANDLER_HPP

#include "config.hpp"
#include "engine.hpp"
#include "event_sink.hpp"
#include "worker_pool.hpp"

#include <fast-lib/communication/communicator.hpp>

#include <atomic>
#include <memory>
#include <string>

/**
 * \brief Class to handle incoming tasks.
 *
 * The loop() waits for a message from comm and parses it into a Task.
 * The task is executed by the Engine on the worker pool and the result is sent back via comm.
 * Communicator, hypervisor and storage are defined in a config file which is parsed on construction.
 */
class Task_handler
{
public:
	/**
	 * \brief Construct a Task_handler from a config file.
	 *
	 * Config file must be in YAML.
	 * \param config_file The name of the config file to parse.
	 */
	explicit Task_handler(const std::string &config_file);
	/**
	 * \brief Construct a Task_handler from a loaded configuration and an existing communicator.
	 */
	Task_handler(const Engine_config &config, std::shared_ptr<fast::Communicator> comm);
	/**
	 * \brief Destruct Task_handler.
	 *
	 * The destructor waits for all queued tasks to finish.
	 */
	~Task_handler();
	/**
	 * \brief Starts the main loop.
	 *
	 * Returns after a quit task has been received.
	 */
	void loop();
	/**
	 * \brief Parse and dispatch a single message.
	 *
	 * \returns false if the message was a quit task.
	 */
	bool handle_message(const std::string &msg);

	Engine & get_engine();
private:
	void init(const Engine_config &config);

	std::shared_ptr<fast::Communicator> comm;
	std::shared_ptr<Event_sink> events;
	std::unique_ptr<Engine> engine;
	std::unique_ptr<Worker_pool> workers;
	std::atomic<bool> running;
};

#endif
