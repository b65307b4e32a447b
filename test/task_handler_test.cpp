/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "test_helpers.hpp"

#include "task.hpp"
#include "task_handler.hpp"

#include <catch2/catch.hpp>

#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>

/**
 * \brief Hands out prepared messages and records the answers.
 */
class Scripted_communicator :
	public Recording_communicator
{
public:
	explicit Scripted_communicator(std::vector<std::string> script) :
		script(script.begin(), script.end())
	{
	}

	std::string get_message() override
	{
		if (script.empty())
			throw std::runtime_error("Script exhausted.");
		auto msg = script.front();
		script.pop_front();
		return msg;
	}
private:
	std::deque<std::string> script;
};

static Engine_config make_handler_config()
{
	Engine_config config;
	config.hypervisor.type = "dummy";
	config.hypervisor.uri = "dummy:///";
	config.storage.type = "dummy";
	config.storage.path = "/images";
	config.monitoring.enabled = false;
	config.workers.threads = 2;
	config.workers.queue_size = 4;
	return config;
}

// Results keyed by id, events and parse errors are left out.
static std::map<std::string, Task_result> results_by_id(const std::vector<std::string> &messages)
{
	std::map<std::string, Task_result> results;
	for (const auto &msg : messages) {
		auto node = YAML::Load(msg);
		if (!node["result"].IsDefined() || !node["id"].IsDefined())
			continue;
		Task_result result;
		result.load(node);
		results[result.id] = result;
	}
	return results;
}

TEST_CASE("The loop answers every task until quit", "[task_handler]")
{
	auto comm = std::make_shared<Scripted_communicator>(std::vector<std::string>{
		"task: health check\nid: h1\n",
		"task: [unbalanced\n",
		"task: vm status\nid: s1\nvm-name: ghost\n",
		"task: quit\nid: q1\n"
	});
	{
		Task_handler handler(make_handler_config(), comm);
		handler.loop();
	}
	auto messages = comm->get_messages();
	auto results = results_by_id(messages);
	REQUIRE(results.count("h1") == 1);
	CHECK(results["h1"].status == "success");
	REQUIRE(results.count("s1") == 1);
	CHECK(results["s1"].error_kind == "not-found");
	REQUIRE(results.count("q1") == 1);
	CHECK(results["q1"].result == "quit");

	int parse_errors = 0;
	for (const auto &msg : messages) {
		auto node = YAML::Load(msg);
		if (node["result"].IsDefined() && node["result"].as<std::string>() == "unknown")
			++parse_errors;
	}
	CHECK(parse_errors == 1);
}

TEST_CASE("Lifecycle tasks emit events on the same communicator", "[task_handler]")
{
	auto comm = std::make_shared<Scripted_communicator>(std::vector<std::string>());
	{
		Task_handler handler(make_handler_config(), comm);
		CHECK(handler.handle_message(
			"task: create vm\n"
			"id: c1\n"
			"spec:\n"
			"  name: web-1\n"
			"  memory:\n"
			"    size-mb: 1024\n"
			"  disks:\n"
			"    - name: root\n"
			"      size-gb: 10\n"
			"      bootable: true\n"
			"  networks:\n"
			"    - name: eth0\n"));
		CHECK_FALSE(handler.handle_message("task: quit\n"));
	}
	auto messages = comm->get_messages();
	auto results = results_by_id(messages);
	REQUIRE(results.count("c1") == 1);
	CHECK(results["c1"].status == "success");

	bool created_event = false;
	for (const auto &msg : messages) {
		auto node = YAML::Load(msg);
		if (node["event"].IsDefined() && node["event"].as<std::string>() == "vm_created")
			created_event = true;
	}
	CHECK(created_event);
}

TEST_CASE("A task handler needs a communicator", "[task_handler]")
{
	CHECK_THROWS_AS(Task_handler(make_handler_config(), nullptr), std::invalid_argument);
}
