/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "test_helpers.hpp"

#include "event_sink.hpp"

#include <catch2/catch.hpp>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * \brief Records sent messages. The first send can be held back until released.
 */
class Gate_communicator :
	public fast::Communicator
{
public:
	explicit Gate_communicator(bool hold_first = false) :
		hold(hold_first),
		entered(false)
	{
	}

	void send_message(const std::string &message) override
	{
		std::unique_lock<std::mutex> lock(mutex);
		entered = true;
		cv.notify_all();
		cv.wait(lock, [this] {return !hold;});
		messages.push_back(message);
	}

	std::string get_message() override
	{
		throw std::runtime_error("Gate_communicator does not receive.");
	}

	void wait_entered()
	{
		std::unique_lock<std::mutex> lock(mutex);
		cv.wait(lock, [this] {return entered;});
	}

	void release()
	{
		std::lock_guard<std::mutex> lock(mutex);
		hold = false;
		cv.notify_all();
	}

	std::vector<std::string> get_messages()
	{
		std::lock_guard<std::mutex> lock(mutex);
		return messages;
	}
private:
	std::mutex mutex;
	std::condition_variable cv;
	bool hold;
	bool entered;
	std::vector<std::string> messages;
};

class Failing_communicator :
	public fast::Communicator
{
public:
	void send_message(const std::string &) override
	{
		throw std::runtime_error("broker gone");
	}

	std::string get_message() override
	{
		throw std::runtime_error("broker gone");
	}
};

class Throwing_sink :
	public Event_sink
{
public:
	void publish(const Event &) override
	{
		throw std::runtime_error("sink closed");
	}
};

static std::string event_type(const std::string &msg)
{
	return YAML::Load(msg)["event"].as<std::string>();
}

TEST_CASE("Events are emitted as YAML", "[event_sink]")
{
	YAML::Node data;
	data["severity"] = "warning";
	Event event("host_alert", "", "", data);
	CHECK_FALSE(event.timestamp.empty());
	auto node = event.emit();
	CHECK(node["event"].as<std::string>() == "host_alert");
	CHECK(node["timestamp"].as<std::string>() == event.timestamp);
	CHECK_FALSE(node["vm-name"].IsDefined());
	CHECK(node["data"]["severity"].as<std::string>() == "warning");

	Event loaded;
	loaded.from_string(event.to_string());
	CHECK(loaded.type == "host_alert");
	CHECK(loaded.data["severity"].as<std::string>() == "warning");
}

TEST_CASE("Status change events carry both states", "[event_sink]")
{
	auto event = make_status_changed_event("web-1", "uuid-1", Vm_state::stopped, Vm_state::running, "start");
	CHECK(event.type == "vm_status_changed");
	CHECK(event.vm_name == "web-1");
	CHECK(event.uuid == "uuid-1");
	CHECK(event.data["old-state"].as<std::string>() == "stopped");
	CHECK(event.data["new-state"].as<std::string>() == "running");
	CHECK(event.data["operation"].as<std::string>() == "start");
}

TEST_CASE("Publish failures are not propagated", "[event_sink]")
{
	Throwing_sink sink;
	CHECK_NOTHROW(publish_nothrow(sink, Event("vm_created", "web-1", "uuid-1")));
}

TEST_CASE("Communicator sink delivers every event before shutdown", "[event_sink]")
{
	auto comm = std::make_shared<Gate_communicator>();
	{
		Communicator_event_sink sink(comm, "");
		for (int i = 0; i != 20; ++i)
			sink.publish(Event("vm_metrics", "web-" + std::to_string(i), ""));
	}
	auto messages = comm->get_messages();
	REQUIRE(messages.size() == 20);
	CHECK(YAML::Load(messages.front())["vm-name"].as<std::string>() == "web-0");
	CHECK(YAML::Load(messages.back())["vm-name"].as<std::string>() == "web-19");
}

TEST_CASE("A full queue drops the oldest events", "[event_sink]")
{
	auto comm = std::make_shared<Gate_communicator>(true);
	{
		Communicator_event_sink sink(comm, "", 2);
		sink.publish(Event("vm_created", "", ""));
		// The sender holds the first event, the queue is empty again.
		comm->wait_entered();
		sink.publish(Event("vm_deleted", "", ""));
		sink.publish(Event("host_alert", "", ""));
		sink.publish(Event("host_metrics", "", ""));
		comm->release();
	}
	auto messages = comm->get_messages();
	REQUIRE(messages.size() == 3);
	CHECK(event_type(messages[0]) == "vm_created");
	CHECK(event_type(messages[1]) == "host_alert");
	CHECK(event_type(messages[2]) == "host_metrics");
}

TEST_CASE("Send failures do not stop the sink", "[event_sink]")
{
	auto comm = std::make_shared<Failing_communicator>();
	CHECK_NOTHROW([&comm] {
		Communicator_event_sink sink(comm, "");
		sink.publish(Event("vm_created", "web-1", ""));
		sink.publish(Event("vm_deleted", "web-1", ""));
	}());
	CHECK_THROWS_AS(Communicator_event_sink(nullptr, ""), std::invalid_argument);
}
