/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "event_sink.hpp"

#include "serialization_utility.hpp"
#include "utility.hpp"

#include <fast-lib/communication/mqtt_communicator.hpp>
#include <fast-lib/log.hpp>

#include <exception>
#include <stdexcept>
#include <utility>

FASTLIB_LOG_INIT(event_sink_log, "Event_sink")
FASTLIB_LOG_SET_LEVEL_GLOBAL(event_sink_log, trace);

Event::Event(std::string type, std::string vm_name, std::string uuid, YAML::Node data) :
	type(std::move(type)),
	timestamp(get_timestamp()),
	vm_name(std::move(vm_name)),
	uuid(std::move(uuid)),
	data(data)
{
}

YAML::Node Event::emit() const
{
	YAML::Node node;
	node["event"] = type;
	node["timestamp"] = timestamp;
	if (!vm_name.empty())
		node["vm-name"] = vm_name;
	if (!uuid.empty())
		node["uuid"] = uuid;
	if (data)
		node["data"] = data;
	return node;
}

void Event::load(const YAML::Node &node)
{
	load_field(type, node["event"]);
	load_field(timestamp, node["timestamp"]);
	load_field(vm_name, node["vm-name"], "");
	load_field(uuid, node["uuid"], "");
	data = node["data"] ? YAML::Clone(node["data"]) : YAML::Node();
}

Event make_status_changed_event(const std::string &vm_name, const std::string &uuid,
		Vm_state old_state, Vm_state new_state, const std::string &operation)
{
	YAML::Node data;
	data["old-state"] = to_string(old_state);
	data["new-state"] = to_string(new_state);
	if (!operation.empty())
		data["operation"] = operation;
	return Event("vm_status_changed", vm_name, uuid, data);
}

void publish_nothrow(Event_sink &sink, const Event &event) noexcept
{
	try {
		sink.publish(event);
	} catch (const std::exception &e) {
		FASTLIB_LOG(event_sink_log, warn) << "Failed to publish " << event.type << " event: " << e.what();
	}
}

Communicator_event_sink::Communicator_event_sink(std::shared_ptr<fast::Communicator> comm, std::string topic,
		size_t max_queue_size) :
	comm(std::move(comm)),
	topic(std::move(topic)),
	max_queue_size(max_queue_size),
	stopping(false)
{
	if (!this->comm)
		throw std::invalid_argument("Communicator_event_sink requires a communicator.");
	if (max_queue_size == 0)
		throw std::invalid_argument("Event queue size must be positive.");
	sender = std::thread(&Communicator_event_sink::run, this);
}

Communicator_event_sink::~Communicator_event_sink()
{
	{
		std::lock_guard<std::mutex> lock(mutex);
		stopping = true;
	}
	cv.notify_all();
	if (sender.joinable())
		sender.join();
}

void Communicator_event_sink::publish(const Event &event)
{
	auto msg = event.to_string();
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (queue.size() >= max_queue_size) {
			FASTLIB_LOG(event_sink_log, warn) << "Event queue full, dropping oldest event.";
			queue.pop_front();
		}
		queue.push_back(std::move(msg));
	}
	cv.notify_one();
}

void Communicator_event_sink::run()
{
	std::unique_lock<std::mutex> lock(mutex);
	while (true) {
		cv.wait(lock, [this] {return stopping || !queue.empty();});
		if (queue.empty())
			return;
		auto msg = std::move(queue.front());
		queue.pop_front();
		lock.unlock();
		send(msg);
		lock.lock();
	}
}

void Communicator_event_sink::send(const std::string &msg)
{
	try {
		auto mqtt_comm = std::dynamic_pointer_cast<fast::MQTT_communicator>(comm);
		if (mqtt_comm && !topic.empty())
			mqtt_comm->send_message(msg, topic, 0);
		else
			comm->send_message(msg);
	} catch (const std::exception &e) {
		FASTLIB_LOG(event_sink_log, warn) << "Failed to send event: " << e.what();
	}
}
