/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef EVENT_SINK_HPP
#define EVENT_SINK_HPP

#include "vm_types.hpp"

#include <fast-lib/communication/communicator.hpp>
#include <fast-lib/serialization/serializable.hpp>

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

/**
 * \brief A notification about a vm or the host.
 *
 * type is one of vm_status_changed, vm_created, vm_deleted, vm_metrics, host_alert or host_metrics.
 */
struct Event :
	public fast::Serializable
{
	Event() = default;
	Event(std::string type, std::string vm_name, std::string uuid, YAML::Node data = YAML::Node());

	std::string type;
	std::string timestamp;
	std::string vm_name;
	std::string uuid;
	YAML::Node data;

	YAML::Node emit() const override;
	void load(const YAML::Node &node) override;
};
YAML_CONVERT_IMPL(Event)

Event make_status_changed_event(const std::string &vm_name, const std::string &uuid,
		Vm_state old_state, Vm_state new_state, const std::string &operation);

/**
 * \brief Interface of the notification sink.
 */
class Event_sink
{
public:
	virtual ~Event_sink() = default;
	/**
	 * \brief Hand an event over for delivery.
	 *
	 * Must not block for the duration of the delivery.
	 */
	virtual void publish(const Event &event) = 0;
};

/**
 * \brief Publish and log any failure instead of propagating it.
 */
void publish_nothrow(Event_sink &sink, const Event &event) noexcept;

/**
 * \brief Sends events as YAML over a fast::Communicator.
 *
 * Events are queued and sent by a background thread. If the queue is full the oldest event is dropped.
 * With an MQTT_communicator and a non-empty topic events go to that topic, otherwise to the publish topic
 * of the communicator.
 */
class Communicator_event_sink :
	public Event_sink
{
public:
	Communicator_event_sink(std::shared_ptr<fast::Communicator> comm, std::string topic, size_t max_queue_size = 1024);
	/**
	 * \brief Sends the remaining events and stops the background thread.
	 */
	~Communicator_event_sink();

	void publish(const Event &event) override;
private:
	void run();
	void send(const std::string &msg);

	std::shared_ptr<fast::Communicator> comm;
	std::string topic;
	size_t max_queue_size;
	std::mutex mutex;
	std::condition_variable cv;
	std::deque<std::string> queue;
	bool stopping;
	std::thread sender;
};

#endif
