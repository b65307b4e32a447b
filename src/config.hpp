/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "template_generator.hpp"

#include <fast-lib/serialization/serializable.hpp>

#include <chrono>
#include <string>

struct Communicator_config
{
	std::string type = "mqtt";
	std::string id;
	std::string subscribe_topic;
	std::string publish_topic;
	// Topic of notification events, empty sends them to the publish topic.
	std::string event_topic;
	std::string host = "localhost";
	int port = 1883;
	int keepalive = 60;
};

struct Hypervisor_config
{
	// libvirt or dummy
	std::string type = "libvirt";
	std::string uri = "qemu:///system";
	std::chrono::seconds liveness_interval = std::chrono::seconds(300);
	std::chrono::seconds stop_timeout = std::chrono::seconds(60);
	// Size of the simulated host of the dummy hypervisor.
	unsigned int dummy_cpus = 8;
	unsigned long long dummy_memory_mb = 16384;
};

struct Storage_config
{
	// qemu-img or dummy
	std::string type = "qemu-img";
	std::string path = "/var/lib/libvirt/images";
	unsigned long long dummy_capacity_gb = 500;
};

struct Resources_config
{
	double vcpu_overcommit_ratio = 4.0;
	std::chrono::milliseconds allocation_cache_ttl = std::chrono::milliseconds(2000);
};

struct Monitoring_config
{
	bool enabled = true;
	std::chrono::milliseconds interval = std::chrono::milliseconds(5000);
	bool lifecycle_events = false;
	double memory_alert_threshold = 90.0;
};

struct Workers_config
{
	unsigned int threads = 4;
	size_t queue_size = 64;
};

/**
 * \brief Configuration of the whole daemon.
 *
 * Loaded from YAML. Every section except communicator is optional and falls back to defaults.
 */
struct Engine_config :
	public fast::Serializable
{
	Communicator_config communicator;
	Hypervisor_config hypervisor;
	Storage_config storage;
	Resources_config resources;
	Monitoring_config monitoring;
	Workers_config workers;
	Template_generator::Options domain;

	YAML::Node emit() const override;
	void load(const YAML::Node &node) override;
};
YAML_CONVERT_IMPL(Engine_config)

/**
 * \brief Read a config file and replace the <hostname> placeholder before parsing.
 */
Engine_config load_config_file(const std::string &file_name);

#endif
