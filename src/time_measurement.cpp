/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "time_measurement.hpp"

#include <fast-lib/log.hpp>

#include <stdexcept>
#include <utility>

FASTLIB_LOG_INIT(vmorch_time_log, "Time_measurement")
FASTLIB_LOG_SET_LEVEL_GLOBAL(vmorch_time_log, trace);

Time_measurement::Time_measurement(bool enable_time_measurement) :
	enable(enable_time_measurement)
{
}

void Time_measurement::tick(const std::string &timer_name)
{
	if (!enable)
		return;
	timers[timer_name].start();
}

void Time_measurement::tock(const std::string &timer_name)
{
	if (!enable)
		return;
	auto it = timers.find(timer_name);
	if (it == timers.end()) {
		FASTLIB_LOG(vmorch_time_log, warn) << "Timer " << timer_name << " stopped without being started.";
		return;
	}
	it->second.stop();
}

bool Time_measurement::enabled() const
{
	return enable;
}

bool Time_measurement::empty() const
{
	return timers.empty() && loaded.empty();
}

double Time_measurement::seconds(const std::string &timer_name) const
{
	auto it = timers.find(timer_name);
	if (it != timers.end())
		return static_cast<double>(it->second.elapsed().wall) / 1e9;
	auto loaded_it = loaded.find(timer_name);
	if (loaded_it != loaded.end())
		return loaded_it->second;
	throw std::out_of_range("No timer named " + timer_name);
}

YAML::Node Time_measurement::emit() const
{
	YAML::Node node;
	for (const auto &timer : timers)
		node[timer.first] = static_cast<double>(timer.second.elapsed().wall) / 1e9;
	for (const auto &entry : loaded)
		node[entry.first] = entry.second;
	return node;
}

void Time_measurement::load(const YAML::Node &node)
{
	loaded.clear();
	for (const auto &entry : node)
		loaded[entry.first.as<std::string>()] = entry.second.as<double>();
}

Timer_guard::Timer_guard(Time_measurement &time_measurement, std::string timer_name) :
	time_measurement(time_measurement),
	timer_name(std::move(timer_name))
{
	time_measurement.tick(this->timer_name);
}

Timer_guard::~Timer_guard()
{
	time_measurement.tock(timer_name);
}
