/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef TIME_MEASUREMENT_HPP
#define TIME_MEASUREMENT_HPP

#include <fast-lib/serialization/serializable.hpp>
#include <boost/timer/timer.hpp>

#include <map>
#include <string>

/**
 * \brief Collects named wall clock timings of the phases of an operation.
 *
 * If disabled tick() and tock() do nothing and the measurement stays empty.
 * Emitted as a map from timer name to elapsed seconds.
 */
class Time_measurement :
	public fast::Serializable
{
public:
	explicit Time_measurement(bool enable_time_measurement = false);

	void tick(const std::string &timer_name);
	void tock(const std::string &timer_name);

	bool enabled() const;
	bool empty() const;
	// Elapsed seconds of a stopped or running timer.
	double seconds(const std::string &timer_name) const;

	YAML::Node emit() const override;
	void load(const YAML::Node &node) override;
private:
	bool enable;
	std::map<std::string, boost::timer::cpu_timer> timers;
	// Filled by load() only.
	std::map<std::string, double> loaded;
};
YAML_CONVERT_IMPL(Time_measurement)

/**
 * \brief Ticks on construction and tocks on destruction.
 */
class Timer_guard
{
public:
	Timer_guard(Time_measurement &time_measurement, std::string timer_name);
	~Timer_guard();

	Timer_guard(const Timer_guard &) = delete;
	Timer_guard & operator=(const Timer_guard &) = delete;
private:
	Time_measurement &time_measurement;
	const std::string timer_name;
};

#endif
