/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef SERIALIZATION_UTILITY_HPP
#define SERIALIZATION_UTILITY_HPP

#include <yaml-cpp/yaml.h>
#include <boost/optional.hpp>

#include <string>
#include <type_traits>

//
// Small helpers for the load() implementations of serializable types.
//

// Load a required value, throws YAML::Exception if the key is missing.
template<typename T>
void load_field(T &value, const YAML::Node &node)
{
	value = node.as<T>();
}

// Load a value or fall back to a default if the key is missing.
template<typename T>
void load_field(T &value, const YAML::Node &node, const typename std::decay<T>::type &default_value)
{
	value = node ? node.as<T>() : default_value;
}

// Load an optional value, resets it if the key is missing.
template<typename T>
void load_field(boost::optional<T> &value, const YAML::Node &node)
{
	if (node)
		value = node.as<T>();
	else
		value = boost::none;
}

template<typename T>
void emit_optional(YAML::Node &node, const std::string &key, const boost::optional<T> &value)
{
	if (value)
		node[key] = *value;
}

#endif
