/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "errors.hpp"

#include <utility>

Engine_error::Engine_error(const std::string &what_arg) :
	std::runtime_error(what_arg)
{
}

std::string Engine_error::kind() const
{
	return "internal";
}

Connection_error::Connection_error(const std::string &what_arg) :
	Engine_error(what_arg)
{
}

std::string Connection_error::kind() const
{
	return "connection";
}

Not_found_error::Not_found_error(const Vm_id &id) :
	Engine_error("VM with " + id.str() + " not found")
{
}

Not_found_error::Not_found_error(const std::string &what_arg) :
	Engine_error(what_arg)
{
}

std::string Not_found_error::kind() const
{
	return "not-found";
}

Operation_error::Operation_error(const std::string &operation, const std::string &vm_name, const std::string &cause) :
	Engine_error("Failed to " + operation + " VM '" + vm_name + "': " + cause),
	operation(operation),
	vm_name(vm_name),
	cause(cause)
{
}

std::string Operation_error::kind() const
{
	return "operation";
}

const std::string & Operation_error::get_operation() const
{
	return operation;
}

const std::string & Operation_error::get_vm_name() const
{
	return vm_name;
}

const std::string & Operation_error::get_cause() const
{
	return cause;
}

Validation_error::Validation_error(const Validation_result &result) :
	Validation_error("Validation failed: " + result.summary(), result)
{
}

Validation_error::Validation_error(const std::string &what_arg, const Validation_result &result) :
	Engine_error(what_arg),
	result(result)
{
}

std::string Validation_error::kind() const
{
	return "validation";
}

const Validation_result & Validation_error::get_result() const
{
	return result;
}

Resource_allocation_error::Resource_allocation_error(const Validation_result &result) :
	Validation_error("Insufficient resources: " + result.summary(), result)
{
}

std::string Resource_allocation_error::kind() const
{
	return "resource-allocation";
}

State_error::State_error(const std::string &vm_name, Vm_state current, Vm_state required) :
	Engine_error("VM '" + vm_name + "' is " + to_string(current) + " but must be " + to_string(required)),
	current(current),
	required(required)
{
}

std::string State_error::kind() const
{
	return "state";
}

Vm_state State_error::get_current() const
{
	return current;
}

Vm_state State_error::get_required() const
{
	return required;
}

Template_error::Template_error(const std::string &what_arg) :
	Engine_error(what_arg)
{
}

Storage_error::Storage_error(const std::string &what_arg) :
	Engine_error(what_arg)
{
}
