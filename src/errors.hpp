/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include "vm_types.hpp"

#include <stdexcept>
#include <string>

/**
 * \brief Base of all errors raised by the engine.
 *
 * kind() returns a short token used in result messages (e.g. "not-found").
 */
class Engine_error :
	public std::runtime_error
{
public:
	explicit Engine_error(const std::string &what_arg);
	virtual std::string kind() const;
};

/**
 * \brief The hypervisor is unreachable or the connection broke.
 *
 * Retryable, the next call reopens the connection.
 */
class Connection_error :
	public Engine_error
{
public:
	explicit Connection_error(const std::string &what_arg);
	std::string kind() const override;
};

class Not_found_error :
	public Engine_error
{
public:
	explicit Not_found_error(const Vm_id &id);
	explicit Not_found_error(const std::string &what_arg);
	std::string kind() const override;
};

/**
 * \brief A hypervisor or storage operation on a vm failed.
 *
 * The message reads "Failed to <operation> VM '<vm>': <cause>".
 */
class Operation_error :
	public Engine_error
{
public:
	Operation_error(const std::string &operation, const std::string &vm_name, const std::string &cause);
	std::string kind() const override;

	const std::string & get_operation() const;
	const std::string & get_vm_name() const;
	const std::string & get_cause() const;
private:
	std::string operation;
	std::string vm_name;
	std::string cause;
};

/**
 * \brief A specification failed validation.
 *
 * Carries the complete aggregated result with all violations.
 */
class Validation_error :
	public Engine_error
{
public:
	explicit Validation_error(const Validation_result &result);
	std::string kind() const override;

	const Validation_result & get_result() const;
protected:
	Validation_error(const std::string &what_arg, const Validation_result &result);
private:
	Validation_result result;
};

/**
 * \brief The request does not fit into the currently available resources.
 */
class Resource_allocation_error :
	public Validation_error
{
public:
	explicit Resource_allocation_error(const Validation_result &result);
	std::string kind() const override;
};

/**
 * \brief The vm is in a state which does not permit the operation.
 */
class State_error :
	public Engine_error
{
public:
	State_error(const std::string &vm_name, Vm_state current, Vm_state required);
	std::string kind() const override;

	Vm_state get_current() const;
	Vm_state get_required() const;
private:
	Vm_state current;
	Vm_state required;
};

// Internal, surfaces wrapped in Operation_error.
class Template_error :
	public Engine_error
{
public:
	explicit Template_error(const std::string &what_arg);
};

// Internal, surfaces wrapped in Operation_error.
class Storage_error :
	public Engine_error
{
public:
	explicit Storage_error(const std::string &what_arg);
};

#endif
