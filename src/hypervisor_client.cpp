/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "hypervisor_client.hpp"

Hypervisor_error::Hypervisor_error(Category category, const std::string &what_arg) :
	std::runtime_error(what_arg),
	category(category)
{
}

Hypervisor_error::Category Hypervisor_error::get_category() const
{
	return category;
}
