#ifndef UTILITY_HPP
#define UTILITY_HPP

#include <libvirt/libvirt.h>

#include <string>

//
// Some deleter to be used with smart pointers.
//

struct Deleter_virConnect
{
	void operator()(virConnectPtr ptr) const
	{
		if (ptr)
			virConnectClose(ptr);
	}
};

struct Deleter_virDomain
{
	void operator()(virDomainPtr ptr) const
	{
		if (ptr)
			virDomainFree(ptr);
	}
};

// Libvirt sometimes returns a dynamically allocated cstring.
// As we prefer std::string this function converts and frees.
std::string convert_and_free_cstr(char *cstr);

// Get hostname
std::string get_hostname();

// Current UTC time in ISO 8601 format
std::string get_timestamp();

// Read a whole file into a string
std::string read_file(const std::string &file_name);

// Replace the placeholder <hostname> in str
std::string replace_hostname_placeholder(const std::string &str, const std::string &hostname);

#endif
