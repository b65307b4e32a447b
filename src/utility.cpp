#include "utility.hpp"

#include <boost/regex.hpp>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

std::string convert_and_free_cstr(char *cstr)
{
	std::string str;
	if (cstr) {
		str.assign(cstr);
		free(cstr);
	}
	return str;
}

std::string get_hostname()
{
	char hostname_cstr[HOST_NAME_MAX + 1];
	if (gethostname(hostname_cstr, sizeof(hostname_cstr)) != 0)
		throw std::runtime_error(std::string("Failed getting hostname: ") + std::strerror(errno));
	hostname_cstr[HOST_NAME_MAX] = '\0';
	return std::string(hostname_cstr, std::strlen(hostname_cstr));
}

std::string get_timestamp()
{
	auto now = std::time(nullptr);
	std::tm tm_utc;
	gmtime_r(&now, &tm_utc);
	char buf[32];
	std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
	return std::string(buf);
}

std::string read_file(const std::string &file_name)
{
	std::ifstream file_stream(file_name);
	if (!file_stream)
		throw std::runtime_error("Cannot open " + file_name);
	std::stringstream string_stream;
	string_stream << file_stream.rdbuf(); // Filestream to stingstream conversion
	return string_stream.str();
}

std::string replace_hostname_placeholder(const std::string &str, const std::string &hostname)
{
	boost::regex hostname_regex("(<hostname>)");
	return boost::regex_replace(str, hostname_regex, hostname);
}
