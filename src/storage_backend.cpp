/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "storage_backend.hpp"

#include "errors.hpp"

#include <fast-lib/log.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

FASTLIB_LOG_INIT(storage_log, "Image_storage")
FASTLIB_LOG_SET_LEVEL_GLOBAL(storage_log, trace);

Command_result exec(const std::string &cmd)
{
	Command_result result;
	char buffer[1024];
	FILE *pipe = popen((cmd + " 2>&1").c_str(), "r");
	if (pipe == nullptr) {
		FASTLIB_LOG(storage_log, warn) << "exec popen failed for `" << cmd << "`";
		throw Storage_error("exec: popen failed for " + cmd);
	}
	while (fgets(buffer, sizeof(buffer), pipe) != nullptr)
		result.output += buffer;
	int pexit = pclose(pipe);
	if (pexit == -1)
		throw Storage_error(std::string("exec: pclose failed: ") + std::strerror(errno));
	result.code = WIFEXITED(pexit) ? WEXITSTATUS(pexit) : -1;
	return result;
}

std::string shell_quote(const std::string &str)
{
	std::string quoted = "'";
	for (auto c : str) {
		if (c == '\'')
			quoted += "'\\''";
		else
			quoted += c;
	}
	quoted += "'";
	return quoted;
}

// Run cmd and throw Storage_error with its output if it fails.
void run_checked(const std::string &what, const std::string &cmd)
{
	FASTLIB_LOG(storage_log, trace) << "Run: " << cmd;
	auto result = exec(cmd);
	if (result.code != 0) {
		auto output = boost::algorithm::trim_copy(result.output);
		FASTLIB_LOG(storage_log, warn) << what << " failed (" << result.code << "): " << output;
		throw Storage_error(what + " failed: " + output);
	}
}

Image_storage::Image_storage(std::string storage_path) :
	storage_path(std::move(storage_path))
{
}

const std::string & Image_storage::get_storage_path() const
{
	return storage_path;
}

unsigned long long Image_storage::free_bytes()
{
	struct statvfs stats;
	if (statvfs(storage_path.c_str(), &stats) != 0)
		throw Storage_error("Error getting free space of " + storage_path + ": " + std::strerror(errno));
	return static_cast<unsigned long long>(stats.f_bavail) * stats.f_frsize;
}

void Image_storage::create_image(const std::string &path, const std::string &format, long long size_gb,
		const boost::optional<std::string> &base_image)
{
	if (exists(path))
		throw Storage_error("Disk image " + path + " already exists.");
	std::string cmd = "qemu-img create -f " + shell_quote(format);
	if (base_image)
		cmd += " -b " + shell_quote(*base_image) + " -F " + shell_quote(format);
	cmd += " " + shell_quote(path) + " " + std::to_string(size_gb) + "G";
	run_checked("Creating disk image " + path, cmd);
}

void Image_storage::copy_image(const std::string &source, const std::string &destination)
{
	if (exists(destination))
		throw Storage_error("Disk image " + destination + " already exists.");
	run_checked("Copying disk image " + source, "cp --sparse=always " + shell_quote(source) + " " + shell_quote(destination));
}

void Image_storage::remove_image(const std::string &path)
{
	FASTLIB_LOG(storage_log, trace) << "Remove " << path << ".";
	if (unlink(path.c_str()) != 0)
		throw Storage_error("Error removing " + path + ": " + std::strerror(errno));
}

bool Image_storage::exists(const std::string &path)
{
	struct stat buf;
	return stat(path.c_str(), &buf) == 0;
}
