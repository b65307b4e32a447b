/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "task_handler.hpp"

#include "utility.hpp"

#include <fast-lib/log.hpp>
#include <boost/program_options.hpp>
#include <mosquittopp.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <stdexcept>
#include <fcntl.h>
#include <iostream>
#include <string>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

FASTLIB_LOG_INIT(main_log, "vmorch")
FASTLIB_LOG_SET_LEVEL_GLOBAL(main_log, trace);

namespace po = boost::program_options;

const std::string pid_file_name = "/tmp/vmorch.pid";
const std::string default_config_file_name = "vmorch.conf";

// Only one vmorch may manage a host. The lock is held until the process exits.
bool lock_pid_file(std::string &error)
{
	auto previous_umask = umask(0);
	int pid_file = open(pid_file_name.c_str(), O_CREAT | O_RDWR, 0666);
	int err = errno;
	umask(previous_umask);
	if (pid_file == -1) {
		error = "Cannot open " + pid_file_name + " (" + strerror(err) + ").";
		return false;
	}
	if (flock(pid_file, LOCK_EX | LOCK_NB) != 0) {
		err = errno;
		if (err == EWOULDBLOCK)
			error = "Another vmorch instance is already running on this host.";
		else
			error = "Cannot lock " + pid_file_name + " (" + strerror(err) + ").";
		close(pid_file);
		return false;
	}
	return true;
}

std::string resolve_config_file(const po::variables_map &vm)
{
	auto file_name = vm.count("config") ? vm["config"].as<std::string>() : default_config_file_name;
	auto path = realpath(file_name.c_str(), nullptr);
	if (path == nullptr)
		throw std::runtime_error("Cannot find config file " + file_name + " (" + strerror(errno) + ").");
	return convert_and_free_cstr(path);
}

void redirect_output(const std::string &log_file_name)
{
	auto log_file = fopen(log_file_name.c_str(), "a");
	if (log_file == nullptr)
		throw std::runtime_error("Cannot open log file " + log_file_name + " (" + strerror(errno) + ").");
	for (auto fd : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO})
		dup2(fileno(log_file), fd);
	fclose(log_file);
}

// Returns in the detached child only.
void daemonize(bool keep_output)
{
	auto pid = fork();
	if (pid < 0)
		throw std::runtime_error(std::string("fork failed: ") + strerror(errno));
	if (pid > 0)
		exit(EXIT_SUCCESS);
	umask(0);
	if (setsid() < 0)
		throw std::runtime_error(std::string("setsid failed: ") + strerror(errno));
	if (chdir("/") < 0)
		throw std::runtime_error(std::string("chdir failed: ") + strerror(errno));
	if (!keep_output) {
		close(STDIN_FILENO);
		close(STDOUT_FILENO);
		close(STDERR_FILENO);
	}
}

int run(int argc, char *argv[])
{
	po::options_description desc("Options");
	desc.add_options()
		("help,h", "produce help message")
		("config,c", po::value<std::string>(), "path to config file (default: vmorch.conf)")
		("daemon,d", "start as daemon")
		("log,l", po::value<std::string>(), "path to log file");
	po::variables_map vm;
	po::store(po::parse_command_line(argc, argv, desc), vm);
	po::notify(vm);
	if (vm.count("help")) {
		std::cout << desc << std::endl;
		return EXIT_SUCCESS;
	}
	auto config_file_name = resolve_config_file(vm);
	if (vm.count("log"))
		redirect_output(vm["log"].as<std::string>());
	if (vm.count("daemon")) {
		std::cout << "Starting vmorch daemon." << std::endl;
		daemonize(vm.count("log") != 0);
	}
	Task_handler task_handler(config_file_name);
	FASTLIB_LOG(main_log, trace) << "Waiting for tasks.";
	task_handler.loop();
	FASTLIB_LOG(main_log, trace) << "Task loop closed.";
	return EXIT_SUCCESS;
}

int main(int argc, char *argv[])
{
	std::string error;
	if (!lock_pid_file(error)) {
		std::cout << error << std::endl;
		return EXIT_FAILURE;
	}
	mosqpp::lib_init();
	int rc = EXIT_FAILURE;
	try {
		rc = run(argc, argv);
	} catch (const std::exception &e) {
		std::cout << "Exception: " << e.what() << std::endl;
	}
	mosqpp::lib_cleanup();
	return rc;
}
