/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#include "worker_pool.hpp"

#include <fast-lib/log.hpp>

#include <utility>

FASTLIB_LOG_INIT(worker_pool_log, "Worker_pool")
FASTLIB_LOG_SET_LEVEL_GLOBAL(worker_pool_log, trace);

Worker_pool::Worker_pool(unsigned int threads, size_t max_queue_size) :
	max_queue_size(max_queue_size),
	stopping(false)
{
	if (threads == 0)
		throw std::invalid_argument("Worker pool requires at least one thread.");
	if (max_queue_size == 0)
		throw std::invalid_argument("Worker pool requires a positive queue size.");
	for (unsigned int i = 0; i != threads; ++i)
		workers.emplace_back(&Worker_pool::run, this);
	FASTLIB_LOG(worker_pool_log, trace) << "Started " << threads << " workers.";
}

Worker_pool::~Worker_pool()
{
	shutdown();
}

void Worker_pool::shutdown()
{
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (stopping && workers.empty())
			return;
		stopping = true;
	}
	job_available.notify_all();
	space_available.notify_all();
	for (auto &worker : workers) {
		if (worker.joinable())
			worker.join();
	}
	std::lock_guard<std::mutex> lock(mutex);
	workers.clear();
	FASTLIB_LOG(worker_pool_log, trace) << "All workers are finished.";
}

size_t Worker_pool::queue_size()
{
	std::lock_guard<std::mutex> lock(mutex);
	return jobs.size();
}

void Worker_pool::enqueue(std::function<void()> job)
{
	{
		std::unique_lock<std::mutex> lock(mutex);
		space_available.wait(lock, [this] {return stopping || jobs.size() < max_queue_size;});
		if (stopping)
			throw std::runtime_error("Worker pool is shut down.");
		jobs.push_back(std::move(job));
	}
	job_available.notify_one();
}

void Worker_pool::run()
{
	while (true) {
		std::function<void()> job;
		{
			std::unique_lock<std::mutex> lock(mutex);
			job_available.wait(lock, [this] {return stopping || !jobs.empty();});
			if (jobs.empty())
				return;
			job = std::move(jobs.front());
			jobs.pop_front();
		}
		space_available.notify_one();
		// Exceptions are stored in the future of the packaged_task.
		job();
	}
}
