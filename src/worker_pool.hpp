/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef WORKER_POOL_HPP
#define WORKER_POOL_HPP

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

/**
 * \brief Fixed number of threads executing blocking work from a bounded queue.
 *
 * submit() blocks while the queue is full. The destructor finishes all queued work.
 */
class Worker_pool
{
public:
	Worker_pool(unsigned int threads, size_t max_queue_size);
	~Worker_pool();

	Worker_pool(const Worker_pool &) = delete;
	Worker_pool & operator=(const Worker_pool &) = delete;

	/**
	 * \brief Queue func for execution.
	 *
	 * \returns A future holding the result or the exception of func.
	 */
	template<typename Func>
	auto submit(Func &&func) -> std::future<typename std::result_of<Func()>::type>;

	/**
	 * \brief Stop accepting work, finish the queue and join all threads.
	 */
	void shutdown();
	size_t queue_size();
private:
	void enqueue(std::function<void()> job);
	void run();

	const size_t max_queue_size;
	std::mutex mutex;
	std::condition_variable job_available;
	std::condition_variable space_available;
	std::deque<std::function<void()>> jobs;
	bool stopping;
	std::vector<std::thread> workers;
};

//
// Template implementation
//

template<typename Func>
auto Worker_pool::submit(Func &&func) -> std::future<typename std::result_of<Func()>::type>
{
	using Result = typename std::result_of<Func()>::type;
	// packaged_task is move-only, std::function needs a copyable callable.
	auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Func>(func));
	auto future = task->get_future();
	enqueue([task] {(*task)();});
	return future;
}

#endif
