#include <system_error>

#include "worker_pool.hpp"

WorkerPool::WorkerPool(const size_t thread_count) {
	if (thread_count == 0)
		throw std::invalid_argument("WorkerPool: thread_count must be >= 1");

	workers_.reserve(thread_count);
	try {
		for (size_t i = 0; i < thread_count; ++i)
			workers_.emplace_back(&WorkerPool::worker_loop, this);
	} catch (const std::system_error &) {
		{
			std::lock_guard lk(mtx_);
			stopping_ = true;
		}
		cv_.notify_all();
		for (auto &w : workers_)
			w.join();
		throw;
	}
}

WorkerPool::~WorkerPool() {
	{
		std::lock_guard lk(mtx_);
		stopping_ = true;
	}
	cv_.notify_all();
	for (auto &w : workers_)
		if (w.joinable())
			w.join();
}

void WorkerPool::worker_loop() {
	while (true) {
		std::unique_lock lk(mtx_);
		cv_.wait(lk, [this] { return stopping_ || !queue_.empty(); });
		if (queue_.empty())
			break;
		auto job = std::move(queue_.front());
		queue_.pop_front();
		lk.unlock();
		job();
	}
}
