#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

// Fixed-size pool of worker threads draining a FIFO queue. The size never
// changes after construction.
class WorkerPool {
	std::vector<std::thread> workers_;
	std::deque<std::function<void()>> queue_;
	std::mutex mtx_;
	std::condition_variable cv_;
	bool stopping_ = false;

	void worker_loop();

public:
	explicit WorkerPool(size_t thread_count);

	~WorkerPool();

	WorkerPool(const WorkerPool &) = delete;

	WorkerPool &operator=(const WorkerPool &) = delete;

	[[nodiscard]] size_t size() const {
		return workers_.size();
	}

	// Exceptions thrown by func are stored in the returned future.
	template <typename F> auto submit(F &&func) -> std::future<std::invoke_result_t<F>> {
		using ReturnType = std::invoke_result_t<F>;
		auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(func));
		std::future<ReturnType> result = task->get_future();
		{
			std::lock_guard lk(mtx_);
			if (stopping_)
				throw std::runtime_error("WorkerPool: submit after shutdown");
			queue_.emplace_back([task] { (*task)(); });
		}
		cv_.notify_one();
		return result;
	}
};
