#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "loader.hpp"
#include "partition.hpp"
#include "scanner.hpp"
#include "worker_pool.hpp"

struct SearchEvent {
	enum class Kind {
		Dispatched,
		Completed,
		Failed,
	};

	Kind kind;
	size_t index;
	Partition range;
	size_t matches;
	std::string error;
};

using SearchObserver = std::function<void(const SearchEvent &)>;

using ScanFunction = std::function<
	std::vector<size_t>(const uint8_t *, size_t, Partition, std::string_view, const std::atomic<bool> *)>;

struct SegmentStats {
	Partition range;
	size_t matches;
	double time_ms;
};

struct SearchResults {
	std::vector<size_t> matches;
	std::vector<SegmentStats> segments;
	size_t workers;
	double time_ms;
};

size_t default_worker_count();

/*
 * Fans a pattern search out over a fixed worker pool, one task per partition of
 * the store, and merges the per-partition offsets in partition order.
 *
 * Failure of any task cancels the others and the call throws a TaskFailure
 * SearchError listing every failed segment. request_cancel() from another
 * thread makes the running call throw Interrupted. No partial result is ever
 * returned. The pool is kept between calls and rebuilt when the worker count
 * changes.
 */
class SearchCoordinator {
	ScanFunction scan_;
	SearchObserver observer_;
	std::unique_ptr<WorkerPool> pool_;
	std::atomic<bool> cancel_{false};
	std::mutex search_mtx_;

	WorkerPool &pool_for(size_t workers);

	void notify(const SearchEvent &event) const;

public:
	explicit SearchCoordinator(ScanFunction scan = scan_partition);

	SearchCoordinator(const SearchCoordinator &) = delete;

	SearchCoordinator &operator=(const SearchCoordinator &) = delete;

	// Events are delivered on the calling thread, in partition order per kind.
	// Dispatched fires once all tasks are queued, Completed/Failed after the join.
	// An exception thrown by the observer propagates out of search() once every
	// dispatched task has finished.
	void set_observer(SearchObserver observer) {
		observer_ = std::move(observer);
	}

	SearchResults search(const SequenceStore &store, std::string_view pattern, size_t worker_count = 0);

	void request_cancel() {
		cancel_.store(true, std::memory_order_relaxed);
	}

	[[nodiscard]] size_t pool_size() const {
		return pool_ ? pool_->size() : 0;
	}
};
