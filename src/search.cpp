#include <algorithm>
#include <chrono>
#include <future>
#include <thread>

#include "errors.hpp"
#include "search.hpp"

namespace {

using Clock = std::chrono::high_resolution_clock;

double elapsed_ms(const Clock::time_point start) {
	return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count() / 1000.0;
}

struct SegmentOutcome {
	std::vector<size_t> matches;
	double time_ms;
};

// Tasks borrow the caller's frame, so every dispatched future is waited on
// before search() unwinds, whatever path it takes.
struct JoinBarrier {
	std::vector<std::future<SegmentOutcome>> &futures;

	~JoinBarrier() {
		for (auto &f : futures)
			if (f.valid())
				f.wait();
	}
};

} // namespace

size_t default_worker_count() {
	return std::max<size_t>(1, std::thread::hardware_concurrency());
}

SearchCoordinator::SearchCoordinator(ScanFunction scan) : scan_(std::move(scan)) {
	if (!scan_)
		throw std::invalid_argument("SearchCoordinator: scan function is empty");
}

WorkerPool &SearchCoordinator::pool_for(const size_t workers) {
	if (!pool_ || pool_->size() != workers) {
		pool_.reset();
		pool_ = std::make_unique<WorkerPool>(workers);
	}
	return *pool_;
}

void SearchCoordinator::notify(const SearchEvent &event) const {
	if (observer_)
		observer_(event);
}

SearchResults SearchCoordinator::search(const SequenceStore &store, const std::string_view pattern, size_t worker_count) {
	if (pattern.empty())
		throw SearchError(SearchErrc::InvalidPattern, "Search pattern is empty");
	if (worker_count == 0)
		worker_count = default_worker_count();

	std::lock_guard lk(search_mtx_);
	cancel_.store(false, std::memory_order_relaxed);

	const auto start = Clock::now();
	const std::vector<Partition> plan = plan_partitions(store.valid_length(), worker_count);
	WorkerPool &pool = pool_for(worker_count);

	const uint8_t *buffer = store.data();
	const size_t valid_length = store.valid_length();

	std::vector<std::future<SegmentOutcome>> futures;
	futures.reserve(plan.size());
	{
		JoinBarrier barrier{futures};

		for (size_t i = 0; i < plan.size(); ++i) {
			const Partition range = plan[i];
			futures.push_back(pool.submit([this, buffer, valid_length, range, pattern] {
				const auto segment_start = Clock::now();
				try {
					SegmentOutcome outcome;
					outcome.matches = scan_(buffer, valid_length, range, pattern, &cancel_);
					outcome.time_ms = elapsed_ms(segment_start);
					return outcome;
				} catch (...) {
					cancel_.store(true, std::memory_order_relaxed);
					throw;
				}
			}));
		}

		// Only after every partition is queued, so an observer exception cannot
		// leave part of the range unsearched.
		for (size_t i = 0; i < plan.size(); ++i)
			notify({SearchEvent::Kind::Dispatched, i, plan[i], 0, {}});
	}

	SearchResults results;
	results.workers = worker_count;
	results.segments.reserve(plan.size());

	std::vector<SegmentOutcome> outcomes(plan.size());
	std::string failures;
	size_t failed = 0;

	for (size_t i = 0; i < plan.size(); ++i) {
		std::string reason;
		try {
			outcomes[i] = futures[i].get();
		} catch (const std::exception &e) {
			reason = e.what();
		} catch (...) {
			reason = "unknown exception";
		}

		if (reason.empty()) {
			notify({SearchEvent::Kind::Completed, i, plan[i], outcomes[i].matches.size(), {}});
			continue;
		}
		notify({SearchEvent::Kind::Failed, i, plan[i], 0, reason});
		failures += (failed ? "; segment " : "segment ") + std::to_string(i) + " [" + std::to_string(plan[i].lo) + ", " +
					std::to_string(plan[i].hi) + "): " + reason;
		++failed;
	}

	if (failed > 0)
		throw SearchError(
			SearchErrc::TaskFailure,
			std::to_string(failed) + " of " + std::to_string(plan.size()) + " search tasks failed: " + failures
		);
	if (cancel_.load(std::memory_order_relaxed))
		throw SearchError(SearchErrc::Interrupted, "Search interrupted before all segments completed");

	size_t total = 0;
	for (const auto &outcome : outcomes)
		total += outcome.matches.size();
	results.matches.reserve(total);

	// Partition order, not completion order: each segment is ascending and
	// segments are disjoint, so the concatenation is ascending.
	for (size_t i = 0; i < plan.size(); ++i) {
		results.matches.insert(results.matches.end(), outcomes[i].matches.begin(), outcomes[i].matches.end());
		results.segments.push_back({plan[i], outcomes[i].matches.size(), outcomes[i].time_ms});
	}

	results.time_ms = elapsed_ms(start);
	return results;
}
