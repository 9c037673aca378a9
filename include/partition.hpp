#pragma once

#include <cstddef>
#include <vector>

// Half-open range [lo, hi) of candidate start offsets.
struct Partition {
	size_t lo;
	size_t hi;

	[[nodiscard]] size_t size() const {
		return hi - lo;
	}
};

inline bool operator==(const Partition &a, const Partition &b) {
	return a.lo == b.lo && a.hi == b.hi;
}

/*
 * Splits [0, valid_length) into worker_count contiguous ranges. Every range gets
 * valid_length / worker_count offsets except the last one, which also takes the
 * remainder. Throws std::invalid_argument when worker_count is 0.
 */
std::vector<Partition> plan_partitions(size_t valid_length, size_t worker_count);
