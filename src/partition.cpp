#include <stdexcept>

#include "partition.hpp"

std::vector<Partition> plan_partitions(const size_t valid_length, const size_t worker_count) {
	if (worker_count == 0)
		throw std::invalid_argument("plan_partitions: worker_count must be >= 1");

	const size_t segment = valid_length / worker_count;
	std::vector<Partition> plan;
	plan.reserve(worker_count);

	size_t lo = 0;
	for (size_t i = 0; i + 1 < worker_count; ++i) {
		plan.push_back({lo, lo + segment});
		lo += segment;
	}
	plan.push_back({lo, valid_length});
	return plan;
}
