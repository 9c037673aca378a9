#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "partition.hpp"

// Start positions checked between two polls of the cancel flag.
inline constexpr size_t SCAN_POLL_INTERVAL = 1 << 16;

/*
 * Brute-force scan of the start offsets in range. A match starting before
 * range.hi may read up to pattern.size() - 1 bytes past it, never past
 * valid_length. Offsets come out ascending. When cancel is set the scan stops
 * early and the partial result must be discarded.
 */
std::vector<size_t> scan_partition(
	const uint8_t *buffer,
	size_t valid_length,
	Partition range,
	std::string_view pattern,
	const std::atomic<bool> *cancel = nullptr
);
