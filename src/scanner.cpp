#include <cstring>

#include "scanner.hpp"

std::vector<size_t> scan_partition(
	const uint8_t *buffer,
	const size_t valid_length,
	const Partition range,
	const std::string_view pattern,
	const std::atomic<bool> *cancel
) {
	std::vector<size_t> matches;
	const size_t len = pattern.size();
	if (len == 0 || len > valid_length || range.lo >= range.hi)
		return matches;

	// Last start offset whose match still fits inside the valid bytes.
	const size_t last_start = valid_length - len;
	const size_t end = range.hi <= last_start ? range.hi : last_start + 1;
	const auto *needle = reinterpret_cast<const uint8_t *>(pattern.data());

	for (size_t o = range.lo; o < end; ++o) {
		if (cancel && (o - range.lo) % SCAN_POLL_INTERVAL == 0 && cancel->load(std::memory_order_relaxed))
			break;
		if (std::memcmp(buffer + o, needle, len) == 0)
			matches.push_back(o);
	}
	return matches;
}
