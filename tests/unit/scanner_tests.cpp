#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <vector>

#include "loader.hpp"
#include "scanner.hpp"

namespace {

const uint8_t *bytes(const std::string &s) {
	return reinterpret_cast<const uint8_t *>(s.data());
}

} // namespace

TEST(ScannerTest, FindsAllOccurrencesInRange) {
	const std::string seq = "ACGTACGTACGT";
	const auto hits = scan_partition(bytes(seq), seq.size(), {0, seq.size()}, "ACGT");
	EXPECT_EQ(hits, (std::vector<size_t>{0, 4, 8}));
}

TEST(ScannerTest, OverlappingMatches) {
	const std::string seq = "AAAAA";
	const auto hits = scan_partition(bytes(seq), seq.size(), {0, seq.size()}, "AA");
	EXPECT_EQ(hits, (std::vector<size_t>{0, 1, 2, 3}));
}

/**
 * @brief A match starting inside the range is reported even when it ends past hi
 */
TEST(ScannerTest, ReadsPastRangeEndForStraddlingMatch) {
	const std::string seq = "AACGTACGTAA";
	EXPECT_EQ(scan_partition(bytes(seq), seq.size(), {0, 5}, "ACGT"), (std::vector<size_t>{1}));
	EXPECT_EQ(scan_partition(bytes(seq), seq.size(), {5, 11}, "ACGT"), (std::vector<size_t>{5}));
	EXPECT_EQ(scan_partition(bytes(seq), seq.size(), {0, 2}, "ACGT"), (std::vector<size_t>{1}));
}

/**
 * @brief Start offsets outside [lo, hi) are never reported
 */
TEST(ScannerTest, IgnoresStartsOutsideRange) {
	const std::string seq = "ACGTACGT";
	EXPECT_TRUE(scan_partition(bytes(seq), seq.size(), {1, 4}, "ACGT").empty());
	EXPECT_TRUE(scan_partition(bytes(seq), seq.size(), {3, 3}, "ACGT").empty());
}

/**
 * @brief Bytes beyond the valid length are padding and never take part in a match
 */
TEST(ScannerTest, LookaheadStopsAtValidLength) {
	const std::string raw = "ACGTACG";
	ByteBuffer buffer(raw.begin(), raw.end());
	const SequenceStore store(std::move(buffer), 6);

	const auto hits = scan_partition(store.data(), store.valid_length(), {0, 6}, "ACG");
	EXPECT_EQ(hits, (std::vector<size_t>{0}));
}

TEST(ScannerTest, PatternLongerThanBuffer) {
	const std::string seq = "ACG";
	EXPECT_TRUE(scan_partition(bytes(seq), seq.size(), {0, 3}, "ACGT").empty());
}

TEST(ScannerTest, EmptyPatternYieldsNothing) {
	const std::string seq = "ACG";
	EXPECT_TRUE(scan_partition(bytes(seq), seq.size(), {0, 3}, "").empty());
}

TEST(ScannerTest, CancelledBeforeStartStopsImmediately) {
	const std::string seq(1000, 'A');
	const std::atomic<bool> cancel{true};
	EXPECT_TRUE(scan_partition(bytes(seq), seq.size(), {0, seq.size()}, "A", &cancel).empty());
}

TEST(ScannerTest, ClearCancelFlagScansEverything) {
	const std::string seq(100, 'A');
	const std::atomic<bool> cancel{false};
	EXPECT_EQ(scan_partition(bytes(seq), seq.size(), {0, seq.size()}, "AAA", &cancel).size(), 98u);
}
