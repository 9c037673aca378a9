#include <gtest/gtest.h>

#include <cctype>
#include <string>
#include <vector>

#include "normalize.hpp"

namespace {

std::string strip_reference(const std::string &in) {
	std::string out;
	for (const char c : in)
		if (c != '\n' && c != '\r')
			out.push_back(c);
	return out;
}

} // namespace

/**
 * @brief Vector and scalar paths agree for breaks at every offset of a 32-byte block
 */
TEST(NormalizeTest, StripLineBreaksAnyPosition) {
	for (size_t len : {0u, 1u, 31u, 32u, 33u, 64u, 100u, 517u}) {
		for (size_t brk = 0; brk < len; brk += 7) {
			std::string in(len, 'G');
			in[brk] = '\n';
			if (brk + 1 < len)
				in[brk + 1] = '\r';

			std::vector<uint8_t> out(len);
			const size_t n = strip_line_breaks(reinterpret_cast<const uint8_t *>(in.data()), in.size(), out.data());
			EXPECT_EQ(std::string(out.begin(), out.begin() + static_cast<long>(n)), strip_reference(in))
				<< "len=" << len << " brk=" << brk;
		}
	}
}

TEST(NormalizeTest, StripKeepsOtherWhitespace) {
	const std::string in = "AC GT\tN\n";
	std::vector<uint8_t> out(in.size());
	const size_t n = strip_line_breaks(reinterpret_cast<const uint8_t *>(in.data()), in.size(), out.data());
	EXPECT_EQ(std::string(out.begin(), out.begin() + static_cast<long>(n)), "AC GT\tN");
}

/**
 * @brief Only 'a'..'z' change; every other byte value is preserved
 */
TEST(NormalizeTest, UppercaseOnlyAsciiLetters) {
	std::vector<uint8_t> data(256 * 5 + 13);
	for (size_t i = 0; i < data.size(); ++i)
		data[i] = static_cast<uint8_t>(i % 256);
	const std::vector<uint8_t> original = data;

	uppercase_ascii(data.data(), data.size());

	for (size_t i = 0; i < data.size(); ++i) {
		const uint8_t c = original[i];
		const uint8_t expected = (c >= 'a' && c <= 'z') ? static_cast<uint8_t>(c - 32) : c;
		EXPECT_EQ(data[i], expected) << "byte " << static_cast<int>(c) << " at " << i;
	}
}

TEST(NormalizeTest, UppercaseEmptyIsNoop) {
	uppercase_ascii(nullptr, 0);
	SUCCEED();
}
