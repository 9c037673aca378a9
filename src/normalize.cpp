#include <cstdint>
#include <omp.h>

#if defined(__AVX2__)
#include <immintrin.h>
#endif

#include "normalize.hpp"

static constexpr size_t BLOCK_BYTES = 256;

static __always_inline bool is_line_break(const uint8_t c) {
	return c == '\n' || c == '\r';
}

static __always_inline uint8_t upper_scalar(const uint8_t c) {
	return (c >= 'a' && c <= 'z') ? static_cast<uint8_t>(c - 0x20) : c;
}

#if defined(__AVX2__)
static __always_inline __m256i upper_block_32(const __m256i raw) {
	const __m256i above = _mm256_cmpgt_epi8(raw, _mm256_set1_epi8('a' - 1));
	const __m256i below = _mm256_cmpgt_epi8(_mm256_set1_epi8('z' + 1), raw);
	const __m256i flip = _mm256_and_si256(_mm256_and_si256(above, below), _mm256_set1_epi8(0x20));
	return _mm256_sub_epi8(raw, flip);
}
#endif

size_t strip_line_breaks(const uint8_t *__restrict__ src, const size_t size, uint8_t *__restrict__ dst) {
	const uint8_t *end = src + size;
	uint8_t *out = dst;

#if defined(__AVX2__)
	const __m256i lf = _mm256_set1_epi8('\n');
	const __m256i cr = _mm256_set1_epi8('\r');

	while (src + 32 <= end) {
		const __m256i chunk = _mm256_loadu_si256(reinterpret_cast<const __m256i *>(src));
		const __m256i breaks = _mm256_or_si256(_mm256_cmpeq_epi8(chunk, lf), _mm256_cmpeq_epi8(chunk, cr));

		if (_mm256_movemask_epi8(breaks) == 0) {
			_mm256_storeu_si256(reinterpret_cast<__m256i *>(out), chunk);
			out += 32;
			src += 32;
		} else {
			const uint8_t *limit = src + 32;
			while (src < limit) {
				if (!is_line_break(*src))
					*out++ = *src;
				src++;
			}
		}
	}
#endif

	while (src < end) {
		if (!is_line_break(*src))
			*out++ = *src;
		src++;
	}

	return static_cast<size_t>(out - dst);
}

void uppercase_ascii(uint8_t *data, const size_t size) {
	const size_t blocks = size / BLOCK_BYTES;

#pragma omp parallel for schedule(static)
	for (size_t i = 0; i < blocks; ++i) {
		uint8_t *block = data + i * BLOCK_BYTES;
#if defined(__AVX2__)
		for (size_t k = 0; k < BLOCK_BYTES; k += 32) {
			const __m256i r = _mm256_loadu_si256(reinterpret_cast<const __m256i *>(block + k));
			_mm256_storeu_si256(reinterpret_cast<__m256i *>(block + k), upper_block_32(r));
		}
#else
		for (size_t k = 0; k < BLOCK_BYTES; ++k)
			block[k] = upper_scalar(block[k]);
#endif
	}

	for (size_t k = blocks * BLOCK_BYTES; k < size; ++k)
		data[k] = upper_scalar(data[k]);
}
