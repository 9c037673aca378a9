#pragma once

#include <cstddef>
#include <cstdint>

// Copies src to dst dropping every '\n' and '\r' byte. dst must hold size bytes.
// Returns the number of bytes written.
size_t strip_line_breaks(const uint8_t *__restrict__ src, size_t size, uint8_t *__restrict__ dst);

// In-place ASCII uppercase; bytes outside 'a'..'z' are left untouched.
void uppercase_ascii(uint8_t *data, size_t size);
