#pragma once

#include <cstdint>
#include <cstdlib>
#include <new>
#include <string>
#include <string_view>
#include <vector>

template <typename T> struct AlignedAllocator {
	static constexpr std::size_t ALIGNMENT = 64;

	using value_type = T;

	AlignedAllocator() = default;

	template <class U> constexpr AlignedAllocator(const AlignedAllocator<U> &) noexcept {}

	static T *allocate(const std::size_t n) {
		if (n > static_cast<std::size_t>(-1) / sizeof(T) - ALIGNMENT)
			throw std::bad_alloc();
		const std::size_t bytes = (n * sizeof(T) + ALIGNMENT - 1) / ALIGNMENT * ALIGNMENT;
		void *ptr = std::aligned_alloc(ALIGNMENT, bytes);
		if (!ptr)
			throw std::bad_alloc();
		return static_cast<T *>(ptr);
	}

	static void deallocate(T *p, std::size_t) noexcept {
		std::free(p);
	}
};

template <class T, class U> bool operator==(const AlignedAllocator<T> &, const AlignedAllocator<U> &) {
	return true;
}

template <class T, class U> bool operator!=(const AlignedAllocator<T> &, const AlignedAllocator<U> &) {
	return false;
}

using ByteBuffer = std::vector<uint8_t, AlignedAllocator<uint8_t>>;

// Read-only mapping of a whole file. Throws SearchError (IOError, FileTooLarge).
class MappedFile {
	uint8_t *data_;
	size_t size_;
	int fd_;
	int64_t mtime_sec_;
	int64_t mtime_nsec_;

public:
	MappedFile(const std::string &filepath, uint64_t max_bytes);

	~MappedFile();

	MappedFile(const MappedFile &) = delete;

	MappedFile &operator=(const MappedFile &) = delete;

	[[nodiscard]]
	const uint8_t *data() const {
		return data_;
	}

	[[nodiscard]]
	size_t size() const {
		return size_;
	}

	[[nodiscard]]
	int64_t mtime_sec() const {
		return mtime_sec_;
	}

	[[nodiscard]]
	int64_t mtime_nsec() const {
		return mtime_nsec_;
	}
};

// Leads every .cache.bin file; the sanitized bytes follow it.
struct CacheHeader {
	uint64_t magic;
	uint64_t source_size;
	int64_t source_mtime_sec;
	int64_t source_mtime_nsec;
};

inline constexpr uint64_t CACHE_MAGIC = 0x31444e4946514553ULL; // "SEQFIND1"

struct LoadOptions {
	uint64_t max_file_bytes;
	bool use_cache;
	bool verbose;

	explicit LoadOptions();
};

/*
 * Immutable in-memory copy of a sequence file. Line terminators are dropped and
 * ASCII letters uppercased; header lines are kept verbatim. The first
 * valid_length() bytes of the buffer are sequence data, the rest is padding.
 */
class SequenceStore {
	ByteBuffer buffer_;
	size_t valid_length_;

public:
	SequenceStore(ByteBuffer buffer, size_t valid_length);

	SequenceStore(const SequenceStore &) = delete;

	SequenceStore &operator=(const SequenceStore &) = delete;

	SequenceStore(SequenceStore &&) noexcept = default;

	SequenceStore &operator=(SequenceStore &&) noexcept = default;

	static SequenceStore load(const std::string &filepath, const LoadOptions &options = LoadOptions());

	// Builds a store from in-memory text with the same normalization as load().
	static SequenceStore from_text(std::string_view text);

	[[nodiscard]]
	const uint8_t *data() const {
		return buffer_.data();
	}

	[[nodiscard]]
	size_t valid_length() const {
		return valid_length_;
	}

	[[nodiscard]]
	size_t buffer_size() const {
		return buffer_.size();
	}

	[[nodiscard]]
	std::string_view view() const {
		return {reinterpret_cast<const char *>(buffer_.data()), valid_length_};
	}
};

std::string cache_path_for(const std::string &filepath);
