#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <utility>

#include <sys/mman.h>
#include <sys/stat.h>

#include "errors.hpp"
#include "loader.hpp"
#include "normalize.hpp"

namespace fs = std::filesystem;

static std::string errno_text() {
	return std::strerror(errno);
}

std::string cache_path_for(const std::string &filepath) {
	return filepath + ".cache.bin";
}

static CacheHeader header_for(const MappedFile &source) {
	CacheHeader header{};
	header.magic = CACHE_MAGIC;
	header.source_size = source.size();
	header.source_mtime_sec = source.mtime_sec();
	header.source_mtime_nsec = source.mtime_nsec();
	return header;
}

static void save_cache(
	const std::string &source_path,
	const MappedFile &source,
	const uint8_t *data,
	const size_t size,
	const bool verbose
) {
	const std::string bin_path = cache_path_for(source_path);
	const CacheHeader header = header_for(source);

	std::ofstream out_data(bin_path, std::ios::binary | std::ios::trunc);
	if (out_data) {
		out_data.write(reinterpret_cast<const char *>(&header), sizeof(header));
		out_data.write(reinterpret_cast<const char *>(data), static_cast<std::streamsize>(size));
	}
	if (!out_data) {
		std::cerr << "[WARN] Could not write buffer cache: " << bin_path << std::endl;
		std::error_code ec;
		fs::remove(bin_path, ec);
		return;
	}
	if (verbose)
		std::cout << "[LOADER] Cache created: " << bin_path << std::endl;
}

// The cache only stands for the exact source it was built from: same size and
// same nanosecond mtime as the file currently mapped.
static bool load_cache(const std::string &source_path, const MappedFile &source, ByteBuffer &data) {
	std::ifstream in_data(cache_path_for(source_path), std::ios::binary | std::ios::ate);
	if (!in_data)
		return false;
	const std::streamoff file_size = in_data.tellg();
	if (file_size < static_cast<std::streamoff>(sizeof(CacheHeader)))
		return false;
	in_data.seekg(0);

	CacheHeader header{};
	if (!in_data.read(reinterpret_cast<char *>(&header), sizeof(header)))
		return false;
	const CacheHeader expected = header_for(source);
	if (header.magic != expected.magic || header.source_size != expected.source_size ||
		header.source_mtime_sec != expected.source_mtime_sec || header.source_mtime_nsec != expected.source_mtime_nsec)
		return false;

	const std::streamoff data_size = file_size - static_cast<std::streamoff>(sizeof(CacheHeader));
	if (static_cast<uint64_t>(data_size) > expected.source_size)
		return false;
	data.resize(static_cast<size_t>(data_size));
	if (data_size > 0 && !in_data.read(reinterpret_cast<char *>(data.data()), data_size)) {
		data.clear();
		return false;
	}
	return true;
}

MappedFile::MappedFile(const std::string &filepath, const uint64_t max_bytes)
	: data_(nullptr), size_(0), fd_(-1), mtime_sec_(0), mtime_nsec_(0) {
	fd_ = open(filepath.c_str(), O_RDONLY);
	if (fd_ == -1)
		throw SearchError(SearchErrc::IOError, "Unable to open file " + filepath + ": " + errno_text());

	struct stat sb{};
	if (fstat(fd_, &sb) == -1) {
		const std::string reason = errno_text();
		close(fd_);
		throw SearchError(SearchErrc::IOError, "fstat error on " + filepath + ": " + reason);
	}
	if (!S_ISREG(sb.st_mode)) {
		close(fd_);
		throw SearchError(SearchErrc::IOError, "Not a regular file: " + filepath);
	}

	const auto file_size = static_cast<uint64_t>(sb.st_size);
	if (file_size > max_bytes || file_size > std::numeric_limits<size_t>::max()) {
		close(fd_);
		throw SearchError(
			SearchErrc::FileTooLarge,
			"The file " + filepath + " is too big (" + std::to_string(file_size) + " bytes, limit " +
				std::to_string(max_bytes) + ")"
		);
	}

	size_ = static_cast<size_t>(file_size);
	mtime_sec_ = static_cast<int64_t>(sb.st_mtim.tv_sec);
	mtime_nsec_ = static_cast<int64_t>(sb.st_mtim.tv_nsec);
	if (size_ == 0)
		return;

	void *mapped = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
	if (mapped == MAP_FAILED) {
		const std::string reason = errno_text();
		close(fd_);
		throw SearchError(SearchErrc::IOError, "mmap failed for " + filepath + ": " + reason);
	}
	data_ = static_cast<uint8_t *>(mapped);
	madvise(data_, size_, MADV_SEQUENTIAL);
}

MappedFile::~MappedFile() {
	if (data_)
		munmap(data_, size_);
	if (fd_ != -1)
		close(fd_);
}

LoadOptions::LoadOptions() : max_file_bytes(std::vector<uint8_t>().max_size()), use_cache(false), verbose(false) {}

SequenceStore::SequenceStore(ByteBuffer buffer, const size_t valid_length)
	: buffer_(std::move(buffer)), valid_length_(valid_length) {
	if (valid_length_ > buffer_.size())
		throw std::invalid_argument("SequenceStore: valid length exceeds buffer size");
}

SequenceStore SequenceStore::load(const std::string &filepath, const LoadOptions &options) {
	const MappedFile file(filepath, options.max_file_bytes);

	ByteBuffer buffer;
	if (options.use_cache && load_cache(filepath, file, buffer)) {
		if (options.verbose)
			std::cout << "[LOADER] Hot Cache Hit! (" << buffer.size() << " bytes)" << std::endl;
		const size_t cached = buffer.size();
		return {std::move(buffer), cached};
	}

	// Sized for the worst case; only the leading valid bytes carry sequence data.
	buffer.resize(file.size());
	const size_t valid = strip_line_breaks(file.data(), file.size(), buffer.data());
	uppercase_ascii(buffer.data(), valid);

	if (options.verbose)
		std::cout << "[LOADER] Loaded " << filepath << ": " << valid << " valid bytes of " << file.size() << std::endl;

	if (options.use_cache)
		save_cache(filepath, file, buffer.data(), valid, options.verbose);

	return {std::move(buffer), valid};
}

SequenceStore SequenceStore::from_text(const std::string_view text) {
	ByteBuffer buffer(text.size());
	const size_t valid = strip_line_breaks(reinterpret_cast<const uint8_t *>(text.data()), text.size(), buffer.data());
	uppercase_ascii(buffer.data(), valid);
	return {std::move(buffer), valid};
}
