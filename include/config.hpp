#pragma once

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>

// Upper bound on the "workers" key; one thread is spawned per worker.
inline constexpr size_t MAX_WORKERS = 4096;

struct SearchConfig {
	size_t workers;
	bool verbose;
	bool use_cache;
	uint64_t max_file_bytes;

	explicit SearchConfig();
};

class ConfigLoader {
	static bool parse_bool(const std::string &key, const std::string &val);

	static uint64_t parse_count(const std::string &key, const std::string &val);

public:
	static SearchConfig load_from_json(const std::string &filepath);

	static void print(const SearchConfig &config, std::ostream &out = std::cout);
};
