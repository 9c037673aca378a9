#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "config.hpp"

static std::string clean_json_token(const std::string &str) {
	const std::string junk = " \t\n\r\",{}";
	const size_t first = str.find_first_not_of(junk);
	if (std::string::npos == first)
		return "";
	const size_t last = str.find_last_not_of(junk);
	return str.substr(first, (last - first + 1));
}

SearchConfig::SearchConfig()
	: workers(0), verbose(true), use_cache(false), max_file_bytes(std::vector<uint8_t>().max_size()) {}

bool ConfigLoader::parse_bool(const std::string &key, const std::string &val) {
	if (val == "true")
		return true;
	if (val == "false")
		return false;
	throw std::runtime_error("Invalid " + key + " (must be true or false): " + val);
}

uint64_t ConfigLoader::parse_count(const std::string &key, const std::string &val) {
	if (val.empty() || !std::all_of(val.begin(), val.end(), [](const unsigned char c) { return std::isdigit(c); }))
		throw std::runtime_error("Invalid " + key + " (must be a non-negative integer): " + val);
	try {
		return std::stoull(val);
	} catch (const std::out_of_range &) {
		throw std::runtime_error("Invalid " + key + " (out of range): " + val);
	}
}

SearchConfig ConfigLoader::load_from_json(const std::string &filepath) {
	std::ifstream file(filepath);
	if (!file.is_open()) {
		throw std::runtime_error("Unable to open the configuration file: " + filepath);
	}

	SearchConfig config;
	std::string line;

	while (std::getline(file, line)) {
		size_t colon_pos = line.find(':');
		if (colon_pos == std::string::npos)
			continue;

		std::string key = clean_json_token(line.substr(0, colon_pos));
		std::string val = clean_json_token(line.substr(colon_pos + 1));

		if (key == "workers") {
			const uint64_t workers = parse_count(key, val);
			if (workers > MAX_WORKERS)
				throw std::runtime_error(
					"Invalid workers (at most " + std::to_string(MAX_WORKERS) + "): " + val
				);
			config.workers = static_cast<size_t>(workers);
		} else if (key == "verbose") {
			config.verbose = parse_bool(key, val);
		} else if (key == "use_cache") {
			config.use_cache = parse_bool(key, val);
		} else if (key == "max_file_bytes") {
			config.max_file_bytes = parse_count(key, val);
			if (config.max_file_bytes == 0)
				throw std::runtime_error("Invalid configuration: 'max_file_bytes' must be > 0.");
		}
	}

	return config;
}

void ConfigLoader::print(const SearchConfig &config, std::ostream &out) {
	out << "[CONFIG] Loaded Search Config:" << std::endl;
	if (config.workers == 0)
		out << "  > Workers         : auto" << std::endl;
	else
		out << "  > Workers         : " << config.workers << std::endl;
	out << "  > Buffer Cache    : " << (config.use_cache ? "on" : "off") << std::endl;
	out << "  > Max File Size   : " << config.max_file_bytes << " bytes" << std::endl;
}
