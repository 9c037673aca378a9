#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config.hpp"
#include "temp_file.hpp"

TEST(ConfigTest, Defaults) {
	const SearchConfig cfg;
	EXPECT_EQ(cfg.workers, 0u);
	EXPECT_TRUE(cfg.verbose);
	EXPECT_FALSE(cfg.use_cache);
	EXPECT_EQ(cfg.max_file_bytes, std::vector<uint8_t>().max_size());
}

TEST(ConfigTest, ParsesAllKeys) {
	const TempFile file(R"({
  "workers": 6,
  "verbose": false,
  "use_cache": true,
  "max_file_bytes": 1048576
})",
						".json");

	const SearchConfig cfg = ConfigLoader::load_from_json(file.path());
	EXPECT_EQ(cfg.workers, 6u);
	EXPECT_FALSE(cfg.verbose);
	EXPECT_TRUE(cfg.use_cache);
	EXPECT_EQ(cfg.max_file_bytes, 1048576u);
}

TEST(ConfigTest, UnknownKeysIgnoredAndMissingKeysDefault) {
	const TempFile file("{\n  \"label\": \"hg38 run\",\n  \"workers\": 2\n}\n", ".json");
	const SearchConfig cfg = ConfigLoader::load_from_json(file.path());
	EXPECT_EQ(cfg.workers, 2u);
	EXPECT_TRUE(cfg.verbose);
	EXPECT_FALSE(cfg.use_cache);
}

TEST(ConfigTest, MissingFileThrows) {
	EXPECT_THROW(ConfigLoader::load_from_json("/nonexistent/seqfind.json"), std::runtime_error);
}

TEST(ConfigTest, RejectsBadValues) {
	const TempFile negative("{ \"workers\": -1 }\n", ".json");
	EXPECT_THROW(ConfigLoader::load_from_json(negative.path()), std::runtime_error);

	const TempFile text("{ \"workers\": \"many\" }\n", ".json");
	EXPECT_THROW(ConfigLoader::load_from_json(text.path()), std::runtime_error);

	const TempFile flag("{ \"verbose\": yes }\n", ".json");
	EXPECT_THROW(ConfigLoader::load_from_json(flag.path()), std::runtime_error);

	const TempFile zero_limit("{ \"max_file_bytes\": 0 }\n", ".json");
	EXPECT_THROW(ConfigLoader::load_from_json(zero_limit.path()), std::runtime_error);

	const TempFile too_many_workers("{ \"workers\": 1000000000000 }\n", ".json");
	EXPECT_THROW(ConfigLoader::load_from_json(too_many_workers.path()), std::runtime_error);

	const TempFile overflow("{ \"max_file_bytes\": 99999999999999999999999 }\n", ".json");
	EXPECT_THROW(ConfigLoader::load_from_json(overflow.path()), std::runtime_error);
}

TEST(ConfigTest, WorkerCapIsInclusive) {
	const TempFile at_cap("{ \"workers\": " + std::to_string(MAX_WORKERS) + " }\n", ".json");
	EXPECT_EQ(ConfigLoader::load_from_json(at_cap.path()).workers, MAX_WORKERS);

	const TempFile above_cap("{ \"workers\": " + std::to_string(MAX_WORKERS + 1) + " }\n", ".json");
	EXPECT_THROW(ConfigLoader::load_from_json(above_cap.path()), std::runtime_error);
}

TEST(ConfigTest, PrintGoesToGivenStream) {
	SearchConfig cfg;
	cfg.workers = 3;
	std::ostringstream out;
	ConfigLoader::print(cfg, out);
	EXPECT_NE(out.str().find("[CONFIG]"), std::string::npos);
	EXPECT_NE(out.str().find("Workers         : 3"), std::string::npos);
}
