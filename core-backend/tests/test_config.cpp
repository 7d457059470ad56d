/**
 * @file test_config.cpp
 * @brief Run configuration parsing and validation.
 */

#include <gtest/gtest.h>
#include <core/config.hpp>

#include "test_support.hpp"

#include <stdexcept>

TEST(ConfigTest, Defaults) {
  auto c = Config::from_json(json::object());
  EXPECT_TRUE(c.log_dir.empty());
  EXPECT_EQ(c.db_path, "spirestat.duckdb");
  EXPECT_TRUE(c.json_path.empty());
  EXPECT_EQ(c.tables_path, "data/reference_tables.json");
  EXPECT_EQ(c.workers, 0);
  EXPECT_EQ(c.progress_every, 500);
  EXPECT_EQ(c.missing_key_policy, "lenient");
  EXPECT_TRUE(c.file_extensions.empty());
}

TEST(ConfigTest, ReadsEveryField) {
  json j = {{"log_dir", "/data/runs"},
            {"db_path", "out.duckdb"},
            {"json_path", "out.json"},
            {"tables_path", "tables.json"},
            {"workers", 6},
            {"progress_every", 0},
            {"missing_key_policy", "strict"},
            {"file_extensions", json::array({".json", ".run"})}};
  auto c = Config::from_json(j);
  EXPECT_EQ(c.log_dir, "/data/runs");
  EXPECT_EQ(c.db_path, "out.duckdb");
  EXPECT_EQ(c.json_path, "out.json");
  EXPECT_EQ(c.tables_path, "tables.json");
  EXPECT_EQ(c.workers, 6);
  EXPECT_EQ(c.progress_every, 0);
  EXPECT_EQ(c.missing_key_policy, "strict");
  EXPECT_EQ(c.file_extensions, (std::vector<std::string>{".json", ".run"}));
}

TEST(ConfigTest, RejectsInvalidValues) {
  EXPECT_THROW(Config::from_json(json::array()), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"workers", -1}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"progress_every", -5}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"missing_key_policy", "loose"}}), std::runtime_error);
}

TEST(ConfigTest, LoadFromFile) {
  testing_support::TempDir dir;
  auto path = dir.write("config.json", R"({"log_dir": "runs", "workers": 2})");
  auto c = Config::load(path);
  EXPECT_EQ(c.log_dir, "runs");
  EXPECT_EQ(c.workers, 2);

  EXPECT_THROW(Config::load(dir.file("missing.json")), std::runtime_error);
  auto bad = dir.write("bad.json", "{ workers: 2 }");
  EXPECT_THROW(Config::load(bad), std::runtime_error);
  auto wrong_type = dir.write("wrong.json", R"({"workers": "many"})");
  EXPECT_THROW(Config::load(wrong_type), std::runtime_error);
}
