#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

// ============================================================================
// 运行配置
// ============================================================================

struct Config {
  std::string log_dir;                                    // 日志文件目录
  std::string db_path = "spirestat.duckdb";               // DuckDB 快照输出
  std::string json_path;                                  // 可选的 JSON 快照输出
  std::string tables_path = "data/reference_tables.json"; // 参考表
  int workers = 0;                                        // 0 = 硬件并发数
  int progress_every = 500;
  std::string missing_key_policy = "lenient";
  std::vector<std::string> file_extensions;               // 为空 = 所有普通文件

  static Config from_json(const json &j) {
    if (!j.is_object())
      throw std::runtime_error("config: top level must be an object");

    Config config;
    config.log_dir = j.value("log_dir", "");
    config.db_path = j.value("db_path", config.db_path);
    config.json_path = j.value("json_path", config.json_path);
    config.tables_path = j.value("tables_path", config.tables_path);
    config.workers = j.value("workers", 0);
    config.progress_every = j.value("progress_every", 500);
    config.missing_key_policy = j.value("missing_key_policy", config.missing_key_policy);

    if (j.contains("file_extensions")) {
      for (const auto &ext : j["file_extensions"])
        config.file_extensions.push_back(ext.get<std::string>());
    }

    if (config.workers < 0)
      throw std::runtime_error("config: workers must be >= 0");
    if (config.progress_every < 0)
      throw std::runtime_error("config: progress_every must be >= 0");
    if (config.missing_key_policy != "lenient" && config.missing_key_policy != "strict")
      throw std::runtime_error("config: missing_key_policy must be lenient or strict");
    return config;
  }

  static Config load(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open())
      throw std::runtime_error("cannot open config file: " + path);

    json j;
    try {
      f >> j;
      return from_json(j);
    } catch (const json::exception &e) {
      throw std::runtime_error("config " + path + ": " + e.what());
    }
  }
};
