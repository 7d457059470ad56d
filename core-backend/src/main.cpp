#include <cstring>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "aggregate/aggregator.hpp"
#include "classify/classifier.hpp"
#include "core/config.hpp"
#include "core/pipeline.hpp"
#include "core/reference_tables.hpp"
#include "persist/snapshot_store.hpp"
#include "sched/scheduler.hpp"

void print_usage(const char *prog) {
  std::cout << "usage: " << prog << " --config <config.json> [--log-dir <dir>]" << std::endl;
}

int main(int argc, char *argv[]) {
  std::string config_path = "config.json";
  std::string log_dir_override;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else if (std::strcmp(argv[i], "--log-dir") == 0 && i + 1 < argc) {
      log_dir_override = argv[++i];
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return 0;
    } else {
      std::cerr << "[Main] unknown argument: " << argv[i] << std::endl;
      print_usage(argv[0]);
      return 2;
    }
  }

  std::cout << "========================================" << std::endl;
  std::cout << "    spirestat run aggregator" << std::endl;
  std::cout << "========================================" << std::endl;

  try {
    // 加载配置
    Config config = Config::load(config_path);
    if (!log_dir_override.empty())
      config.log_dir = log_dir_override;
    if (config.log_dir.empty())
      throw std::runtime_error("log_dir not set (config or --log-dir)");

    std::cout << "[Main] Log Dir: " << config.log_dir << std::endl;
    std::cout << "[Main] DB Path: " << config.db_path << std::endl;
    std::cout << "[Main] Tables: " << config.tables_path << std::endl;
    std::cout << "[Main] Missing Key Policy: " << config.missing_key_policy << std::endl;

    // 参考表 + 分类器 + 调度器
    auto tables = std::make_shared<const tables::ReferenceTables>(
        tables::ReferenceTables::load(config.tables_path));
    std::cout << "[Main] " << tables->events.size() << " events, " << tables->cards.size() << " cards, "
              << tables->event_choice_blocklist.size() << " blocklisted events" << std::endl;

    classify::Classifier classifier(tables, classify::parse_policy(config.missing_key_policy));
    sched::Scheduler scheduler(static_cast<size_t>(config.workers), static_cast<size_t>(config.progress_every));

    auto files = pipeline::list_files(config.log_dir, config.file_extensions);
    std::cout << "[Main] " << files.size() << " files to process" << std::endl;
    if (files.empty()) {
      std::cout << "[Main] nothing to do" << std::endl;
      return 0;
    }

    // 处理所有文件并汇总
    auto global = pipeline::run(files, classifier, scheduler);
    aggregate::Aggregator::log_summary(global);

    if (global.meta.files_ok == 0) {
      std::cerr << "[Main] no file processed successfully, snapshot not written" << std::endl;
      return 0;
    }

    // 写入快照
    persist::SnapshotStore store(config.db_path);
    store.save(global);
    std::cout << "[Store] snapshot saved to " << config.db_path << " ("
              << store.table_count("dist_flat") << " flat rows, "
              << store.table_count("dist_nested") << " nested rows)" << std::endl;

    if (!config.json_path.empty()) {
      std::ofstream out(config.json_path);
      if (!out.is_open())
        throw std::runtime_error("cannot write " + config.json_path);
      out << global.to_json().dump(2) << std::endl;
      std::cout << "[Store] JSON snapshot saved to " << config.json_path << std::endl;
    }
  } catch (const std::exception &e) {
    std::cerr << "[Main] fatal: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
