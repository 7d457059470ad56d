#pragma once

// ============================================================================
// File Worker: one telemetry file -> one partial DistributionSet
//
// read -> marker scan -> parse -> per element: classify -> extract
// Element and field failures become counters; only read/parse failures make
// the whole file a FileError.
// ============================================================================

#include "../aggregate/distribution.hpp"
#include "../classify/classifier.hpp"
#include "file_result.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <utility>

using json = nlohmann::json;

namespace ingest {

// 通过的记录中某个字段无法提取
class FieldError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class Worker {
public:
  using DistributionSet = aggregate::DistributionSet;

  explicit Worker(const classify::Classifier &classifier) : classifier_(classifier) {}

  FileResult process(const std::string &path) const {
    std::string content;
    std::string read_error;
    if (!read_file(path, content, read_error)) {
      std::cerr << "[Worker] read fail: " << path << " - " << read_error << std::endl;
      return FileError{path, FileErrorKind::READ, read_error};
    }

    std::string file_name = std::filesystem::path(path).filename().string();
    DistributionSet dist;
    if (content.empty())
      return dist;

    scan_markers(content, file_name, dist);

    json doc;
    try {
      doc = json::parse(content);
    } catch (const json::exception &e) {
      std::cerr << "[Worker] JSON parse fail: " << path << " - " << e.what() << std::endl;
      return FileError{path, FileErrorKind::PARSE, e.what()};
    }
    content.clear();
    content.shrink_to_fit();

    process_document(doc, file_name, dist);
    return dist;
  }

  // 顶层: {"event": {...}} 或 [{"event": {...}}, ...]
  void process_document(const json &doc, const std::string &file_name, DistributionSet &dist) const {
    if (doc.is_object() && doc.contains("event")) {
      process_element(doc, file_name, dist);
      return;
    }
    if (!doc.is_array()) {
      std::cerr << "[Worker] expected list/dict of logs, got " << doc.type_name()
                << " in " << file_name << std::endl;
      ++dist.meta.data_errors;
      return;
    }
    for (const auto &element : doc)
      process_element(element, file_name, dist);
  }

  void process_element(const json &element, const std::string &file_name, DistributionSet &dist) const {
    if (!element.is_object() || !element.contains("event")) {
      ++dist.meta.data_errors;
      return;
    }
    const auto &record = element.at("event");
    if (!record.is_object()) {
      ++dist.meta.data_errors;
      return;
    }

    classify::Verdict verdict;
    try {
      verdict = classifier_.classify(record);
    } catch (const std::exception &e) {
      std::cerr << "[Worker] filter check error in " << file_name << ": " << e.what() << std::endl;
      ++dist.meta.filter_errors;
      verdict = classify::Verdict::reject(classify::reason::CHECK_ERROR);
    }

    if (!verdict.accepted) {
      ++dist.meta.modded_logs_skipped;
      ++dist.meta.modded_reasons[verdict.reason];
      return;
    }

    ++dist.meta.processed_logs;
    extract(record, file_name, dist);
  }

private:
  static bool read_file(const std::string &path, std::string &out, std::string &error) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
      error = ec ? ec.message() : "not a regular file";
      return false;
    }
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
      error = "cannot open";
      return false;
    }
    out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    if (f.bad()) {
      error = "read error";
      return false;
    }
    return true;
  }

  void scan_markers(const std::string &content, const std::string &file_name, DistributionSet &dist) const {
    for (const auto &marker : classifier_.tables().content_markers) {
      if (content.find(marker) != std::string::npos) {
        ++dist.meta.content_markers[marker];
        dist.flagged_files.insert(file_name);
      }
    }
  }

  // ==========================================================================
  // 字段提取: 每个字段独立捕获异常
  // ==========================================================================

  template <typename Fn>
  static void guarded(DistributionSet &dist, Fn &&fn) {
    try {
      fn();
    } catch (const FieldError &) {
      ++dist.meta.extraction_errors;
    } catch (const json::exception &) {
      ++dist.meta.extraction_errors;
    }
  }

  // 存在且非 null 时按 key 计数, 数组/对象视为错误
  static void count_scalar(const json &r, const char *key, aggregate::FlatTable &table) {
    auto it = r.find(key);
    if (it == r.end() || it->is_null())
      return;
    auto k = aggregate::scalar_key(*it);
    if (!k)
      throw FieldError(std::string(key) + ": cannot count " + it->type_name());
    ++table[*k];
  }

  static void count_strings(const json &r, const char *key, aggregate::FlatTable &table) {
    auto it = r.find(key);
    if (it == r.end() || !it->is_array())
      return;
    for (const auto &v : *it) {
      if (v.is_string())
        ++table[v.get<std::string>()];
    }
  }

  // (outer string, inner non-null scalar) pairs from a list of objects
  static void count_pairs(const json &r, const char *key, const char *outer_key, const char *inner_key,
                          aggregate::NestedTable &table) {
    auto it = r.find(key);
    if (it == r.end() || !it->is_array())
      return;
    for (const auto &entry : *it) {
      if (!entry.is_object())
        continue;
      auto outer = entry.find(outer_key);
      auto inner = entry.find(inner_key);
      if (outer == entry.end() || !outer->is_string() || inner == entry.end() || inner->is_null())
        continue;
      auto k = aggregate::scalar_key(*inner);
      if (!k)
        continue;
      ++table[outer->get<std::string>()][*k];
    }
  }

  static void extract(const json &r, const std::string &file_name, DistributionSet &d) {
    guarded(d, [&] { count_scalar(r, "floor_reached", d.floor_reached); });
    guarded(d, [&] { count_strings(r, "master_deck", d.master_deck); });
    guarded(d, [&] { count_strings(r, "relics", d.relics); });
    guarded(d, [&] { count_pairs(r, "damage_taken", "enemies", "damage", d.damage_taken_by_enemy); });
    guarded(d, [&] { count_pairs(r, "potions_obtained", "key", "floor", d.potions_obtained); });
    guarded(d, [&] { extract_path(r, d); });
    guarded(d, [&] { extract_floor_path(r, d); });

    guarded(d, [&] {
      auto it = r.find("items_purchased");
      if (it == r.end() || !it->is_array())
        return;
      for (const auto &item : *it) {
        if (item.is_null())
          continue;
        if (auto k = aggregate::scalar_key(item))
          d.items_purchased.insert(*k);
      }
    });

    guarded(d, [&] {
      auto it = r.find("neow_bonus");
      if (it == r.end() || it->is_null())
        return;
      if (auto k = aggregate::scalar_key(*it))
        ++d.neow_bonus[*k];
    });

    guarded(d, [&] {
      auto it = r.find("build_version");
      if (it == r.end() || it->is_null())
        return;
      if (auto k = aggregate::scalar_key(*it))
        d.build_version.insert(*k);
    });

    guarded(d, [&] { count_scalar(r, "purchased_purges", d.purchased_purges); });
    guarded(d, [&] { extract_events(r, d); });
    guarded(d, [&] { count_scalar(r, "neow_cost", d.neow_cost); });
    guarded(d, [&] { count_scalar(r, "is_trial", d.is_trial); });

    guarded(d, [&] {
      auto it = r.find("character_chosen");
      if (it != r.end() && it->is_string())
        ++d.character_chosen[it->get<std::string>()];
    });

    guarded(d, [&] { count_scalar(r, "is_prod", d.is_prod); });
    guarded(d, [&] { count_scalar(r, "is_daily", d.is_daily); });
    guarded(d, [&] { count_scalar(r, "chose_seed", d.chose_seed); });
    guarded(d, [&] { count_scalar(r, "circlet_count", d.circlet_count); });
    guarded(d, [&] { count_scalar(r, "victory", d.win_rate); });
    guarded(d, [&] { count_scalar(r, "is_beta", d.is_beta); });
    guarded(d, [&] { count_scalar(r, "is_endless", d.is_endless); });
    guarded(d, [&] { count_scalar(r, "special_seed", d.special_seed); });
    guarded(d, [&] { append_run_index(r, file_name, d); });
    guarded(d, [&] {
      for (auto it = r.begin(); it != r.end(); ++it)
        ++d.record_keys[it.key()];
    });
  }

  static void extract_path(const json &r, DistributionSet &d) {
    auto it = r.find("path_per_floor");
    if (it == r.end() || !it->is_array())
      return;
    for (const auto &room : *it) {
      auto k = aggregate::scalar_key(room);
      if (!k)
        continue;
      d.floors_visited.insert(*k);
      if (room.is_string())
        ++d.path_per_floor_counts[*k];
    }
  }

  // 整条路径作为一个 key: "M,?,M,$,null,..."
  static void extract_floor_path(const json &r, DistributionSet &d) {
    auto it = r.find("path_per_floor");
    if (it == r.end() || !it->is_array())
      return;
    std::string path;
    bool first = true;
    for (const auto &room : *it) {
      auto k = aggregate::scalar_key(room);
      if (!k)
        throw FieldError("path_per_floor: unhashable element");
      if (!first)
        path += ',';
      path += *k;
      first = false;
    }
    ++d.floor_paths[path];
  }

  static void extract_events(const json &r, DistributionSet &d) {
    auto it = r.find("event_choices");
    if (it == r.end() || !it->is_array())
      return;
    for (const auto &entry : *it) {
      if (!entry.is_object())
        continue;
      // name 和 choice 都是字符串才计数
      auto name = entry.find("event_name");
      auto choice = entry.find("player_choice");
      if (name == entry.end() || !name->is_string() || choice == entry.end() || !choice->is_string())
        continue;
      const auto &event_name = name->get_ref<const std::string &>();
      ++d.events[event_name];
      ++d.event_player_choices[event_name][choice->get<std::string>()];
    }
  }

  static void append_run_index(const json &r, const std::string &file_name, DistributionSet &d) {
    auto key_of = [&r](const char *key) -> std::string {
      auto it = r.find(key);
      if (it == r.end())
        return "null";
      auto k = aggregate::scalar_key(*it);
      if (!k)
        throw FieldError(std::string(key) + ": not a scalar");
      return *k;
    };
    d.run_index.insert({file_name, key_of("play_id"), key_of("character_chosen"), key_of("victory")});
  }

  const classify::Classifier &classifier_;
};

} // namespace ingest
