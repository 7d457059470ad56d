#pragma once

// ============================================================================
// Distribution set: per-file partial result and global aggregate
//
// Every primitive merges by sum / union, so merge is associative and
// commutative and the result is independent of file order and worker count.
// ============================================================================

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <unordered_map>
#include <unordered_set>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace aggregate {

using FlatTable = std::unordered_map<std::string, int64_t>;   // value -> count
using NestedTable = std::unordered_map<std::string, FlatTable>; // outer -> value -> count
using DistinctSet = std::unordered_set<std::string>;

// JSON 标量的计数 key: 字符串原样, 其他标量用紧凑 JSON
// 数组和对象没有 key
inline std::optional<std::string> scalar_key(const json &v) {
  if (v.is_string())
    return v.get<std::string>();
  if (v.is_array() || v.is_object() || v.is_binary() || v.is_discarded())
    return std::nullopt;
  return v.dump();
}

inline void merge_into(FlatTable &dst, const FlatTable &src) {
  for (const auto &[k, n] : src)
    dst[k] += n;
}

inline void merge_into(NestedTable &dst, const NestedTable &src) {
  for (const auto &[outer, inner] : src)
    merge_into(dst[outer], inner);
}

inline void merge_into(DistinctSet &dst, const DistinctSet &src) {
  dst.insert(src.begin(), src.end());
}

// 一条通过的记录, 用于把计数关联回源文件
struct RunIndexRow {
  std::string file;
  std::string play_id;
  std::string character_chosen;
  std::string victory;

  bool operator<(const RunIndexRow &o) const {
    return std::tie(file, play_id, character_chosen, victory) <
           std::tie(o.file, o.play_id, o.character_chosen, o.victory);
  }
  bool operator==(const RunIndexRow &o) const {
    return std::tie(file, play_id, character_chosen, victory) ==
           std::tie(o.file, o.play_id, o.character_chosen, o.victory);
  }
};

using RunIndex = std::multiset<RunIndexRow>;

// ============================================================================
// 元数据计数
// ============================================================================
struct Counters {
  int64_t processed_logs = 0;      // 通过的记录
  int64_t modded_logs_skipped = 0; // 被拒绝的记录
  int64_t data_errors = 0;         // 元素格式错误 / 顶层结构错误
  int64_t filter_errors = 0;       // 分类器异常
  int64_t extraction_errors = 0;   // 单字段提取失败
  int64_t files_ok = 0;
  int64_t files_failed = 0;
  FlatTable modded_reasons;        // reason code -> count
  FlatTable content_markers;       // 标记 -> 包含它的文件数

  void merge(const Counters &o) {
    processed_logs += o.processed_logs;
    modded_logs_skipped += o.modded_logs_skipped;
    data_errors += o.data_errors;
    filter_errors += o.filter_errors;
    extraction_errors += o.extraction_errors;
    files_ok += o.files_ok;
    files_failed += o.files_failed;
    merge_into(modded_reasons, o.modded_reasons);
    merge_into(content_markers, o.content_markers);
  }

  bool operator==(const Counters &o) const = default;
};

// ============================================================================
// DistributionSet
// ============================================================================
struct DistributionSet {
  // 一级频次表
  FlatTable floor_reached;
  FlatTable master_deck;
  FlatTable relics;
  FlatTable path_per_floor_counts;
  FlatTable floor_paths; // 整条路径, 逗号拼接
  FlatTable neow_bonus;
  FlatTable neow_cost;
  FlatTable purchased_purges;
  FlatTable events;
  FlatTable is_trial;
  FlatTable character_chosen;
  FlatTable is_prod;
  FlatTable is_daily;
  FlatTable chose_seed;
  FlatTable circlet_count;
  FlatTable win_rate;
  FlatTable is_beta;
  FlatTable is_endless;
  FlatTable special_seed;
  FlatTable record_keys; // 通过记录的字段名统计

  // 二级频次表
  NestedTable damage_taken_by_enemy; // enemy -> damage -> count
  NestedTable potions_obtained;      // potion -> floor -> count
  NestedTable event_player_choices;  // event -> choice -> count

  // 去重集合
  DistinctSet floors_visited;
  DistinctSet items_purchased;
  DistinctSet build_version;
  DistinctSet flagged_files;

  RunIndex run_index;
  Counters meta;

  void merge(const DistributionSet &o);
  json to_json() const;

  bool operator==(const DistributionSet &o) const = default;
};

struct FlatField {
  const char *name;
  FlatTable DistributionSet::*table;
};

struct NestedField {
  const char *name;
  NestedTable DistributionSet::*table;
};

struct SetField {
  const char *name;
  DistinctSet DistributionSet::*set;
};

inline constexpr FlatField FLAT_FIELDS[] = {
    {"floor_reached", &DistributionSet::floor_reached},
    {"master_deck", &DistributionSet::master_deck},
    {"relics", &DistributionSet::relics},
    {"path_per_floor_counts", &DistributionSet::path_per_floor_counts},
    {"floor_paths", &DistributionSet::floor_paths},
    {"neow_bonus", &DistributionSet::neow_bonus},
    {"neow_cost", &DistributionSet::neow_cost},
    {"purchased_purges", &DistributionSet::purchased_purges},
    {"events", &DistributionSet::events},
    {"is_trial", &DistributionSet::is_trial},
    {"character_chosen", &DistributionSet::character_chosen},
    {"is_prod", &DistributionSet::is_prod},
    {"is_daily", &DistributionSet::is_daily},
    {"chose_seed", &DistributionSet::chose_seed},
    {"circlet_count", &DistributionSet::circlet_count},
    {"win_rate", &DistributionSet::win_rate},
    {"is_beta", &DistributionSet::is_beta},
    {"is_endless", &DistributionSet::is_endless},
    {"special_seed", &DistributionSet::special_seed},
    {"record_keys", &DistributionSet::record_keys},
};

inline constexpr NestedField NESTED_FIELDS[] = {
    {"damage_taken_by_enemy", &DistributionSet::damage_taken_by_enemy},
    {"potions_obtained", &DistributionSet::potions_obtained},
    {"event_player_choices", &DistributionSet::event_player_choices},
};

inline constexpr SetField SET_FIELDS[] = {
    {"floors_visited", &DistributionSet::floors_visited},
    {"items_purchased", &DistributionSet::items_purchased},
    {"build_version", &DistributionSet::build_version},
    {"flagged_files", &DistributionSet::flagged_files},
};

inline void DistributionSet::merge(const DistributionSet &o) {
  if (&o == this) {
    DistributionSet copy = o;
    merge(copy);
    return;
  }
  for (const auto &f : FLAT_FIELDS)
    merge_into(this->*f.table, o.*f.table);
  for (const auto &f : NESTED_FIELDS)
    merge_into(this->*f.table, o.*f.table);
  for (const auto &f : SET_FIELDS)
    merge_into(this->*f.set, o.*f.set);
  run_index.insert(o.run_index.begin(), o.run_index.end());
  meta.merge(o.meta);
}

inline json DistributionSet::to_json() const {
  json out = json::object();

  for (const auto &f : FLAT_FIELDS)
    out[f.name] = this->*f.table;

  for (const auto &f : NESTED_FIELDS)
    out[f.name] = this->*f.table;

  for (const auto &f : SET_FIELDS) {
    const auto &s = this->*f.set;
    out[f.name] = std::set<std::string>(s.begin(), s.end());
  }

  json rows = json::array();
  for (const auto &r : run_index) {
    rows.push_back({{"file", r.file},
                    {"play_id", r.play_id},
                    {"character_chosen", r.character_chosen},
                    {"victory", r.victory}});
  }
  out["run_index"] = std::move(rows);

  out["_meta"] = {
      {"processed_logs", meta.processed_logs},
      {"modded_logs_skipped", meta.modded_logs_skipped},
      {"data_errors", meta.data_errors},
      {"filter_errors", meta.filter_errors},
      {"extraction_errors", meta.extraction_errors},
      {"files_ok", meta.files_ok},
      {"files_failed", meta.files_failed},
      {"modded_reasons", meta.modded_reasons},
      {"content_markers", meta.content_markers},
  };
  return out;
}

} // namespace aggregate
