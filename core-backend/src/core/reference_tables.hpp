#pragma once

// ============================================================================
// 参考表: 识别 mod 用的只读查找数据
//
// 从 reference_tables.json 加载一次, 所有 worker 只读共享
// ============================================================================

#include <cctype>
#include <fstream>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

using json = nlohmann::json;

namespace tables {

using StringSet = std::unordered_set<std::string>;

// 事件名 -> 只有改版游戏才会出现的选择
using ChoiceBlocklist = std::unordered_map<std::string, StringSet>;

// 正式表文件必须包含的最小黑名单
inline const std::vector<std::pair<const char *, std::vector<const char *>>> &required_blocklist() {
  static const std::vector<std::pair<const char *, std::vector<const char *>>> entries = {
      {"Liars Game", {"disagreed", "agreed"}},
      {"Scrap Ooze", {"success", "unsuccessful"}},
      {"Drug Dealer", {"Got JAX", "Got JAXXED", "Ignored"}},
      {"Wheel of Change", {"Curse", "Damage"}},
      {"Golden Wing", {"Card R??al"}},
      {"The Mausoleum", {"Yes", "No"}},
      {"WeMeetAgain", {"Gold", "Potion", "Card", "Attack"}},
      {"World of Goop", {"Gather Gold", "Left Gold"}},
      {"Accursed Blacksmith", {"Ignore"}},
      {"Transmorgrifier", {"Skipped"}},
      {"Golden Shrine", {"Skipped"}},
      {"The Cleric", {"Purge"}},
      {"Mysterious Sphere", {"Ignore"}},
      {"Falling", {"Ignored"}},
      {"Purifier", {"One Purge", "Skipped"}},
      {"Designer", {"Upgrade Card", "Full Service", "Remove Card", "Removal",
                    "Upgrade 2 Random Cards", "Transform 2 Cards", "Punch", "Tried to Upgrade"}},
      {"Addict", {"Gave JAX"}},
      {"Upgrade Shrine", {"Skipped"}},
      {"Bonfire Elementals", {"UNCOMMON", "BASIC", "RARE", "CURSE", "COMMON", "SPECIAL"}},
      {"FaceTrader", {"Took Face Of Cleric", "Took Mask Of The Ssserpant"}},
      {"Duplicator", {"One dupe"}},
      {"Fountain of Cleansing", {"Removed Curse"}},
      {"SecretPortal", {"Rejected Portal.", "Took Portal."}},
  };
  return entries;
}

struct ReferenceTables {
  StringSet events;
  StringSet cards;
  StringSet modded_enemies;
  StringSet neow_bonuses;
  StringSet invalid_neow_costs;
  StringSet disallowed_characters;
  std::vector<std::string> content_markers; // 文件原文中需要标记的子串
  ChoiceBlocklist event_choice_blocklist;

  bool is_valid_event(const std::string &name) const { return events.count(name) > 0; }

  // "Bash", "Bash+1", "Searing Blow+12" are valid when the base id is listed
  bool is_valid_card(const std::string &card) const {
    if (cards.count(card))
      return true;
    auto plus = card.rfind('+');
    if (plus == std::string::npos || plus == 0 || plus + 1 == card.size())
      return false;
    for (size_t i = plus + 1; i < card.size(); ++i) {
      if (!std::isdigit(static_cast<unsigned char>(card[i])))
        return false;
    }
    return cards.count(card.substr(0, plus)) > 0;
  }

  bool is_blocked_choice(const std::string &event_name, const std::string &choice) const {
    auto it = event_choice_blocklist.find(event_name);
    if (it == event_choice_blocklist.end())
      return false;
    return it->second.count(choice) > 0;
  }

  // Required blocklist pairs absent from this table ("event:choice")
  std::vector<std::string> missing_required_choices() const {
    std::vector<std::string> missing;
    for (const auto &[event_name, choices] : required_blocklist()) {
      for (const char *choice : choices) {
        if (!is_blocked_choice(event_name, choice))
          missing.push_back(std::string(event_name) + ":" + choice);
      }
    }
    return missing;
  }

  // Every key is required; the blocklist is {event: [choice, ...]}
  static ReferenceTables from_json(const json &j) {
    ReferenceTables t;
    t.events = read_set(j, "events");
    t.cards = read_set(j, "cards");
    t.modded_enemies = read_set(j, "modded_enemies");
    t.neow_bonuses = read_set(j, "neow_bonuses");
    t.invalid_neow_costs = read_set(j, "invalid_neow_costs");
    t.disallowed_characters = read_set(j, "disallowed_characters");

    if (j.contains("content_markers")) {
      for (const auto &m : j.at("content_markers")) {
        auto marker = m.get<std::string>();
        if (!marker.empty())
          t.content_markers.push_back(std::move(marker));
      }
    }

    const auto &blocklist = require(j, "event_choice_blocklist");
    if (!blocklist.is_object())
      throw std::runtime_error("reference tables: event_choice_blocklist must be an object");
    for (auto &[event_name, choices] : blocklist.items()) {
      auto &dst = t.event_choice_blocklist[event_name];
      for (const auto &c : choices)
        dst.insert(c.get<std::string>());
    }
    return t;
  }

  // 正式加载: 解析文件并检查必需的黑名单条目
  static ReferenceTables load(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open())
      throw std::runtime_error("cannot open reference tables: " + path);

    json j;
    try {
      f >> j;
    } catch (const json::exception &e) {
      throw std::runtime_error("reference tables " + path + ": " + e.what());
    }

    ReferenceTables t;
    try {
      t = from_json(j);
    } catch (const json::exception &e) {
      throw std::runtime_error("reference tables " + path + ": " + e.what());
    }

    auto missing = t.missing_required_choices();
    if (!missing.empty()) {
      std::string msg = "reference tables " + path + " lack blocklist entries:";
      for (const auto &m : missing)
        msg += " [" + m + "]";
      throw std::runtime_error(msg);
    }
    return t;
  }

private:
  static const json &require(const json &j, const char *key) {
    if (!j.is_object() || !j.contains(key))
      throw std::runtime_error(std::string("reference tables: missing key '") + key + "'");
    return j.at(key);
  }

  static StringSet read_set(const json &j, const char *key) {
    const auto &arr = require(j, key);
    if (!arr.is_array())
      throw std::runtime_error(std::string("reference tables: '") + key + "' must be an array");
    StringSet out;
    out.reserve(arr.size());
    for (const auto &v : arr)
      out.insert(v.get<std::string>());
    return out;
  }
};

using TablesPtr = std::shared_ptr<const ReferenceTables>;

} // namespace tables
