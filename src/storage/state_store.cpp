#include "storage/state_store.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include "core/json_utils.h"
#include "core/log.h"

namespace pm_sentinel {

namespace {

bool SetError(std::string* out_error, const std::string& message) {
  if (out_error != nullptr) {
    *out_error = message;
  }
  return false;
}

std::string ErrnoText() {
  return std::string(std::strerror(errno));
}

JsonValue MakeJsonInt(std::int64_t value) {
  return MakeJsonNumber(static_cast<double>(value));
}

/// 对象字段读取为 int64；字段缺失时保留默认值，类型不符返回 `false`。
bool ReadInt64(const JsonValue& object, const std::string& key, std::int64_t* out) {
  const JsonValue* node = JsonObjectField(&object, key);
  if (node == nullptr || node->type == JsonType::kNull) {
    return true;
  }
  const auto value = JsonAsInt64(node);
  if (!value.has_value()) {
    return false;
  }
  *out = *value;
  return true;
}

/// 读取对象类型子节点；缺失返回空指针，类型不符时置 `*ok = false`。
const JsonValue* ObjectChild(const JsonValue& parent, const std::string& key, bool* ok) {
  const JsonValue* node = JsonObjectField(&parent, key);
  if (node == nullptr || node->type == JsonType::kNull) {
    return nullptr;
  }
  if (node->type != JsonType::kObject) {
    *ok = false;
    return nullptr;
  }
  return node;
}

bool ParseSnapshot(const JsonValue& node, Snapshot* out, std::string* out_error) {
  if (!ReadInt64(node, "saved_at_ms", &out->saved_at_ms)) {
    return SetError(out_error, "snapshot.saved_at_ms 非法");
  }
  bool ok = true;
  if (const JsonValue* markets = ObjectChild(node, "markets", &ok); markets != nullptr) {
    for (const auto& [key, entry] : markets->object_value) {
      const auto price = JsonAsNumber(JsonObjectField(&entry, "price"));
      SnapshotMarketEntry market_entry;
      if (!price.has_value() || *price < 0.0 || *price > 1.0 ||
          !ReadInt64(entry, "fetched_at_ms", &market_entry.fetched_at_ms)) {
        return SetError(out_error, "snapshot.markets 条目非法: " + key);
      }
      market_entry.price = *price;
      out->markets.emplace(key, market_entry);
    }
  }
  if (const JsonValue* pairs = ObjectChild(node, "pairs", &ok); pairs != nullptr) {
    for (const auto& [key, entry] : pairs->object_value) {
      std::int64_t gap_bps = 0;
      SnapshotPairEntry pair_entry;
      if (!ReadInt64(entry, "gap_bps", &gap_bps) ||
          !ReadInt64(entry, "seen_at_ms", &pair_entry.seen_at_ms)) {
        return SetError(out_error, "snapshot.pairs 条目非法: " + key);
      }
      pair_entry.gap_bps = static_cast<int>(gap_bps);
      out->pairs.emplace(key, pair_entry);
    }
  }
  if (!ok) {
    return SetError(out_error, "snapshot 结构非法");
  }
  return true;
}

bool ParseAlerts(const JsonValue& node, AlertHistory* out, std::string* out_error) {
  for (const auto& [key, entry] : node.object_value) {
    AlertRecord record;
    record.signal_key = key;
    if (entry.type != JsonType::kObject ||
        !ReadInt64(entry, "last_fired_at_ms", &record.last_fired_at_ms)) {
      return SetError(out_error, "alerts 条目非法: " + key);
    }
    const JsonValue* value = JsonObjectField(&entry, "last_value");
    if (value != nullptr && value->type != JsonType::kNull) {
      const auto parsed = JsonAsInt64(value);
      if (!parsed.has_value()) {
        return SetError(out_error, "alerts.last_value 非法: " + key);
      }
      record.last_value = static_cast<int>(*parsed);
    }
    out->emplace(key, std::move(record));
  }
  return true;
}

bool ParseSeenItems(const JsonValue& node,
                    std::vector<SeenItem>* out,
                    std::string* out_error) {
  for (const auto& entry : node.array_value) {
    SeenItem item;
    const auto item_id = JsonAsString(JsonObjectField(&entry, "item_id"));
    if (entry.type != JsonType::kObject || !item_id.has_value() || item_id->empty() ||
        !ReadInt64(entry, "seen_at_ms", &item.seen_at_ms)) {
      return SetError(out_error, "seen_items 条目非法");
    }
    item.item_id = *item_id;
    out->push_back(std::move(item));
  }
  return true;
}

/// 写入并 fsync 整个文件；任一步失败返回 `false`。
bool WriteFileDurably(const std::string& path,
                      const std::string& content,
                      std::string* out_error) {
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (fd < 0) {
    return SetError(out_error, "打开临时文件失败: " + path + " " + ErrnoText());
  }
  std::size_t written = 0;
  while (written < content.size()) {
    const ssize_t n = ::write(fd, content.data() + written, content.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      const std::string detail = ErrnoText();
      ::close(fd);
      return SetError(out_error, "写入临时文件失败: " + detail);
    }
    written += static_cast<std::size_t>(n);
  }
  if (::fsync(fd) != 0) {
    const std::string detail = ErrnoText();
    ::close(fd);
    return SetError(out_error, "fsync 临时文件失败: " + detail);
  }
  if (::close(fd) != 0) {
    return SetError(out_error, "关闭临时文件失败: " + ErrnoText());
  }
  return true;
}

bool SyncDirectory(const std::filesystem::path& directory, std::string* out_error) {
  const std::string dir = directory.empty() ? std::string(".") : directory.string();
  const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0) {
    return SetError(out_error, "打开状态目录失败: " + dir + " " + ErrnoText());
  }
  const bool synced = ::fsync(fd) == 0;
  const std::string detail = synced ? std::string() : ErrnoText();
  ::close(fd);
  if (!synced) {
    return SetError(out_error, "fsync 状态目录失败: " + detail);
  }
  return true;
}

/// 清理残留的临时文件；unlink 不删除目录，同名目录等异常占位保持原样。
void RemovePartialFile(const std::string& path) {
  if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
    LogError("STATE_TMP_CLEANUP_FAILED: " + path + " " + ErrnoText());
  }
}

}  // namespace

std::string SerializeState(const PersistedState& state) {
  JsonValue markets = MakeJsonObject();
  for (const auto& [key, entry] : state.snapshot.markets) {
    JsonValue item = MakeJsonObject();
    item.object_value["price"] = MakeJsonNumber(entry.price);
    item.object_value["fetched_at_ms"] = MakeJsonInt(entry.fetched_at_ms);
    markets.object_value[key] = std::move(item);
  }
  JsonValue pairs = MakeJsonObject();
  for (const auto& [key, entry] : state.snapshot.pairs) {
    JsonValue item = MakeJsonObject();
    item.object_value["gap_bps"] = MakeJsonInt(entry.gap_bps);
    item.object_value["seen_at_ms"] = MakeJsonInt(entry.seen_at_ms);
    pairs.object_value[key] = std::move(item);
  }
  JsonValue snapshot = MakeJsonObject();
  snapshot.object_value["saved_at_ms"] = MakeJsonInt(state.snapshot.saved_at_ms);
  snapshot.object_value["markets"] = std::move(markets);
  snapshot.object_value["pairs"] = std::move(pairs);

  JsonValue alerts = MakeJsonObject();
  for (const auto& [key, record] : state.alerts) {
    JsonValue item = MakeJsonObject();
    item.object_value["last_fired_at_ms"] = MakeJsonInt(record.last_fired_at_ms);
    item.object_value["last_value"] = record.last_value.has_value()
                                          ? MakeJsonInt(*record.last_value)
                                          : MakeJsonNull();
    alerts.object_value[key] = std::move(item);
  }

  JsonValue seen_items = MakeJsonArray();
  for (const auto& seen : state.seen_items) {
    JsonValue item = MakeJsonObject();
    item.object_value["item_id"] = MakeJsonString(seen.item_id);
    item.object_value["seen_at_ms"] = MakeJsonInt(seen.seen_at_ms);
    seen_items.array_value.push_back(std::move(item));
  }

  JsonValue root = MakeJsonObject();
  root.object_value["schema_version"] = MakeJsonInt(kStateSchemaVersion);
  root.object_value["run_count"] = MakeJsonInt(state.run_count);
  root.object_value["snapshot"] = std::move(snapshot);
  root.object_value["alerts"] = std::move(alerts);
  root.object_value["seen_items"] = std::move(seen_items);
  return SerializeJson(root, 2) + "\n";
}

bool ParseState(const std::string& text,
                PersistedState* out_state,
                std::string* out_error) {
  if (out_state == nullptr) {
    return SetError(out_error, "out_state 为空");
  }
  JsonValue root;
  std::string parse_error;
  if (!ParseJson(text, &root, &parse_error)) {
    return SetError(out_error, "状态文件 JSON 解析失败: " + parse_error);
  }
  if (root.type != JsonType::kObject) {
    return SetError(out_error, "状态文件根节点不是对象");
  }

  PersistedState state;
  std::int64_t schema_version = 0;
  if (!ReadInt64(root, "schema_version", &schema_version)) {
    return SetError(out_error, "schema_version 非法");
  }
  if (schema_version > kStateSchemaVersion) {
    LogInfo("STATE_SCHEMA_NEWER: file=" + std::to_string(schema_version) +
            " supported=" + std::to_string(kStateSchemaVersion));
  }
  if (!ReadInt64(root, "run_count", &state.run_count)) {
    return SetError(out_error, "run_count 非法");
  }

  bool ok = true;
  if (const JsonValue* snapshot = ObjectChild(root, "snapshot", &ok); snapshot != nullptr) {
    if (!ParseSnapshot(*snapshot, &state.snapshot, out_error)) {
      return false;
    }
  }
  if (const JsonValue* alerts = ObjectChild(root, "alerts", &ok); alerts != nullptr) {
    if (!ParseAlerts(*alerts, &state.alerts, out_error)) {
      return false;
    }
  }
  if (!ok) {
    return SetError(out_error, "snapshot/alerts 字段类型非法");
  }
  const JsonValue* seen = JsonObjectField(&root, "seen_items");
  if (seen != nullptr && seen->type != JsonType::kNull) {
    if (seen->type != JsonType::kArray) {
      return SetError(out_error, "seen_items 字段类型非法");
    }
    if (!ParseSeenItems(*seen, &state.seen_items, out_error)) {
      return false;
    }
  }

  *out_state = std::move(state);
  return true;
}

bool StateStore::Load(PersistedState* out_state, std::string* out_error) const {
  if (out_state == nullptr) {
    return SetError(out_error, "out_state 为空");
  }
  std::error_code ec;
  const std::filesystem::path path(file_path_);
  if (!std::filesystem::exists(path, ec)) {
    if (ec) {
      return SetError(out_error, "检查状态文件失败: " + ec.message());
    }
    // 首次运行：无历史不是错误。
    *out_state = PersistedState{};
    return true;
  }

  std::ifstream in(file_path_, std::ios::binary);
  if (!in.is_open()) {
    return SetError(out_error, "状态文件无法打开: " + file_path_);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return SetError(out_error, "状态文件读取失败: " + file_path_);
  }
  return ParseState(buffer.str(), out_state, out_error);
}

bool StateStore::Commit(const PersistedState& state, std::string* out_error) const {
  const std::filesystem::path path(file_path_);
  const auto parent = path.parent_path();
  std::error_code ec;
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return SetError(out_error, "创建状态目录失败: " + ec.message());
    }
  }

  const std::string tmp_path = file_path_ + ".tmp";
  if (!WriteFileDurably(tmp_path, SerializeState(state), out_error)) {
    RemovePartialFile(tmp_path);
    return false;
  }
  if (::rename(tmp_path.c_str(), file_path_.c_str()) != 0) {
    const std::string detail = ErrnoText();
    RemovePartialFile(tmp_path);
    return SetError(out_error, "状态文件替换失败: " + detail);
  }
  // 替换已生效；目录 fsync 失败只影响掉电持久性，不回报提交失败。
  std::string sync_error;
  if (!SyncDirectory(parent, &sync_error)) {
    LogError("STATE_DIR_SYNC_FAILED: " + sync_error);
  }
  return true;
}

}  // namespace pm_sentinel
