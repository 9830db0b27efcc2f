#pragma once

#include <string>
#include <utility>

#include "core/types.h"

namespace pm_sentinel {

/// 持久化文档格式版本；读取时忽略未知字段。
inline constexpr int kStateSchemaVersion = 1;

/// 将完整状态序列化为 JSON 文本（键有序，结果逐字节稳定）。
std::string SerializeState(const PersistedState& state);

/**
 * @brief 解析持久化 JSON 文本
 *
 * 未知字段忽略；已知字段类型不符时返回 `false`。
 */
bool ParseState(const std::string& text,
                PersistedState* out_state,
                std::string* out_error);

/**
 * @brief 状态存储（单文件 JSON，原子替换）
 *
 * 语义：
 * 1. 文件不存在视为首次运行，返回空状态；
 * 2. 提交时先写 `<path>.tmp` 并 fsync，再 `rename()` 覆盖目标并 fsync 目录；
 * 3. 提交失败时原文件保持逐字节不变。
 */
class StateStore {
 public:
  explicit StateStore(std::string file_path) : file_path_(std::move(file_path)) {}

  /// 读取上一轮提交的状态。文件存在但不可读或格式损坏时返回 `false`。
  bool Load(PersistedState* out_state, std::string* out_error) const;

  /// 原子提交完整状态。
  bool Commit(const PersistedState& state, std::string* out_error) const;

  const std::string& file_path() const { return file_path_; }

 private:
  std::string file_path_;  ///< 状态文件路径。
};

}  // namespace pm_sentinel
