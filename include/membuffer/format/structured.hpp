#pragma once

#include "membuffer/format/error.hpp"
#include "membuffer/format/reader.hpp"
#include "membuffer/format/writer.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace membuffer::format {

/**
 * @brief 结构化字段：值经 nlohmann::json 序列化为 JSON 文本，以 Text 类型写入。
 *
 * T 需要能被 nlohmann::json 转换（内置容器/标量，或提供 to_json/from_json，
 * 例如 NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE）。
 *
 * 序列化失败（例如字符串含非法 UTF-8）返回 errc::structured_encode，Writer 不变。
 */
template <class T>
std::error_code add_structured_entry(Writer& writer, std::int32_t key, const T& value) {
  std::string text;
  try {
    text = nlohmann::json(value).dump();
  } catch (const nlohmann::json::exception&) {
    return make_error_code(errc::structured_encode);
  }
  return writer.add_entry(key, text);
}

/**
 * @brief 读取结构化字段：先按 Text 读取，再由 nlohmann::json 解析为 T。
 *
 * 查找/类型错误与 load_entry<std::string_view> 一致（requested_type 为 text）；
 * JSON 语法错误或结构与 T 不匹配返回 errc::structured_decode。
 */
template <class T>
[[nodiscard]] LoadResult<T> load_structured_entry(const Reader& reader, std::int32_t key) {
  LoadResult<T> result;
  const auto text = reader.load_entry<std::string_view>(key);
  result.requested_type = text.requested_type;
  result.actual_type = text.actual_type;
  if (text.ec) {
    result.ec = text.ec;
    return result;
  }

  const auto json = nlohmann::json::parse(text.value, nullptr, false);
  if (json.is_discarded()) {
    result.ec = make_error_code(errc::structured_decode);
    return result;
  }
  try {
    result.value = json.template get<T>();
  } catch (const nlohmann::json::exception&) {
    result.ec = make_error_code(errc::structured_decode);
  }
  return result;
}

}  // namespace membuffer::format
