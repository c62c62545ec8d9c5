#pragma once

#include "Headers.hpp"
#include "nlohmann/json.hpp"

/**
 * @brief Lightweight wrapper that exposes `nlohmann::json` as `json`.
 */
using json = nlohmann::json;

namespace st {
/**
 * @brief Byte payloads travel as arrays of integers, never as strings.
 */
inline json bytesToJson(const string& bytes) {
  json array = json::array();
  for (unsigned char c : bytes) {
    array.push_back(int(c));
  }
  return array;
}

inline string jsonToBytes(const json& value) {
  if (!value.is_array()) {
    throw runtime_error("Expected a byte array, got " +
                        string(value.type_name()));
  }
  string bytes;
  bytes.reserve(value.size());
  for (const auto& element : value) {
    if (!element.is_number_integer() || element.get<int64_t>() < 0 ||
        element.get<int64_t>() > 255) {
      throw runtime_error("Invalid byte in array: " + element.dump());
    }
    bytes.push_back(char(element.get<int64_t>()));
  }
  return bytes;
}
}  // namespace st
