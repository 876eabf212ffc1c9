#pragma once

#include <tranche/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace tranche::testing {

inline tranche::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = tranche::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline tranche::schema::account_id_t make_account(const std::string_view name) {
  return tranche::schema::make_account_id(name);
}

inline tranche::schema::amount_t make_amount(const uint64_t value) {
  return tranche::schema::amount_t{value};
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace tranche::testing
