#pragma once

#include <warden/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace warden::testing {

inline warden::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = warden::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline warden::schema::identity_t make_identity(const uint8_t seed) {
  auto identity = warden::schema::identity_t{};
  identity[0] = seed;
  identity[31] = 0xA5;
  return identity;
}

inline warden::schema::session_id_t make_session_id(const uint8_t seed) {
  auto session_id = warden::schema::session_id_t{};
  for (std::size_t i = 0; i < session_id.size(); ++i) {
    session_id[i] = static_cast<uint8_t>(seed ^ static_cast<uint8_t>(i));
  }
  return session_id;
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

}  // namespace warden::testing
