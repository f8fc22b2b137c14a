#pragma once

#include <verity/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace verity::testing {

inline verity::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = verity::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline verity::schema::principal_t make_named_principal(const uint8_t seed) {
  auto named = verity::schema::named_signer_t{};
  named[0] = seed;
  return verity::schema::principal_t{named};
}

inline verity::schema::principal_t make_ed25519_principal(const uint8_t seed) {
  auto signer = verity::schema::ed25519_signer_id{};
  for (std::size_t i = 0; i < signer.public_key.size(); ++i) {
    signer.public_key[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return verity::schema::principal_t{signer};
}

inline std::string make_db_path(const std::string_view prefix) {
  static auto sequence = std::atomic<uint64_t>{0};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(sequence.fetch_add(1)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Removes the directory when destroyed; declare before whatever opens it.
struct scoped_path final {
  explicit scoped_path(std::string value) : path{std::move(value)} {}
  scoped_path(const scoped_path&) = delete;
  scoped_path& operator=(const scoped_path&) = delete;
  ~scoped_path() { remove_path(path); }

  std::string path;
};

}  // namespace verity::testing
