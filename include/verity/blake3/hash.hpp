#pragma once
#include <verity/schema/primitives.hpp>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

namespace verity::blake3 {

verity::schema::hash32_t hash(const std::string_view& str);
verity::schema::hash32_t hash(const verity::schema::bytes_view_t& bytes);

/// Incremental hasher over several byte ranges.
class hasher final {
 public:
  hasher();
  ~hasher();
  hasher(hasher&&) noexcept;
  hasher& operator=(hasher&&) noexcept;

  hasher& update(const verity::schema::bytes_view_t& bytes);
  hasher& update(const std::string_view& str);
  verity::schema::hash32_t finalize() const;

 private:
  struct state;
  std::unique_ptr<state> state_;
};

}  // namespace verity::blake3
