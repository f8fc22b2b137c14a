#pragma once
#include <verity/common/critical.hpp>
#include <verity/schema/encoding/encoder.hpp>
#include <verity/schema/encoding/scale/app_info.hpp>
#include <verity/schema/encoding/scale/audit_event_record.hpp>
#include <verity/schema/encoding/scale/block_result.hpp>
#include <verity/schema/encoding/scale/commit_result.hpp>
#include <verity/schema/encoding/scale/credential_record.hpp>
#include <verity/schema/encoding/scale/credential_status.hpp>
#include <verity/schema/encoding/scale/genesis.hpp>
#include <verity/schema/encoding/scale/history_entry.hpp>
#include <verity/schema/encoding/scale/identity_record.hpp>
#include <verity/schema/encoding/scale/primitives.hpp>
#include <verity/schema/encoding/scale/query_result.hpp>
#include <verity/schema/encoding/scale/replay_result.hpp>
#include <verity/schema/encoding/scale/transaction.hpp>
#include <verity/schema/encoding/scale/transaction_event.hpp>
#include <verity/schema/encoding/scale/transaction_result.hpp>
#include <verity/schema/encoding/scale/verifier_grant.hpp>
#include <exception>
#include <iterator>
#include <utility>
#include <scale/scale.hpp>

namespace verity::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  verity::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, verity::schema::bytes_t& out);

  template <typename T>
  T decode(const verity::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const verity::schema::bytes_view_t& bytes);
};

template <typename T>
verity::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    verity::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        verity::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const verity::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    verity::common::critical("failed to decode SCALE bytes");
  }
  return std::move(*decoded);
}

// Untrusted input (transactions, query keys, backups) goes through here, so a
// malformed buffer must surface as nullopt whether the codec reports it by
// result or by throwing.
template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const verity::schema::bytes_view_t& bytes) {
  try {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return std::move(decoded.value());
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

}  // namespace verity::schema::encoding
