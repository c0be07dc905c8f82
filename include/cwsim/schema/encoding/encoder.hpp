#pragma once
#include <cwsim/schema/primitives.hpp>
#include <optional>
#include <span>

namespace cwsim::schema::encoding {

// The wire library is chosen at build time by tag. Store records and
// stargate payloads share the same encoder.
template <typename Library>
struct encoder {
  template <typename T>
  cwsim::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, cwsim::schema::bytes_t& out);

  template <typename T>
  T decode(const cwsim::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const cwsim::schema::bytes_view_t& bytes);
};

}  // namespace cwsim::schema::encoding
