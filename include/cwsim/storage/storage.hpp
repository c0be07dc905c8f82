#pragma once
#include <cwsim/schema/primitives.hpp>
#include <optional>
#include <vector>

namespace cwsim::storage {

using key_value_entry_t =
    std::pair<cwsim::schema::bytes_t, cwsim::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const cwsim::schema::bytes_view_t& key) const;

  /// Encode and store value at key, replacing any previous value.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const cwsim::schema::bytes_view_t& key,
           const T& value);

  /// Delete the value at key. Missing keys are ignored.
  void remove(const cwsim::schema::bytes_view_t& key);

  bool contains(const cwsim::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix, in
  /// ascending key order.
  std::vector<key_value_entry_t> list_by_prefix(
      const cwsim::schema::bytes_view_t& prefix) const;
};

}  // namespace cwsim::storage
