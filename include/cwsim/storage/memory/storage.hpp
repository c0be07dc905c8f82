#pragma once
#include <spdlog/spdlog.h>
#include <cwsim/storage/storage.hpp>
#include <algorithm>
#include <map>
#include <utility>

namespace cwsim::storage {

struct memory_storage_tag {};

/// Ordered in-memory store owned by one simulated app session.
template <>
struct storage<memory_storage_tag> final {
  using map_t = std::map<cwsim::schema::bytes_t, cwsim::schema::bytes_t>;

  /// Full copy of the store contents, used to roll back a failed call.
  using checkpoint_t = map_t;

  map_t entries;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const cwsim::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const cwsim::schema::bytes_view_t& key,
           const T& value);

  void remove(const cwsim::schema::bytes_view_t& key);
  bool contains(const cwsim::schema::bytes_view_t& key) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const cwsim::schema::bytes_view_t& prefix) const;

  checkpoint_t checkpoint() const;
  void restore(checkpoint_t snapshot);
};

template <typename T, typename Encoder>
std::optional<T> storage<memory_storage_tag>::get(
    Encoder& encoder,
    const cwsim::schema::bytes_view_t& key) const {
  auto it = entries.find(cwsim::schema::make_bytes(key));
  if (it == entries.end()) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(cwsim::schema::bytes_view_t{it->second})};
}

template <typename T, typename Encoder>
void storage<memory_storage_tag>::put(Encoder& encoder,
                                      const cwsim::schema::bytes_view_t& key,
                                      const T& value) {
  entries.insert_or_assign(cwsim::schema::make_bytes(key),
                           encoder.encode(value));
}

inline void storage<memory_storage_tag>::remove(
    const cwsim::schema::bytes_view_t& key) {
  entries.erase(cwsim::schema::make_bytes(key));
}

inline bool storage<memory_storage_tag>::contains(
    const cwsim::schema::bytes_view_t& key) const {
  return entries.contains(cwsim::schema::make_bytes(key));
}

inline std::vector<key_value_entry_t>
storage<memory_storage_tag>::list_by_prefix(
    const cwsim::schema::bytes_view_t& prefix) const {
  auto out = std::vector<key_value_entry_t>{};
  auto start = cwsim::schema::make_bytes(prefix);
  for (auto it = entries.lower_bound(start); it != entries.end(); ++it) {
    const auto& key = it->first;
    if (key.size() < prefix.size() ||
        !std::equal(prefix.begin(), prefix.end(), key.begin())) {
      break;
    }
    out.emplace_back(key, it->second);
  }
  return out;
}

inline storage<memory_storage_tag>::checkpoint_t
storage<memory_storage_tag>::checkpoint() const {
  return entries;
}

inline void storage<memory_storage_tag>::restore(checkpoint_t snapshot) {
  spdlog::debug("Restoring store checkpoint ({} -> {} entries)",
                entries.size(), snapshot.size());
  entries = std::move(snapshot);
}

}  // namespace cwsim::storage
