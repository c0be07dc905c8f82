#pragma once

#include <cwsim/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Generic envelopes routed by type url (messages) or gRPC path (queries).
namespace cwsim::schema {

template <uint16_t Version>
struct stargate_msg;

template <>
struct stargate_msg<1> final {
  uint16_t version{1};
  std::string type_url;
  bytes_t value;
};

using stargate_msg_t = stargate_msg<1>;

template <uint16_t Version>
struct stargate_query;

template <>
struct stargate_query<1> final {
  uint16_t version{1};
  std::string path;
  bytes_t data;
};

using stargate_query_t = stargate_query<1>;

/// Placeholder message for module slots that accept no payload.
struct empty final {};

using empty_t = empty;

}  // namespace cwsim::schema
