#pragma once
#include <google/protobuf/message_lite.h>
#include <cwsim/common/critical.hpp>
#include <cwsim/schema/encoding/encoder.hpp>
#include <iterator>
#include <string>
#include <type_traits>

namespace cwsim::schema::encoding {

struct protobuf_encoder_tag {};

template <>
struct encoder<protobuf_encoder_tag> final {
  template <typename T>
  cwsim::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, cwsim::schema::bytes_t& out);

  template <typename T>
  T decode(const cwsim::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const cwsim::schema::bytes_view_t& bytes);
};

/// `/package.Message` for a generated protobuf type.
template <typename T>
std::string type_url() {
  return "/" + T::descriptor()->full_name();
}

template <typename T>
cwsim::schema::bytes_t encoder<protobuf_encoder_tag>::encode(const T& obj) {
  static_assert(std::is_base_of_v<google::protobuf::MessageLite, T>);
  auto out = cwsim::schema::bytes_t{};
  out.resize(obj.ByteSizeLong());
  if (!obj.SerializeToArray(out.data(), static_cast<int>(out.size()))) {
    cwsim::common::critical("failed to encode protobuf message");
  }
  return out;
}

template <typename T>
void encoder<protobuf_encoder_tag>::encode(const T& obj,
                                           cwsim::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<protobuf_encoder_tag>::decode(
    const cwsim::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    cwsim::common::critical("failed to decode protobuf bytes");
  }
  return std::move(decoded.value());
}

template <typename T>
std::optional<T> encoder<protobuf_encoder_tag>::try_decode(
    const cwsim::schema::bytes_view_t& bytes) {
  static_assert(std::is_base_of_v<google::protobuf::MessageLite, T>);
  auto message = T{};
  if (!message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
    return std::nullopt;
  }
  return message;
}

}  // namespace cwsim::schema::encoding
