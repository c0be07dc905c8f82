#pragma once

#include <cwsim/schema/encoding/protobuf/encoder.hpp>
#include <cwsim/storage/memory/storage.hpp>

namespace cwsim::ledger {

using store_t = cwsim::storage::storage<cwsim::storage::memory_storage_tag>;
using encoder_t = cwsim::schema::encoding::encoder<
    cwsim::schema::encoding::protobuf_encoder_tag>;

}  // namespace cwsim::ledger
