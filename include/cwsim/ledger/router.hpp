#pragma once

#include <cwsim/ledger/messages.hpp>
#include <cwsim/ledger/querier.hpp>
#include <cwsim/ledger/types.hpp>
#include <cwsim/schema/app_result.hpp>
#include <cwsim/schema/block_info.hpp>
#include <memory>
#include <string_view>

namespace cwsim::ledger {

/// Callback surface modules use to reach sibling modules (chiefly the bank)
/// while handling a call.
class router {
 public:
  virtual ~router() = default;

  virtual cwsim::schema::app_result_t execute(
      store_t& store,
      const cwsim::schema::block_info_t& block,
      std::string_view sender,
      const cosmos_msg_t& msg) = 0;

  virtual cwsim::schema::app_result_t sudo(
      store_t& store,
      const cwsim::schema::block_info_t& block,
      const sudo_msg_t& msg) = 0;

  /// Querier bound to `store`. The store must outlive the querier.
  virtual std::unique_ptr<querier> make_querier(const store_t& store) const = 0;
};

}  // namespace cwsim::ledger
