#pragma once

#include <cwsim/ledger/querier.hpp>
#include <cwsim/ledger/router.hpp>
#include <cwsim/ledger/types.hpp>
#include <cwsim/schema/app_result.hpp>
#include <cwsim/schema/block_info.hpp>
#include <cwsim/schema/query_result.hpp>
#include <cwsim/schema/stargate.hpp>
#include <string_view>

namespace cwsim::modules {

/// Contract every simulated chain module implements.
///
/// `execute` and `sudo` may write to `store` and call back through `router`;
/// all validation runs before the module's own writes. `query` never
/// mutates. Modules carry configuration only and re-read state per call.
template <typename ExecT, typename QueryT, typename SudoT>
class module {
 public:
  using exec_t = ExecT;
  using query_t = QueryT;
  using sudo_t = SudoT;

  virtual ~module() = default;

  virtual cwsim::schema::app_result_t execute(
      cwsim::ledger::store_t& store,
      cwsim::ledger::router& router,
      const cwsim::schema::block_info_t& block,
      std::string_view sender,
      const ExecT& msg) = 0;

  virtual cwsim::schema::query_result_t query(
      const cwsim::ledger::store_t& store,
      const cwsim::ledger::querier& querier,
      const cwsim::schema::block_info_t& block,
      const QueryT& request) const = 0;

  virtual cwsim::schema::app_result_t sudo(
      cwsim::ledger::store_t& store,
      cwsim::ledger::router& router,
      const cwsim::schema::block_info_t& block,
      const SudoT& msg) = 0;
};

using stargate_module = module<cwsim::schema::stargate_msg_t,
                               cwsim::schema::stargate_query_t,
                               cwsim::schema::empty_t>;

}  // namespace cwsim::modules
