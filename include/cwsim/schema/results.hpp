#pragma once

#include <cwsim/schema/app_result.hpp>
#include <cwsim/schema/event.hpp>
#include <cwsim/schema/module_error_code.hpp>
#include <cwsim/schema/query_result.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace cwsim::schema {

app_result_t make_error_result(module_error_code code,
                               std::string log,
                               std::string_view codespace);

app_result_t make_success_result(bytes_t data = {},
                                 std::vector<event_t> events = {});

query_result_t make_query_error(module_error_code code,
                                std::string log,
                                std::string_view codespace);

query_result_t make_query_success(bytes_t value);

/// Carry a failed query into an execute result, keeping code and log.
app_result_t to_app_result(const query_result_t& failed);

event_t make_event(std::string type);

}  // namespace cwsim::schema
