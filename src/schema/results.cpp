#include <cwsim/schema/results.hpp>

#include <utility>

namespace cwsim::schema {

app_result_t make_error_result(const module_error_code code,
                               std::string log,
                               const std::string_view codespace) {
  auto result = app_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.codespace = std::string{codespace};
  return result;
}

app_result_t make_success_result(bytes_t data, std::vector<event_t> events) {
  auto result = app_result_t{};
  result.data = std::move(data);
  result.events = std::move(events);
  return result;
}

query_result_t make_query_error(const module_error_code code,
                                std::string log,
                                const std::string_view codespace) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.codespace = std::string{codespace};
  return result;
}

query_result_t make_query_success(bytes_t value) {
  auto result = query_result_t{};
  result.value = std::move(value);
  return result;
}

app_result_t to_app_result(const query_result_t& failed) {
  auto result = app_result_t{};
  result.code = failed.code;
  result.log = failed.log;
  result.info = failed.info;
  result.codespace = failed.codespace;
  return result;
}

event_t make_event(std::string type) {
  auto event = event_t{};
  event.type = std::move(type);
  return event;
}

}  // namespace cwsim::schema
