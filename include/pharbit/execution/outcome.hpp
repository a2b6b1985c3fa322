#pragma once

#include <pharbit/schema/error_code.hpp>
#include <pharbit/schema/primitives.hpp>
#include <pharbit/schema/transaction_event_attribute.hpp>
#include <string>
#include <variant>
#include <vector>

namespace pharbit::execution {

/// Resolved caller and logical time a command executes at.
struct command_context final {
  pharbit::schema::identity_t caller{};
  pharbit::schema::timestamp_milliseconds_t now{};
};

/// Typed failure of a command or query. A failing command never mutates
/// state.
struct command_error final {
  pharbit::schema::error_code code{
      pharbit::schema::error_code::invalid_transaction};
  std::string message;

  pharbit::schema::error_kind kind() const {
    return pharbit::schema::kind_of(code);
  }
};

/// State delta summary of one successful command. `data` carries
/// SCALE-encoded generated values (record ids, vote outcome).
struct command_effect final {
  std::string type;
  std::string entity_id;
  std::vector<pharbit::schema::transaction_event_attribute_t> attributes;
  pharbit::schema::bytes_t data;
};

using command_outcome = std::variant<command_effect, command_error>;

template <typename T>
using query_outcome = std::variant<T, command_error>;

inline command_error make_error(pharbit::schema::error_code code,
                                std::string message) {
  return command_error{.code = code, .message = std::move(message)};
}

inline pharbit::schema::transaction_event_attribute_t make_attribute(
    std::string key,
    std::string value,
    bool index = false) {
  auto attribute = pharbit::schema::transaction_event_attribute_t{};
  attribute.key = std::move(key);
  attribute.value = std::move(value);
  attribute.index = index;
  return attribute;
}

}  // namespace pharbit::execution
