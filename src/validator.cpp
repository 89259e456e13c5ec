#include "validator.hpp"
#include "observability.hpp"
#include "traversal.hpp"
#include <chrono>
#include <string>
#include <unordered_set>

namespace jsonmodel {

namespace {
constexpr std::string_view unique_keys_rule = "unique_keys";
constexpr std::string_view homogeneous_arrays_rule = "homogeneous_arrays";

void report_violation(std::string_view rule, std::string_view message,
                      std::string_view key) {
  log_if_enabled(LogLevel::Debug, message, "Validate",
                 std::chrono::microseconds(0), key);
  record_if_enabled([rule](IMetrics &metrics) {
    return metrics.increment_validation_failures(rule);
  });
}

// Checks the node's own member list only; descendants get their own call.
bool has_unique_keys(const Object &object) {
  bool is_valid = true;
  std::unordered_set<std::string_view> keys;
  for (const auto &entry : object.entries()) {
    if (!keys.insert(entry.first).second) {
      is_valid = false;
      report_violation(unique_keys_rule, "Duplicate object key.", entry.first);
    }
  }
  return is_valid;
}

bool is_homogeneous(const Array &array) {
  if (array.empty()) {
    return true;
  }
  const Type first_type = array.values().front().type();
  for (const auto &element : array.values()) {
    if (element.type() != first_type) {
      report_violation(homogeneous_arrays_rule,
                       "Array mixes " + std::string(to_string(first_type)) +
                           " with " + std::string(to_string(element.type())) +
                           ".",
                       "");
      return false;
    }
  }
  return true;
}
} // namespace

bool validate_objects(const Document &document) {
  bool is_valid = true;
  accept(document, [&is_valid](const Document &node) {
    if (const Object *object = node.get_if<Object>()) {
      is_valid = has_unique_keys(*object) && is_valid;
    }
  });
  return is_valid;
}

bool validate_arrays(const Document &document) {
  bool is_valid = true;
  accept(document, [&is_valid](const Document &node) {
    if (const Array *array = node.get_if<Array>()) {
      is_valid = is_homogeneous(*array) && is_valid;
    }
  });
  return is_valid;
}

bool validate(const Document &document) {
  auto start = std::chrono::steady_clock::now();

  bool is_valid = true;
  accept(document, [&is_valid](const Document &node) {
    if (const Object *object = node.get_if<Object>()) {
      is_valid = has_unique_keys(*object) && is_valid;
    } else if (const Array *array = node.get_if<Array>()) {
      is_valid = is_homogeneous(*array) && is_valid;
    }
  });

  auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start);
  log_if_enabled(LogLevel::Debug,
                 is_valid ? "Document is valid." : "Document is invalid.",
                 "Validate", elapsed);
  record_if_enabled([&](IMetrics &metrics) {
    return metrics.record_latency(
               "Validate", std::chrono::duration<double>(elapsed).count()) &&
           metrics.increment_operation_count("Validate",
                                             is_valid ? "valid" : "invalid");
  });
  return is_valid;
}

} // namespace jsonmodel
