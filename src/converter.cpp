#include "converter.hpp"
#include "observability.hpp"

namespace jsonmodel::detail {

void throw_non_text_key() {
  log_if_enabled(LogLevel::Error, "Map keys must be Strings", "Convert",
                 std::chrono::microseconds(0));
  record_if_enabled(
      [](IMetrics &metrics) { return metrics.increment_conversion_errors(); });
  throw invalid_argument("Map keys must be Strings");
}

} // namespace jsonmodel::detail
