#include "serializer.hpp"
#include "config.hpp"
#include "observability.hpp"
#include "utils/escape.hpp"
#include "utils/overloaded.hpp"
#include <chrono>

namespace jsonmodel {

namespace {

void write_array(const Array &array, ISink &sink) {
  StringSink inner;
  CommaSink elements(inner);
  for (const auto &element : array.values()) {
    write(element, elements);
  }
  SquareSink square(sink);
  square.write(inner.snapshot());
}

void write_object(const Object &object, ISink &sink) {
  StringSink inner;
  CommaSink members(inner);
  for (const auto &entry : object.entries()) {
    StringSink member;
    ColonSink colon(member);
    colon.write_pair(entry.first, entry.second);
    members.write(member.snapshot());
  }
  CurlySink curly(sink);
  curly.write(inner.snapshot());
}

} // namespace

void write(const Document &document, ISink &sink) {
  document.visit(utils::overloaded{
      [&sink](const Null &) { sink.write(config::null_literal); },
      [&sink](const Boolean &value) {
        sink.write(value.value() ? config::true_literal
                                 : config::false_literal);
      },
      [&sink](const Number &value) { sink.write(value.to_string()); },
      [&sink](const String &value) {
        QuoteSink quoted(sink);
        quoted.write(utils::escape_quotes(value.value()));
      },
      [&sink](const Array &value) { write_array(value, sink); },
      [&sink](const Object &value) { write_object(value, sink); },
  });
}

std::string stringify(const Document &document, ISink &sink) {
  auto start = std::chrono::steady_clock::now();

  write(document, sink);
  std::string text = sink.snapshot();

  auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start);
  log_if_enabled(LogLevel::Debug, "Document serialized.", "Stringify", elapsed);
  record_if_enabled([&](IMetrics &metrics) {
    return metrics.record_latency(
               "Stringify", std::chrono::duration<double>(elapsed).count()) &&
           metrics.record_bytes_serialized(text.size()) &&
           metrics.increment_operation_count("Stringify", "ok");
  });
  return text;
}

std::string stringify(const Document &document) {
  StringSink sink;
  return stringify(document, sink);
}

} // namespace jsonmodel
