#include "sink.hpp"
#include "config.hpp"
#include "serializer.hpp"

namespace jsonmodel {

namespace {
std::string wrap(std::string_view open, std::string_view text,
                 std::string_view close) {
  std::string wrapped;
  wrapped.reserve(open.size() + text.size() + close.size());
  wrapped.append(open).append(text).append(close);
  return wrapped;
}
} // namespace

void StringSink::write(std::string_view text) { m_text.append(text); }

void StringSink::newline() { m_text.append(config::newline); }

std::string StringSink::snapshot() const { return m_text; }

void QuoteSink::write(std::string_view text) {
  m_inner.write(wrap(config::quote, text, config::quote));
}

void CurlySink::write(std::string_view text) {
  m_inner.write(wrap(config::object_open, text, config::object_close));
}

void SquareSink::write(std::string_view text) {
  m_inner.write(wrap(config::array_open, text, config::array_close));
}

void CommaSink::write(std::string_view text) {
  if (!m_first) {
    m_inner.write(config::member_separator);
  }
  m_inner.write(text);
  m_first = false;
}

void ColonSink::write_pair(std::string_view key, const Document &value) {
  QuoteSink quoted_key(m_inner);
  quoted_key.write(key);
  m_inner.write(config::name_separator);
  jsonmodel::write(value, m_inner);
}

} // namespace jsonmodel
