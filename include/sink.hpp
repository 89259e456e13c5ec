#ifndef JSONMODEL_SINK_HPP
#define JSONMODEL_SINK_HPP

#include <string>
#include <string_view>

namespace jsonmodel {

class Document;

// Incremental text output. Wrapper sinks below hold a reference to the sink
// they decorate, intercept write() and forward newline() / snapshot().
// Sinks carry per-call state and are not meant to be shared across threads.
class ISink {
public:
  virtual ~ISink() = default;
  virtual void write(std::string_view text) = 0;
  virtual void newline() = 0;
  virtual std::string snapshot() const = 0;
};

class StringSink : public ISink {
public:
  void write(std::string_view text) override;
  void newline() override;
  std::string snapshot() const override;

private:
  std::string m_text;
};

class QuoteSink : public ISink {
public:
  explicit QuoteSink(ISink &inner) : m_inner(inner) {}
  void write(std::string_view text) override;
  void newline() override { m_inner.newline(); }
  std::string snapshot() const override { return m_inner.snapshot(); }

private:
  ISink &m_inner;
};

class CurlySink : public ISink {
public:
  explicit CurlySink(ISink &inner) : m_inner(inner) {}
  void write(std::string_view text) override;
  void newline() override { m_inner.newline(); }
  std::string snapshot() const override { return m_inner.snapshot(); }

private:
  ISink &m_inner;
};

class SquareSink : public ISink {
public:
  explicit SquareSink(ISink &inner) : m_inner(inner) {}
  void write(std::string_view text) override;
  void newline() override { m_inner.newline(); }
  std::string snapshot() const override { return m_inner.snapshot(); }

private:
  ISink &m_inner;
};

// Emits a separator before every write except the first. One instance
// covers exactly one member list.
class CommaSink : public ISink {
public:
  explicit CommaSink(ISink &inner) : m_inner(inner) {}
  void write(std::string_view text) override;
  void newline() override { m_inner.newline(); }
  std::string snapshot() const override { return m_inner.snapshot(); }

private:
  ISink &m_inner;
  bool m_first = true;
};

// Writes object members as "key":value. Plain writes pass through.
class ColonSink : public ISink {
public:
  explicit ColonSink(ISink &inner) : m_inner(inner) {}
  void write_pair(std::string_view key, const Document &value);
  void write(std::string_view text) override { m_inner.write(text); }
  void newline() override { m_inner.newline(); }
  std::string snapshot() const override { return m_inner.snapshot(); }

private:
  ISink &m_inner;
};

} // namespace jsonmodel

#endif // JSONMODEL_SINK_HPP
