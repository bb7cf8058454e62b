#pragma once

#include <cstdint>
#include <fstream>
#include <functional>
#include <string>

namespace neurosync {

/**
 * ByteStream is the minimal byte source/sink the transfer code works on.
 * read() returns 0 at end of stream.
 */
class ByteStream {
public:
  virtual ~ByteStream() = default;

  virtual size_t read(char *buffer, size_t length) = 0;
  virtual void write(const char *data, size_t length) = 0;
  virtual int64_t position() const = 0;
  virtual int64_t size() const = 0;
  virtual void seek(int64_t offset) = 0;
  virtual void flush() = 0;
  virtual std::string name() const = 0;
};

/**
 * FileStream is a ByteStream over a local file opened for reading or for
 * writing (truncating). Open and I/O failures throw std::runtime_error.
 */
class FileStream : public ByteStream {
public:
  enum class Mode { Read, Write };

  FileStream(const std::string &path, Mode mode);
  ~FileStream() override;

  size_t read(char *buffer, size_t length) override;
  void write(const char *data, size_t length) override;
  int64_t position() const override;
  int64_t size() const override;
  void seek(int64_t offset) override;
  void flush() override;
  std::string name() const override;

  void close();

private:
  std::string m_path;
  Mode m_mode;
  mutable std::fstream m_file;
  int64_t m_position = 0;
  int64_t m_size = 0;
};

/**
 * ProgressStream decorates another ByteStream. After every read or write,
 * successful or not, the callback receives the wrapped stream's position.
 * Everything else is forwarded untouched.
 */
class ProgressStream : public ByteStream {
public:
  using Callback = std::function<void(int64_t position)>;

  ProgressStream(ByteStream &inner, Callback callback);

  size_t read(char *buffer, size_t length) override;
  void write(const char *data, size_t length) override;
  int64_t position() const override;
  int64_t size() const override;
  void seek(int64_t offset) override;
  void flush() override;
  std::string name() const override;

private:
  ByteStream &m_inner;
  Callback m_callback;

  void notify();
};

} // namespace neurosync
