#include "ByteStream.hpp"
#include <filesystem>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace neurosync {

FileStream::FileStream(const std::string &path, Mode mode)
    : m_path(path), m_mode(mode) {
  if (m_mode == Mode::Read) {
    m_file.open(path, std::ios::in | std::ios::binary);
    if (!m_file.is_open())
      throw std::runtime_error("unable to open for reading: " + path);
    std::error_code ec;
    auto sz = fs::file_size(path, ec);
    m_size = ec ? 0 : static_cast<int64_t>(sz);
  } else {
    m_file.open(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!m_file.is_open())
      throw std::runtime_error("unable to open for writing: " + path);
  }
}

FileStream::~FileStream() { close(); }

void FileStream::close() {
  if (m_file.is_open())
    m_file.close();
}

size_t FileStream::read(char *buffer, size_t length) {
  if (m_mode != Mode::Read)
    throw std::runtime_error("stream not readable: " + m_path);
  m_file.read(buffer, static_cast<std::streamsize>(length));
  auto got = static_cast<size_t>(m_file.gcount());
  if (m_file.bad())
    throw std::runtime_error("read error: " + m_path);
  m_position += static_cast<int64_t>(got);
  return got;
}

void FileStream::write(const char *data, size_t length) {
  if (m_mode != Mode::Write)
    throw std::runtime_error("stream not writable: " + m_path);
  m_file.write(data, static_cast<std::streamsize>(length));
  if (!m_file)
    throw std::runtime_error("write error: " + m_path);
  m_position += static_cast<int64_t>(length);
  if (m_position > m_size)
    m_size = m_position;
}

int64_t FileStream::position() const { return m_position; }

int64_t FileStream::size() const { return m_size; }

void FileStream::seek(int64_t offset) {
  m_file.clear();
  if (m_mode == Mode::Read)
    m_file.seekg(offset);
  else
    m_file.seekp(offset);
  if (!m_file)
    throw std::runtime_error("seek error: " + m_path);
  m_position = offset;
}

void FileStream::flush() {
  if (m_mode == Mode::Write) {
    m_file.flush();
    if (!m_file)
      throw std::runtime_error("flush error: " + m_path);
  }
}

std::string FileStream::name() const { return m_path; }

ProgressStream::ProgressStream(ByteStream &inner, Callback callback)
    : m_inner(inner), m_callback(std::move(callback)) {}

void ProgressStream::notify() {
  if (m_callback)
    m_callback(m_inner.position());
}

size_t ProgressStream::read(char *buffer, size_t length) {
  size_t got = 0;
  try {
    got = m_inner.read(buffer, length);
  } catch (...) {
    notify();
    throw;
  }
  notify();
  return got;
}

void ProgressStream::write(const char *data, size_t length) {
  try {
    m_inner.write(data, length);
  } catch (...) {
    notify();
    throw;
  }
  notify();
}

int64_t ProgressStream::position() const { return m_inner.position(); }

int64_t ProgressStream::size() const { return m_inner.size(); }

void ProgressStream::seek(int64_t offset) { m_inner.seek(offset); }

void ProgressStream::flush() { m_inner.flush(); }

std::string ProgressStream::name() const { return m_inner.name(); }

} // namespace neurosync
