#pragma once
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>

namespace neurosync {

/**
 * ProgressSink receives per-file progress from the executors.
 * update() positions never decrease between start() and finish().
 */
class ProgressSink {
public:
  virtual ~ProgressSink() = default;
  virtual void start(const std::string &label, int64_t total) = 0;
  virtual void update(int64_t position) = 0;
  virtual void finish(bool ok) = 0;
};

// Single-line terminal progress bar, redrawn in place with '\r'.
class ConsoleProgress : public ProgressSink {
public:
  explicit ConsoleProgress(std::ostream &out = std::cout, int width = 30);

  void start(const std::string &label, int64_t total) override;
  void update(int64_t position) override;
  void finish(bool ok) override;

private:
  std::ostream &m_out;
  int m_width;
  std::string m_label;
  int64_t m_total = 0;
  int64_t m_position = 0;
  std::chrono::steady_clock::time_point m_lastDraw;

  void draw();
};

std::string formatBytes(int64_t bytes);

} // namespace neurosync
