#include "ProgressReporter.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace neurosync {

std::string formatBytes(int64_t bytes) {
  static const char *units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  double value = static_cast<double>(bytes);
  int unit = 0;
  while (value >= 1024.0 && unit < 4) {
    value /= 1024.0;
    ++unit;
  }
  std::ostringstream out;
  if (unit == 0)
    out << bytes << " B";
  else
    out << std::fixed << std::setprecision(1) << value << " " << units[unit];
  return out.str();
}

ConsoleProgress::ConsoleProgress(std::ostream &out, int width)
    : m_out(out), m_width(width) {}

void ConsoleProgress::start(const std::string &label, int64_t total) {
  m_label = label;
  m_total = total;
  m_position = 0;
  m_lastDraw = {};
  draw();
}

void ConsoleProgress::update(int64_t position) {
  m_position = std::max(m_position, position);
  // Redraw at most every 100ms; the final state is drawn by finish().
  auto now = std::chrono::steady_clock::now();
  if (now - m_lastDraw < std::chrono::milliseconds(100))
    return;
  m_lastDraw = now;
  draw();
}

void ConsoleProgress::finish(bool ok) {
  draw();
  m_out << (ok ? "  done" : "  FAILED") << std::endl;
}

void ConsoleProgress::draw() {
  double fraction = 1.0;
  if (m_total > 0)
    fraction = std::min(1.0, static_cast<double>(m_position) / m_total);
  int filled = static_cast<int>(fraction * m_width);

  m_out << "\r" << m_label << " [" << std::string(filled, '#')
        << std::string(m_width - filled, ' ') << "] " << std::setw(3)
        << static_cast<int>(fraction * 100) << "% (" << formatBytes(m_position)
        << " / " << formatBytes(m_total) << ")" << std::flush;
}

} // namespace neurosync
