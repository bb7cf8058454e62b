#include "FileSystemScanner.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace neurosync {

namespace {
bool isWithin(const fs::path &base, const fs::path &candidate) {
  auto c = candidate.begin();
  for (const auto &part : base) {
    if (part.empty())
      continue;
    if (c == candidate.end() || part != *c)
      return false;
    ++c;
  }
  return c != candidate.end();
}
} // namespace

FileSystemScanner::FileSystemScanner(std::string rootPath)
    : m_rootPath(std::move(rootPath)) {}

FileSystemScanner::~FileSystemScanner() = default;

std::string
FileSystemScanner::normalizePathSeparators(const std::string &path) {
  std::string result = path;
  std::replace(result.begin(), result.end(), '\\', '/');
  return result;
}

std::string FileSystemScanner::normalizeRemoteKey(const std::string &remotePath) {
  std::stringstream ss(normalizePathSeparators(remotePath));
  std::string item;
  std::string key;
  while (std::getline(ss, item, '/')) {
    if (item.empty() || item == ".")
      continue;
    if (!key.empty())
      key += '/';
    key += item;
  }
  return key;
}

std::string FileSystemScanner::toKey(const std::string &absPath) const {
  fs::path base{m_rootPath};
  fs::path full{absPath};
  return normalizeRemoteKey(full.lexically_relative(base).generic_string());
}

fs::path FileSystemScanner::resolveInsideRoot(const std::string &key) const {
  std::string normalized = normalizeRemoteKey(key);
  if (normalized.empty())
    throw PathEscapeError("empty path '" + key + "'");

  fs::path rel{normalized};
  if (rel.is_absolute() || rel.has_root_name())
    throw PathEscapeError("absolute path '" + key + "'");
  for (const auto &part : rel) {
    if (part == "..")
      throw PathEscapeError("path '" + key + "' leaves the sync root");
  }

  fs::path base = fs::weakly_canonical(fs::absolute(m_rootPath));
  fs::path candidate = fs::weakly_canonical(base / rel);
  if (!isWithin(base, candidate))
    throw PathEscapeError("path '" + key + "' resolves outside " +
                          base.string());
  return candidate;
}

ScanResult FileSystemScanner::scan() const {
  ScanResult result;
  fs::directory_options opts = fs::directory_options::skip_permission_denied;

  if (!fs::exists(m_rootPath))
    return result;
  if (!fs::is_directory(m_rootPath))
    throw std::runtime_error("not a directory: " + m_rootPath);

  for (const auto &entry : fs::recursive_directory_iterator(m_rootPath, opts)) {
    try {
      if (!entry.is_regular_file())
        continue;
      LocalEntry file;
      file.absPath = entry.path().string();
      file.path = entry.path().lexically_relative(m_rootPath).string();
      file.key = toKey(file.absPath);
      file.size = static_cast<int64_t>(entry.file_size());
      result.files.push_back(file);
    } catch (const fs::filesystem_error &e) {
      std::cerr << "[Scan] Error scanning item: " << entry.path() << " - "
                << e.what() << std::endl;
      result.skipped.push_back(toKey(entry.path().string()));
    }
  }

  std::cout << "[Scan] " << result.files.size() << " files under "
            << m_rootPath << std::endl;
  return result;
}

} // namespace neurosync
