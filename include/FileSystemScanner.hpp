#ifndef FILESYSTEMSCANNER_HPP
#define FILESYSTEMSCANNER_HPP

#include "types.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>
namespace neurosync {

// A remote key whose local counterpart would land outside the sync root.
class PathEscapeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class FileSystemScanner {
public:
  FileSystemScanner(std::string rootPath);
  ~FileSystemScanner();

  ScanResult scan() const;
  std::string toKey(const std::string &absPath) const;
  std::filesystem::path resolveInsideRoot(const std::string &key) const;
  const std::string &root() const { return m_rootPath; }

  static std::string normalizeRemoteKey(const std::string &remotePath);

private:
  std::string m_rootPath;
  static std::string normalizePathSeparators(const std::string &path);
};

} // namespace neurosync

#endif // FILESYSTEMSCANNER_HPP
