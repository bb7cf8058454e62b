#pragma once

#include "ByteStream.hpp"
#include "types.hpp"
#include <optional>
#include <stdexcept>
#include <string>

namespace neurosync {

class RemoteError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Missing or rejected credentials. Always fatal for the run.
class AuthError : public RemoteError {
public:
  using RemoteError::RemoteError;
};

class TransferError : public RemoteError {
public:
  using RemoteError::RemoteError;
};

/**
 * RemoteService is the dataset host as seen by the reconciliation engine.
 * Implementations throw RemoteError (or a subclass) on failure.
 */
class RemoteService {
public:
  virtual ~RemoteService() = default;

  virtual bool authenticated() const = 0;

  virtual std::string createDataset() = 0;
  virtual RemoteListing listFiles(const std::string &datasetId,
                                  const std::optional<std::string> &version) = 0;
  virtual void uploadFile(const std::string &datasetId, ByteStream &source,
                          const std::string &remotePath) = 0;
  virtual void deleteFile(const std::string &datasetId,
                          const std::string &remotePath) = 0;
  virtual void publishDataset(const std::string &datasetId) = 0;
  virtual void download(const std::string &url, ByteStream &destination) = 0;
};

} // namespace neurosync
