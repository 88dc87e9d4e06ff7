#ifndef CHUNKKEEPER_ERRORS_HPP
#define CHUNKKEEPER_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace chunkkeeper {

/// Root of every error raised by the storage and reclamation core.
class ChunkKeeperError : public std::runtime_error {
public:
  explicit ChunkKeeperError(const std::string &what) : std::runtime_error(what) {}
};

/// Payload digest does not match the key it was written under.
class ValidationError : public ChunkKeeperError {
public:
  using ChunkKeeperError::ChunkKeeperError;
};

/// Requested chunk is not present.
class NotFoundError : public ChunkKeeperError {
public:
  explicit NotFoundError(const std::string &hash)
      : ChunkKeeperError("chunk not found: " + hash), hash_(hash) {}
  const std::string &hash() const { return hash_; }

private:
  std::string hash_;
};

/// Another actor holds the row or cluster lock. Not an alarm by itself.
class LockContention : public ChunkKeeperError {
public:
  using ChunkKeeperError::ChunkKeeperError;
};

/// Ledger and object store disagree. Surfaced for manual reconciliation.
class ConsistencyError : public ChunkKeeperError {
public:
  using ChunkKeeperError::ChunkKeeperError;
};

/// Backend I/O failure. Transient failures are retried with backoff.
class StorageError : public ChunkKeeperError {
public:
  StorageError(const std::string &what, bool transient)
      : ChunkKeeperError(what), transient_(transient) {}
  bool transient() const { return transient_; }

private:
  bool transient_;
};

/// Cluster lock could not be obtained or was lost mid-run.
class CoordinationError : public ChunkKeeperError {
public:
  using ChunkKeeperError::ChunkKeeperError;
};

/// The ledger database rejected a statement.
class LedgerError : public ChunkKeeperError {
public:
  LedgerError(const std::string &what, int code)
      : ChunkKeeperError(what), code_(code) {}
  int code() const { return code_; }

private:
  int code_;
};

} // namespace chunkkeeper

#endif // CHUNKKEEPER_ERRORS_HPP
