#include "store/memory_object_store.hpp"
#include "utilities/errors.hpp"

namespace chunkkeeper {

MemoryObjectStore::MemoryObjectStore(utils::HashAlgorithm algo,
                                     uint64_t capacityBytes)
    : algo_(algo), capacity_(capacityBytes) {}

std::string MemoryObjectStore::addChunk(const std::vector<std::byte> &data) {
  std::string hash = utils::hashBytes(data, algo_);
  putChunk(hash, data);
  return hash;
}

void MemoryObjectStore::putChunk(const std::string &hash,
                                 const std::vector<std::byte> &data) {
  if (!utils::isValidHash(hash)) {
    throw ValidationError("malformed chunk hash: '" + hash + "'");
  }
  // Hash outside the lock; digesting large chunks must not stall readers.
  std::string actual = utils::hashBytes(data, algo_);
  if (actual != hash) {
    throw ValidationError("digest mismatch for chunk " + hash + ": payload hashes to " +
                          actual);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (chunks_.count(hash)) {
    return;
  }
  chunks_[hash] = Entry{data, StorageTier::Hot};
  usedBytes_ += data.size();
}

std::vector<std::byte> MemoryObjectStore::getChunk(const std::string &hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = chunks_.find(hash);
  if (it == chunks_.end()) {
    throw NotFoundError(hash);
  }
  return it->second.data;
}

bool MemoryObjectStore::hasChunk(const std::string &hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.count(hash) > 0;
}

void MemoryObjectStore::deleteChunk(const std::string &hash) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = chunks_.find(hash);
  if (it == chunks_.end()) {
    return;
  }
  usedBytes_ -= it->second.data.size();
  chunks_.erase(it);
}

ListPage MemoryObjectStore::listChunks(const std::string &prefix,
                                       const std::string &continuationToken,
                                       size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  ListPage page;
  if (limit == 0)
    limit = 1;
  auto it = continuationToken.empty() ? chunks_.lower_bound(prefix)
                                      : chunks_.upper_bound(continuationToken);
  for (; it != chunks_.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) {
      if (it->first > prefix)
        break;
      continue;
    }
    if (page.entries.size() == limit) {
      page.nextToken = page.entries.back().hash;
      break;
    }
    page.entries.push_back(
        ObjectInfo{it->first, it->second.data.size(), it->second.tier});
  }
  return page;
}

StoreUsage MemoryObjectStore::usage() const {
  std::lock_guard<std::mutex> lock(mutex_);
  StoreUsage u;
  u.capacityBytes = capacity_;
  u.freeBytes = capacity_ > usedBytes_ ? capacity_ - usedBytes_ : 0;
  return u;
}

void MemoryObjectStore::setTier(const std::string &hash, StorageTier tier) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = chunks_.find(hash);
  if (it == chunks_.end()) {
    throw NotFoundError(hash);
  }
  it->second.tier = tier;
}

void MemoryObjectStore::setCapacity(uint64_t capacityBytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  capacity_ = capacityBytes;
}

size_t MemoryObjectStore::chunkCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.size();
}

} // namespace chunkkeeper
