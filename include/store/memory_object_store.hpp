#ifndef CHUNKKEEPER_MEMORY_OBJECT_STORE_HPP
#define CHUNKKEEPER_MEMORY_OBJECT_STORE_HPP

#include "store/object_store.hpp"
#include "utilities/digest.hpp"
#include <map>
#include <mutex>

namespace chunkkeeper {

/**
 * @brief Object store kept entirely in memory.
 *
 * Used for embedding and tests. The reported capacity is configurable so
 * storage pressure can be simulated.
 */
class MemoryObjectStore : public ObjectStore {
public:
  explicit MemoryObjectStore(
      utils::HashAlgorithm algo = utils::HashAlgorithm::BLAKE3,
      uint64_t capacityBytes = 1ull << 40);

  /// Hash @p data, store it and return its key.
  std::string addChunk(const std::vector<std::byte> &data);

  void putChunk(const std::string &hash,
                const std::vector<std::byte> &data) override;
  std::vector<std::byte> getChunk(const std::string &hash) const override;
  bool hasChunk(const std::string &hash) const override;
  void deleteChunk(const std::string &hash) override;
  ListPage listChunks(const std::string &prefix,
                      const std::string &continuationToken,
                      size_t limit) const override;
  StoreUsage usage() const override;

  void setTier(const std::string &hash, StorageTier tier);
  void setCapacity(uint64_t capacityBytes);
  size_t chunkCount() const;

private:
  struct Entry {
    std::vector<std::byte> data;
    StorageTier tier{StorageTier::Hot};
  };

  utils::HashAlgorithm algo_;
  mutable std::mutex mutex_;
  std::map<std::string, Entry> chunks_;
  uint64_t capacity_;
  uint64_t usedBytes_{0};
};

} // namespace chunkkeeper

#endif // CHUNKKEEPER_MEMORY_OBJECT_STORE_HPP
