#ifndef CHUNKKEEPER_OBJECT_STORE_HPP
#define CHUNKKEEPER_OBJECT_STORE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace chunkkeeper {

enum class StorageTier { Hot, Warm, Cold, Archive };

std::string tierToString(StorageTier tier);
/// @throw std::invalid_argument for unknown names.
StorageTier tierFromString(const std::string &name);

/// One entry of a store listing.
struct ObjectInfo {
  std::string hash;
  uint64_t size{0};
  StorageTier tier{StorageTier::Hot};
};

/**
 * @brief One page of a listing.
 *
 * Entries are in ascending hash order. Passing nextToken back to
 * listChunks() resumes after the last entry; an empty token means the
 * listing is complete.
 */
struct ListPage {
  std::vector<ObjectInfo> entries;
  std::string nextToken;

  bool complete() const { return nextToken.empty(); }
};

struct StoreUsage {
  uint64_t capacityBytes{0};
  uint64_t freeBytes{0};

  double freePercent() const {
    return capacityBytes == 0
               ? 100.0
               : 100.0 * static_cast<double>(freeBytes) /
                     static_cast<double>(capacityBytes);
  }
};

/**
 * @brief Byte-addressable persistence for chunk payloads keyed by hash.
 *
 * Implementations must be safe to call from multiple threads.
 */
class ObjectStore {
public:
  virtual ~ObjectStore() = default;

  /**
   * @brief Store @p data under @p hash.
   *
   * Writing identical bytes under an existing hash is a no-op.
   * @throw ValidationError if the digest of @p data is not @p hash.
   * @throw StorageError on backend failure.
   */
  virtual void putChunk(const std::string &hash,
                        const std::vector<std::byte> &data) = 0;

  /// @throw NotFoundError if the hash is absent.
  virtual std::vector<std::byte> getChunk(const std::string &hash) const = 0;

  virtual bool hasChunk(const std::string &hash) const = 0;

  /// Removing an absent hash succeeds so deletes can be retried.
  virtual void deleteChunk(const std::string &hash) = 0;

  /**
   * @brief List stored chunks whose hash starts with @p prefix.
   * @param continuationToken Token from a previous page, or empty to start.
   * @param limit Maximum number of entries in the returned page.
   */
  virtual ListPage listChunks(const std::string &prefix,
                              const std::string &continuationToken,
                              size_t limit) const = 0;

  /// Capacity and free space of the backing medium.
  virtual StoreUsage usage() const = 0;
};

/**
 * @brief Walk every chunk under @p prefix page by page.
 * @param afterPage Called before each further page is fetched; returning
 *        false ends the walk there.
 * @return Number of entries visited.
 */
size_t forEachChunk(const ObjectStore &store, const std::string &prefix,
                    const std::function<void(const ObjectInfo &)> &fn,
                    size_t pageSize = 1000,
                    const std::function<bool()> &afterPage = {});

} // namespace chunkkeeper

#endif // CHUNKKEEPER_OBJECT_STORE_HPP
