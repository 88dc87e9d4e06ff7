#ifndef CHUNKKEEPER_FILESYSTEM_OBJECT_STORE_HPP
#define CHUNKKEEPER_FILESYSTEM_OBJECT_STORE_HPP

#include "store/object_store.hpp"
#include "utilities/digest.hpp"
#include <filesystem>

namespace chunkkeeper {

/**
 * @brief Object store on a local directory.
 *
 * Layout: `<root>/ab/cdef...` where `ab` is the first two hex characters of
 * the hash. Writes go through `<root>/tmp` and are renamed into place so a
 * reader never observes a partial chunk. Empty fan-out directories are
 * removed after deletes.
 */
class FilesystemObjectStore : public ObjectStore {
public:
  explicit FilesystemObjectStore(
      std::filesystem::path root,
      utils::HashAlgorithm algo = utils::HashAlgorithm::BLAKE3);

  void putChunk(const std::string &hash,
                const std::vector<std::byte> &data) override;
  std::vector<std::byte> getChunk(const std::string &hash) const override;
  bool hasChunk(const std::string &hash) const override;
  void deleteChunk(const std::string &hash) override;
  ListPage listChunks(const std::string &prefix,
                      const std::string &continuationToken,
                      size_t limit) const override;
  StoreUsage usage() const override;

  std::filesystem::path chunkPath(const std::string &hash) const;
  const std::filesystem::path &root() const { return root_; }

private:
  std::filesystem::path root_;
  utils::HashAlgorithm algo_;
};

} // namespace chunkkeeper

#endif // CHUNKKEEPER_FILESYSTEM_OBJECT_STORE_HPP
