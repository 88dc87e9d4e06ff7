#include "store/object_store.hpp"
#include <stdexcept>

namespace chunkkeeper {

std::string tierToString(StorageTier tier) {
  switch (tier) {
  case StorageTier::Hot:
    return "hot";
  case StorageTier::Warm:
    return "warm";
  case StorageTier::Cold:
    return "cold";
  case StorageTier::Archive:
    return "archive";
  }
  return "hot";
}

StorageTier tierFromString(const std::string &name) {
  if (name == "hot")
    return StorageTier::Hot;
  if (name == "warm")
    return StorageTier::Warm;
  if (name == "cold")
    return StorageTier::Cold;
  if (name == "archive")
    return StorageTier::Archive;
  throw std::invalid_argument("unknown storage tier: " + name);
}

size_t forEachChunk(const ObjectStore &store, const std::string &prefix,
                    const std::function<void(const ObjectInfo &)> &fn,
                    size_t pageSize, const std::function<bool()> &afterPage) {
  size_t visited = 0;
  std::string token;
  do {
    ListPage page = store.listChunks(prefix, token, pageSize);
    for (const auto &info : page.entries) {
      fn(info);
      ++visited;
    }
    token = page.nextToken;
    if (!token.empty() && afterPage && !afterPage())
      break;
  } while (!token.empty());
  return visited;
}

} // namespace chunkkeeper
