#include "store/filesystem_object_store.hpp"
#include "utilities/errors.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <functional>
#include <iterator>
#include <thread>

namespace fs = std::filesystem;

namespace chunkkeeper {

namespace {

constexpr const char *kTmpDir = "tmp";
constexpr int kFanoutRaceAttempts = 5;

bool isTransient(const std::error_code &ec) {
  return ec == std::errc::resource_unavailable_try_again ||
         ec == std::errc::device_or_resource_busy ||
         ec == std::errc::interrupted || ec == std::errc::timed_out;
}

[[noreturn]] void throwStorage(const std::string &what, const std::error_code &ec) {
  throw StorageError(what + ": " + ec.message(), isTransient(ec));
}

bool isFanoutName(const std::string &name) {
  auto hex = [](char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); };
  return name.size() == 2 && hex(name[0]) && hex(name[1]);
}

std::string tempSuffix() {
  static std::atomic<unsigned long> counter{0};
  return std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())) +
         "." + std::to_string(counter.fetch_add(1));
}

} // namespace

FilesystemObjectStore::FilesystemObjectStore(fs::path root,
                                             utils::HashAlgorithm algo)
    : root_(std::move(root)), algo_(algo) {
  std::error_code ec;
  fs::create_directories(root_ / kTmpDir, ec);
  if (ec) {
    throwStorage("cannot create object directory " + root_.string(), ec);
  }
}

fs::path FilesystemObjectStore::chunkPath(const std::string &hash) const {
  return root_ / hash.substr(0, 2) / hash.substr(2);
}

void FilesystemObjectStore::putChunk(const std::string &hash,
                                     const std::vector<std::byte> &data) {
  if (!utils::isValidHash(hash)) {
    throw ValidationError("malformed chunk hash: '" + hash + "'");
  }
  std::string actual = utils::hashBytes(data, algo_);
  if (actual != hash) {
    throw ValidationError("digest mismatch for chunk " + hash +
                          ": payload hashes to " + actual);
  }

  fs::path target = chunkPath(hash);
  std::error_code ec;
  if (fs::exists(target, ec)) {
    return;
  }

  fs::path tmp = root_ / kTmpDir / (hash + "." + tempSuffix());
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw StorageError("cannot open temp file " + tmp.string(), true);
    }
    out.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) {
      out.close();
      fs::remove(tmp, ec);
      throw StorageError("short write for chunk " + hash, true);
    }
  }
  // A delete emptying the same fan-out directory may remove it between
  // create_directories() and rename(); recreate it and try again.
  for (int attempt = 0;; ++attempt) {
    fs::create_directories(target.parent_path(), ec);
    if (!ec) {
      fs::rename(tmp, target, ec);
      if (!ec)
        return;
    }
    if (ec != std::errc::no_such_file_or_directory || attempt + 1 >= kFanoutRaceAttempts) {
      std::error_code ignored;
      fs::remove(tmp, ignored);
      throwStorage("cannot move chunk " + hash + " into place", ec);
    }
  }
}

std::vector<std::byte> FilesystemObjectStore::getChunk(const std::string &hash) const {
  if (!utils::isValidHash(hash)) {
    throw NotFoundError(hash);
  }
  std::ifstream in(chunkPath(hash), std::ios::binary);
  if (!in.is_open()) {
    throw NotFoundError(hash);
  }
  std::vector<char> tmp((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
  std::vector<std::byte> data(tmp.size());
  std::transform(tmp.begin(), tmp.end(), data.begin(),
                 [](char c) { return std::byte(c); });
  return data;
}

bool FilesystemObjectStore::hasChunk(const std::string &hash) const {
  if (!utils::isValidHash(hash))
    return false;
  std::error_code ec;
  return fs::is_regular_file(chunkPath(hash), ec);
}

void FilesystemObjectStore::deleteChunk(const std::string &hash) {
  if (!utils::isValidHash(hash))
    return;
  fs::path path = chunkPath(hash);
  std::error_code ec;
  fs::remove(path, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    throwStorage("cannot delete chunk " + hash, ec);
  }
  std::error_code dirEc;
  if (fs::is_empty(path.parent_path(), dirEc) && !dirEc) {
    fs::remove(path.parent_path(), dirEc);
  }
}

ListPage FilesystemObjectStore::listChunks(const std::string &prefix,
                                           const std::string &continuationToken,
                                           size_t limit) const {
  ListPage page;
  if (limit == 0)
    limit = 1;

  std::vector<std::string> fanouts;
  std::error_code ec;
  for (fs::directory_iterator it(root_, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::string name = it->path().filename().string();
    std::error_code typeEc;
    if (!it->is_directory(typeEc) || !isFanoutName(name))
      continue;
    std::string dirPrefix = prefix.substr(0, std::min<size_t>(2, prefix.size()));
    if (name.compare(0, dirPrefix.size(), dirPrefix) != 0)
      continue;
    if (!continuationToken.empty() && name < continuationToken.substr(0, 2))
      continue;
    fanouts.push_back(name);
  }
  if (ec) {
    throwStorage("cannot list " + root_.string(), ec);
  }
  std::sort(fanouts.begin(), fanouts.end());

  for (const auto &dir : fanouts) {
    std::vector<ObjectInfo> batch;
    for (fs::directory_iterator it(root_ / dir, ec), end; !ec && it != end;
         it.increment(ec)) {
      std::error_code typeEc;
      if (!it->is_regular_file(typeEc))
        continue;
      std::string hash = dir + it->path().filename().string();
      if (!utils::isValidHash(hash) || hash.compare(0, prefix.size(), prefix) != 0)
        continue;
      if (!continuationToken.empty() && hash <= continuationToken)
        continue;
      std::error_code sizeEc;
      uint64_t size = it->file_size(sizeEc);
      if (sizeEc)
        continue; // removed between readdir and stat
      batch.push_back(ObjectInfo{hash, size, StorageTier::Hot});
    }
    if (ec) {
      throwStorage("cannot list fan-out directory " + dir, ec);
    }
    std::sort(batch.begin(), batch.end(),
              [](const ObjectInfo &a, const ObjectInfo &b) { return a.hash < b.hash; });
    for (auto &info : batch) {
      if (page.entries.size() == limit) {
        page.nextToken = page.entries.back().hash;
        return page;
      }
      page.entries.push_back(std::move(info));
    }
  }
  return page;
}

StoreUsage FilesystemObjectStore::usage() const {
  std::error_code ec;
  fs::space_info info = fs::space(root_, ec);
  if (ec) {
    throwStorage("cannot query free space of " + root_.string(), ec);
  }
  StoreUsage u;
  u.capacityBytes = info.capacity;
  u.freeBytes = info.available;
  return u;
}

} // namespace chunkkeeper
