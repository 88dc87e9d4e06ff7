#include <gtest/gtest.h>
#include "gc_test_utils.hpp"
#include "store/filesystem_object_store.hpp"
#include "store/memory_object_store.hpp"
#include "utilities/errors.hpp"

#include <exception>
#include <filesystem>
#include <fstream>
#include <set>
#include <thread>

using namespace chunkkeeper;
using chunkkeeper_test::bytesOf;

namespace fs = std::filesystem;

TEST(MemoryObjectStore, PutGetRoundTrip) {
    MemoryObjectStore store;
    auto data = bytesOf("hello chunk");
    std::string hash = utils::hashBytes(data);
    store.putChunk(hash, data);
    EXPECT_TRUE(store.hasChunk(hash));
    EXPECT_EQ(store.getChunk(hash), data);
}

TEST(MemoryObjectStore, RejectsDigestMismatch) {
    MemoryObjectStore store;
    std::string other = utils::hashBytes(bytesOf("something else"));
    EXPECT_THROW(store.putChunk(other, bytesOf("hello chunk")), ValidationError);
    EXPECT_FALSE(store.hasChunk(other));
}

TEST(MemoryObjectStore, RejectsMalformedHash) {
    MemoryObjectStore store;
    EXPECT_THROW(store.putChunk("not-a-hash", bytesOf("x")), ValidationError);
}

TEST(MemoryObjectStore, GetMissingThrowsNotFound) {
    MemoryObjectStore store;
    std::string hash = utils::hashBytes(bytesOf("absent"));
    EXPECT_THROW(store.getChunk(hash), NotFoundError);
}

TEST(MemoryObjectStore, DuplicatePutIsNoop) {
    MemoryObjectStore store;
    std::string hash = store.addChunk(bytesOf("dup"));
    EXPECT_NO_THROW(store.putChunk(hash, bytesOf("dup")));
    EXPECT_EQ(store.chunkCount(), 1u);
}

TEST(MemoryObjectStore, DeleteIsIdempotent) {
    MemoryObjectStore store;
    std::string hash = store.addChunk(bytesOf("gone soon"));
    store.deleteChunk(hash);
    EXPECT_FALSE(store.hasChunk(hash));
    EXPECT_NO_THROW(store.deleteChunk(hash));
}

TEST(MemoryObjectStore, ListingIsOrderedAndPaginated) {
    MemoryObjectStore store;
    std::set<std::string> expected;
    for (int i = 0; i < 25; ++i)
        expected.insert(store.addChunk(bytesOf("chunk-" + std::to_string(i))));

    std::vector<std::string> seen;
    std::string token;
    size_t pages = 0;
    do {
        ListPage page = store.listChunks("", token, 10);
        ++pages;
        for (const auto& e : page.entries)
            seen.push_back(e.hash);
        token = page.nextToken;
    } while (!token.empty());

    EXPECT_EQ(pages, 3u);
    EXPECT_EQ(seen, std::vector<std::string>(expected.begin(), expected.end()));
}

TEST(MemoryObjectStore, ListingHonoursPrefix) {
    MemoryObjectStore store;
    std::vector<std::string> hashes;
    for (int i = 0; i < 40; ++i)
        hashes.push_back(store.addChunk(bytesOf("p" + std::to_string(i))));
    std::string prefix = hashes.front().substr(0, 1);
    size_t expected = 0;
    for (const auto& h : hashes)
        if (h.compare(0, 1, prefix) == 0)
            ++expected;

    size_t visited = forEachChunk(store, prefix, [&](const ObjectInfo& info) {
        EXPECT_EQ(info.hash.compare(0, 1, prefix), 0);
    }, 3);
    EXPECT_EQ(visited, expected);
}

TEST(MemoryObjectStore, UsageTracksCapacity) {
    MemoryObjectStore store(utils::HashAlgorithm::BLAKE3, 100);
    store.addChunk(bytesOf(std::string(90, 'x')));
    EXPECT_EQ(store.usage().freeBytes, 10u);
    EXPECT_DOUBLE_EQ(store.usage().freePercent(), 10.0);
}

class FilesystemObjectStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / "chunkkeeper_fs_store_test";
        fs::remove_all(root_);
    }
    void TearDown() override { fs::remove_all(root_); }

    fs::path root_;
};

TEST_F(FilesystemObjectStoreTest, WritesUnderFanoutDirectory) {
    FilesystemObjectStore store(root_);
    auto data = bytesOf("on disk");
    std::string hash = utils::hashBytes(data);
    store.putChunk(hash, data);

    EXPECT_TRUE(fs::exists(root_ / hash.substr(0, 2) / hash.substr(2)));
    EXPECT_EQ(store.getChunk(hash), data);
}

TEST_F(FilesystemObjectStoreTest, RejectsDigestMismatch) {
    FilesystemObjectStore store(root_);
    std::string wrong = utils::hashBytes(bytesOf("other"));
    EXPECT_THROW(store.putChunk(wrong, bytesOf("payload")), ValidationError);
    EXPECT_FALSE(store.hasChunk(wrong));
}

TEST_F(FilesystemObjectStoreTest, DeleteRemovesEmptyFanout) {
    FilesystemObjectStore store(root_);
    auto data = bytesOf("short lived");
    std::string hash = utils::hashBytes(data);
    store.putChunk(hash, data);
    store.deleteChunk(hash);

    EXPECT_FALSE(store.hasChunk(hash));
    EXPECT_FALSE(fs::exists(root_ / hash.substr(0, 2)));
    EXPECT_NO_THROW(store.deleteChunk(hash));
}

TEST_F(FilesystemObjectStoreTest, ListingSkipsTempFilesAndIsOrdered) {
    FilesystemObjectStore store(root_);
    std::set<std::string> expected;
    for (int i = 0; i < 12; ++i) {
        auto data = bytesOf("fs-" + std::to_string(i));
        std::string hash = utils::hashBytes(data);
        store.putChunk(hash, data);
        expected.insert(hash);
    }
    std::ofstream(root_ / "tmp" / "leftover.partial") << "junk";

    std::vector<std::string> seen;
    forEachChunk(store, "", [&](const ObjectInfo& info) { seen.push_back(info.hash); }, 5);
    EXPECT_EQ(seen, std::vector<std::string>(expected.begin(), expected.end()));
}

TEST_F(FilesystemObjectStoreTest, PutSurvivesConcurrentFanoutRemoval) {
    FilesystemObjectStore store(root_);
    // Two payloads whose hashes land in the same fan-out directory.
    auto first = bytesOf("fanout-0");
    std::string firstHash = utils::hashBytes(first);
    std::vector<std::byte> second;
    std::string secondHash;
    for (int i = 1; secondHash.empty(); ++i) {
        auto candidate = bytesOf("fanout-" + std::to_string(i));
        std::string h = utils::hashBytes(candidate);
        if (h.compare(0, 2, firstHash, 0, 2) == 0) {
            second = candidate;
            secondHash = h;
        }
    }

    auto churn = [&store](const std::string& hash, const std::vector<std::byte>& data) {
        for (int i = 0; i < 300; ++i) {
            store.putChunk(hash, data);
            store.deleteChunk(hash);
        }
        store.putChunk(hash, data);
    };
    std::exception_ptr failure;
    std::thread other([&] {
        try {
            churn(secondHash, second);
        } catch (...) {
            failure = std::current_exception();
        }
    });
    EXPECT_NO_THROW(churn(firstHash, first));
    other.join();
    EXPECT_FALSE(failure);

    EXPECT_EQ(store.getChunk(firstHash), first);
    EXPECT_EQ(store.getChunk(secondHash), second);
}

TEST_F(FilesystemObjectStoreTest, GetMissingThrowsNotFound) {
    FilesystemObjectStore store(root_);
    EXPECT_THROW(store.getChunk(utils::hashBytes(bytesOf("never written"))), NotFoundError);
}
