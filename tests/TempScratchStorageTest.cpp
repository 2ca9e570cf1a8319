#include <gtest/gtest.h>

#include "lpdispatch/storage/impl/TempScratchStorage.hpp"
#include "lpdispatch/types/Error.hpp"
#include "TestHelpers.hpp"

#include <fstream>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

using lpdispatch::storage::TempScratchStorage;
using namespace lpdispatch::test;

class TempScratchStorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = makeTempDir("scratch");
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    fs::path dir;
};

TEST_F(TempScratchStorageTest, DefaultsToSystemTempDirectory) {
    TempScratchStorage storage;
    EXPECT_EQ(fs::temp_directory_path().string(), storage.directory().string());
}

TEST_F(TempScratchStorageTest, NewPathUsesPrefixAndExtension) {
    TempScratchStorage storage(dir);
    fs::path path = storage.newPath("lpdispatch", "txt");

    EXPECT_EQ(dir.string(), path.parent_path().string());
    EXPECT_EQ(".txt", path.extension().string());
    EXPECT_EQ(0u, path.filename().string().rfind("lpdispatch-", 0));
    EXPECT_TRUE(fs::exists(path));
}

TEST_F(TempScratchStorageTest, PathsAreUniqueAcrossThreads) {
    TempScratchStorage storage(dir);
    std::set<std::string> seen;
    std::mutex seenMutex;

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&]() {
            for (int i = 0; i < 250; ++i) {
                auto path = storage.newPath("job", "txt").string();
                std::lock_guard<std::mutex> lock(seenMutex);
                seen.insert(path);
            }
        });
    }
    for (auto &worker: workers) {
        worker.join();
    }

    EXPECT_EQ(1000u, seen.size());
}

TEST_F(TempScratchStorageTest, SeparateInstancesDoNotCollide) {
    TempScratchStorage first(dir);
    TempScratchStorage second(dir);

    EXPECT_NE(first.newPath("job", "txt").string(), second.newPath("job", "txt").string());
}

TEST_F(TempScratchStorageTest, WriteAllIsVerbatim) {
    TempScratchStorage storage(dir);
    fs::path path = storage.newPath("job", "bin");
    std::string bytes("no newline\0binary\r\n'quoted'", 27);

    ASSERT_TRUE(storage.writeAll(path, bytes).isSuccess());
    EXPECT_EQ(bytes, readFile(path));
}

TEST_F(TempScratchStorageTest, WriteAllIntoMissingDirectoryFails) {
    TempScratchStorage storage(dir);
    auto result = storage.writeAll(dir / "missing" / "file.txt", "x");
    EXPECT_TRUE(result.isScratchIoError());
}

TEST_F(TempScratchStorageTest, NewPathThrowsWhenDirectoryIsAFile) {
    fs::path blocker = dir / "blocker";
    std::ofstream(blocker) << "not a directory";

    TempScratchStorage storage(blocker / "nested");
    EXPECT_THROW(storage.newPath("job", "txt"), lpdispatch::types::ScratchIoException);
}

TEST_F(TempScratchStorageTest, DiscardRemovesAndToleratesMissing) {
    TempScratchStorage storage(dir);
    fs::path path = storage.newPath("job", "txt");

    storage.discard(path);
    EXPECT_FALSE(fs::exists(path));
    storage.discard(path);
}
