#pragma once

#include "../ScratchStorage.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <random>
#include <string>

namespace lpdispatch::storage {

/**
 * @brief ScratchStorage su una cartella del filesystem (di default la temp di sistema).
 *
 * I nomi sono <prefix>-<pid>-<counter>-<16 hex casuali>.<ext>; il file viene creato in modo
 * esclusivo da newPath, quindi due chiamate non condividono mai lo stesso file.
 */
    class TempScratchStorage : public ScratchStorage {
    public:
        TempScratchStorage();

        explicit TempScratchStorage(std::filesystem::path directory);

        std::filesystem::path newPath(const std::string &prefix, const std::string &extension) override;

        types::Result writeAll(const std::filesystem::path &path, const std::string &bytes) override;

        void discard(const std::filesystem::path &path) override;

        const std::filesystem::path &directory() const { return directory_; }

    private:
        static constexpr int MAX_CREATE_ATTEMPTS = 8;

        std::filesystem::path directory_;
        std::atomic<uint64_t> counter_{0};
        std::mutex rngMutex_;
        std::mt19937_64 rng_;

        std::string generateName(const std::string &prefix, const std::string &extension);

        static bool createExclusive(const std::filesystem::path &path);
    };

} // namespace lpdispatch::storage
