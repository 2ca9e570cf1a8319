#include "lpdispatch/storage/impl/TempScratchStorage.hpp"
#include "lpdispatch/logger/Logger.hpp"
#include "lpdispatch/types/Error.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <unistd.h>
#include <utility>

namespace fs = std::filesystem;

namespace lpdispatch::storage {
    TempScratchStorage::TempScratchStorage()
            : TempScratchStorage(fs::path()) {
    }

    TempScratchStorage::TempScratchStorage(fs::path directory)
            : directory_(std::move(directory)) {
        std::random_device rd;
        std::seed_seq seed{rd(), rd(), rd(), rd(), static_cast<unsigned>(::getpid())};
        rng_.seed(seed);

        if (directory_.empty()) {
            std::error_code ec;
            directory_ = fs::temp_directory_path(ec);
            if (ec) {
                Logger::logWarning("[TempScratchStorage] No system temp directory (" + ec.message() +
                                   "), falling back to /tmp");
                directory_ = "/tmp";
            }
        }
    }

    fs::path TempScratchStorage::newPath(const std::string &prefix, const std::string &extension) {
        std::error_code ec;
        fs::create_directories(directory_, ec);
        if (ec) {
            throw types::ScratchIoException("cannot create " + directory_.string() + ": " + ec.message());
        }

        for (int attempt = 0; attempt < MAX_CREATE_ATTEMPTS; ++attempt) {
            fs::path candidate = directory_ / generateName(prefix, extension);
            if (createExclusive(candidate)) {
                Logger::logDebug("[TempScratchStorage] Reserved " + candidate.string());
                return candidate;
            }
            if (errno != EEXIST) {
                throw types::ScratchIoException("cannot create " + candidate.string() + ": " +
                                                std::strerror(errno));
            }
        }

        throw types::ScratchIoException("no unique name available in " + directory_.string());
    }

    types::Result TempScratchStorage::writeAll(const fs::path &path, const std::string &bytes) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            Logger::logError("[TempScratchStorage] Cannot open scratch file: " + path.string());
            return types::Result::scratchIoError("Cannot open scratch file " + path.string());
        }

        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.close();

        if (out.fail()) {
            Logger::logError("[TempScratchStorage] Write failed: " + path.string());
            return types::Result::scratchIoError("Cannot write scratch file " + path.string());
        }

        Logger::logDebug("[TempScratchStorage] Wrote " + std::to_string(bytes.size()) + " bytes to " +
                         path.string());
        return types::Result::success();
    }

    void TempScratchStorage::discard(const fs::path &path) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            Logger::logWarning("[TempScratchStorage] Cannot remove " + path.string() + ": " + ec.message());
        }
    }

    std::string TempScratchStorage::generateName(const std::string &prefix, const std::string &extension) {
        uint64_t random;
        {
            std::lock_guard<std::mutex> lock(rngMutex_);
            random = rng_();
        }

        std::ostringstream oss;
        oss << prefix << "-" << ::getpid() << "-" << counter_.fetch_add(1) << "-"
            << std::hex << std::setw(16) << std::setfill('0') << random;
        if (!extension.empty()) {
            oss << "." << extension;
        }
        return oss.str();
    }

    bool TempScratchStorage::createExclusive(const fs::path &path) {
        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
        if (fd < 0) {
            return false;
        }
        ::close(fd);
        return true;
    }
} // namespace lpdispatch::storage
