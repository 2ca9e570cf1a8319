#pragma once

#include "lpdispatch/types/Result.hpp"

#include <filesystem>
#include <string>

namespace lpdispatch::storage {

/**
 * @brief Interfaccia per i file temporanei usati dal contenuto inline.
 */
    class ScratchStorage {
    public:
        virtual ~ScratchStorage() = default;

        /**
         * @brief Restituisce un path nuovo, mai restituito prima.
         * @throws types::ScratchIoException se la cartella non e' utilizzabile.
         */
        virtual std::filesystem::path newPath(const std::string &prefix, const std::string &extension) = 0;

        /**
         * @brief Scrive bytes nel file cosi' come sono.
         * @return Success oppure ScratchIoError.
         */
        virtual types::Result writeAll(const std::filesystem::path &path, const std::string &bytes) = 0;

        /**
         * @brief Elimina un file creato da questo storage. Non fallisce se manca.
         */
        virtual void discard(const std::filesystem::path &path) = 0;
    };

} // namespace lpdispatch::storage
