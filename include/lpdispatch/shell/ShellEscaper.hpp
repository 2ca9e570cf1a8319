#pragma once

#include <string>
#include <filesystem>

namespace lpdispatch::shell {

/**
 * @brief Codifica stringhe arbitrarie come letterali POSIX single-quoted.
 */
    class ShellEscaper {
    public:
        /**
         * @brief Racchiude la stringa tra apici singoli.
         *
         * Ogni apice interno diventa '"'"' (chiude, apice tra doppi apici, riapre).
         * La stringa vuota diventa '' e non viene mai omessa.
         * @param value Testo non fidato.
         * @return Token che la shell interpreta esattamente come value.
         */
        static std::string escape(const std::string &value);

        static std::string escapePath(const std::filesystem::path &path);
    };

}
