#pragma once

#include <string>
#include <optional>

namespace lpdispatch::job {
    enum class ToolVariant {
        Lp, // System V "lp"
        Lpr, // Berkeley "lpr"
    };

    /**
     * @brief Spelling dei flag per un dialetto del tool di stampa.
     */
    struct ToolDialect {
        const char *program;
        const char *destinationFlag;
        const char *copiesFlag;
        bool copiesAttached; // "-#2" invece di "-n 2"
        const char *titleFlag;
    };

    /**
     * @brief Lookup del dialetto per variante.
     */
    const ToolDialect &dialectFor(ToolVariant variant);

    std::string toolVariantToString(ToolVariant variant);

    std::optional<ToolVariant> toolVariantFromString(const std::string &name);
}
