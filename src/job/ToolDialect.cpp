#include "lpdispatch/job/ToolDialect.hpp"

#include <algorithm>
#include <cctype>

namespace lpdispatch::job {

    namespace {
        constexpr ToolDialect LP_DIALECT{"lp", "-d", "-n", false, "-t"};
        constexpr ToolDialect LPR_DIALECT{"lpr", "-P", "-#", true, "-J"};
    }

    const ToolDialect &dialectFor(ToolVariant variant) {
        switch (variant) {
            case ToolVariant::Lpr: return LPR_DIALECT;
            case ToolVariant::Lp:
            default: return LP_DIALECT;
        }
    }

    std::string toolVariantToString(ToolVariant variant) {
        return dialectFor(variant).program;
    }

    std::optional<ToolVariant> toolVariantFromString(const std::string &name) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "lp") return ToolVariant::Lp;
        if (lower == "lpr") return ToolVariant::Lpr;
        return std::nullopt;
    }

} // namespace lpdispatch::job
