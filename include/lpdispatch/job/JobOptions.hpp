#pragma once

#include "lpdispatch/job/ToolDialect.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace lpdispatch::job {

    /**
     * @brief Opzioni di un job di stampa.
     *
     * Tutti i campi testuali sono input non fidato. jobOptions e' ordinata per chiave
     * cosi' che il comando generato sia riproducibile.
     */
    struct JobOptions {
        std::optional<std::string> destination;
        std::optional<uint32_t> copies;
        std::optional<std::string> title;
        std::map<std::string, std::string> jobOptions;
        ToolVariant variant = ToolVariant::Lp;
    };

    class JobOptionsBuilder {
    public:
        JobOptionsBuilder &destination(const std::string &destination);

        JobOptionsBuilder &destinationIf(const std::optional<std::string> &destination);

        JobOptionsBuilder &clearDestination();

        JobOptionsBuilder &copies(uint32_t copies);

        JobOptionsBuilder &clearCopies();

        JobOptionsBuilder &title(const std::string &title);

        JobOptionsBuilder &clearTitle();

        // Replaces every option set so far
        JobOptionsBuilder &jobOptions(std::map<std::string, std::string> jobOptions);

        JobOptionsBuilder &jobOption(const std::string &key, const std::string &value);

        JobOptionsBuilder &variant(ToolVariant variant);

        JobOptionsBuilder &useLpr(bool useLpr);

        JobOptions build() const;

    private:
        JobOptions options_;
    };

    /**
     * @brief Separa "key=value" sul primo '='.
     * @return nullopt se manca '=' o la chiave e' vuota.
     */
    std::optional<std::pair<std::string, std::string>> parseJobOption(const std::string &assignment);
}
