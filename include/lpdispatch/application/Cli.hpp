#pragma once

#include "lpdispatch/config/ConfigManager.hpp"
#include "lpdispatch/job/Content.hpp"
#include "lpdispatch/job/JobOptions.hpp"
#include "lpdispatch/types/Result.hpp"

#include <boost/program_options.hpp>
#include <cstdint>
#include <string>

namespace lpdispatch::application {

    constexpr int EXIT_OK = 0;
    constexpr int EXIT_USAGE = 1;
    constexpr int EXIT_SUBMISSION_FAILED = 2;

    /**
     * @class Cli
     * @brief Opzioni da riga di comando di lpdispatch e loro traduzione in un job.
     *
     * I flag della riga di comando hanno sempre precedenza sulla configurazione.
     * Ogni errore d'uso e' segnalato con boost::program_options::error.
     */
    class Cli {
    public:
        Cli();

        boost::program_options::variables_map parse(int argc, const char *const argv[]) const;

        const boost::program_options::options_description &visibleOptions() const { return visible_; }

        /**
         * @brief Costruisce le opzioni del job: --variant, poi --lpr, poi submit.variant.
         * @throws boost::program_options::error per -o malformati o flag in conflitto.
         * @throws types::ConfigException se submit.variant non e' valido.
         */
        static job::JobOptions buildJobOptions(const boost::program_options::variables_map &vm,
                                               const config::SubmitConfig &submitConfig);

        /**
         * @brief --text oppure FILE, esattamente uno dei due.
         */
        static job::Content buildContent(const boost::program_options::variables_map &vm);

        /**
         * @brief Solo cifre decimali, tra 1 e 4294967295.
         */
        static uint32_t parseCopies(const std::string &value);

        static int exitCodeFor(const types::Result &result);

    private:
        boost::program_options::options_description visible_;
        boost::program_options::options_description all_;
        boost::program_options::positional_options_description positional_;
    };

} // namespace lpdispatch::application
