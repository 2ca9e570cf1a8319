#pragma once

#include "lpdispatch/job/Content.hpp"
#include "lpdispatch/job/JobOptions.hpp"
#include "lpdispatch/storage/ScratchStorage.hpp"
#include "lpdispatch/types/Result.hpp"

#include <memory>
#include <string>

namespace lpdispatch::job {

/**
 * @brief Costruisce la command line lp/lpr per un job di stampa.
 *
 * Forma: <tool> [-d|-P <dest>] [-n <n>|-#<n>] [-t|-J <title>] {-o key=value}* <content-path>
 *
 * Destinazione, titolo e path sono sempre quotati con ShellEscaper. Le coppie -o key=value
 * invece passano raw: chiavi e valori non devono contenere spazi o metacaratteri di shell.
 */
    class CommandBuilder {
    public:
        struct Settings {
            std::string scratchPrefix = "lpdispatch";
            std::string scratchExtension = "txt";
        };

        explicit CommandBuilder(std::shared_ptr<storage::ScratchStorage> scratch);

        CommandBuilder(std::shared_ptr<storage::ScratchStorage> scratch, Settings settings);

        /**
         * @brief Costruisce il comando.
         *
         * Per contenuto inline scrive il testo in un nuovo file di scratch, che non viene
         * eliminato: il suo path e' riportato in Result::scratchPath.
         * @return Success con commandLine, EmptyPath oppure ScratchIoError.
         */
        types::Result build(const JobOptions &options, const Content &content) const;

    private:
        std::shared_ptr<storage::ScratchStorage> scratch_;
        Settings settings_;

        types::Result materialize(const InlineText &text) const;
    };

}
