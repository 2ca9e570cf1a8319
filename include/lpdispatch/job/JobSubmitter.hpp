#pragma once

#include "lpdispatch/job/CommandBuilder.hpp"
#include "lpdispatch/process/ProcessRunner.hpp"
#include "lpdispatch/storage/ScratchStorage.hpp"

#include <memory>

namespace lpdispatch::job {

    /**
     * @class JobSubmitter
     * @brief Costruisce il comando di un job e lo esegue una volta, in modo sincrono.
     *
     * Nessun retry e nessun polling dello stato: il risultato e' Success, oppure
     * EmptyPath / ScratchIoError (comando mai eseguito), oppure SubmissionFailed.
     *
     * Con cleanupScratch attivo il file di scratch del testo inline viene eliminato
     * appena il processo termina: lp e lpr lo copiano nello spool durante la chiamata.
     */
    class JobSubmitter {
    public:
        JobSubmitter(std::shared_ptr<storage::ScratchStorage> scratch,
                     std::shared_ptr<process::ProcessRunner> runner,
                     bool cleanupScratch = true,
                     CommandBuilder::Settings settings = {});

        types::Result submit(const JobOptions &options, const Content &content);

        /**
         * @brief Costruisce il comando senza eseguirlo (dry run).
         *
         * Il file di scratch eventualmente creato resta al chiamante.
         */
        types::Result preview(const JobOptions &options, const Content &content) const;

    private:
        std::shared_ptr<storage::ScratchStorage> scratch_;
        std::shared_ptr<process::ProcessRunner> runner_;
        CommandBuilder builder_;
        bool cleanupScratch_;
    };

} // namespace lpdispatch::job
