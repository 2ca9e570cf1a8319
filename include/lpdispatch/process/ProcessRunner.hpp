#pragma once

#include <string>

namespace lpdispatch::process {

/**
 * @brief Interfaccia per l'esecuzione di una command line tramite shell.
 */
    class ProcessRunner {
    public:
        virtual ~ProcessRunner() = default;

        /**
         * @brief Esegue la command line e attende la fine del processo.
         * @param commandLine Command line gia' correttamente quotata.
         * @return true se il processo termina con exit status 0.
         */
        virtual bool run(const std::string &commandLine) = 0;
    };

} // namespace lpdispatch::process
