#pragma once

#include "../ProcessRunner.hpp"

#include <string>

namespace lpdispatch::process {

/**
 * @brief ProcessRunner che lancia "<shell> -c <commandLine>" con Boost.Process.
 *
 * stdin/stdout/stderr sono ereditati, nessun output viene catturato.
 */
    class ShellProcessRunner : public ProcessRunner {
    public:
        explicit ShellProcessRunner(std::string shellPath = "/bin/sh");

        bool run(const std::string &commandLine) override;

        const std::string &shellPath() const { return shellPath_; }

    private:
        std::string shellPath_;
    };

} // namespace lpdispatch::process
