#include "lpdispatch/process/impl/ShellProcessRunner.hpp"
#include "lpdispatch/logger/Logger.hpp"

#include <boost/process.hpp>
#include <system_error>
#include <utility>
#include <vector>

namespace bp = boost::process;

namespace lpdispatch::process {
    ShellProcessRunner::ShellProcessRunner(std::string shellPath)
            : shellPath_(std::move(shellPath)) {
    }

    bool ShellProcessRunner::run(const std::string &commandLine) {
        std::vector<std::string> args{"-c", commandLine};
        std::error_code ec;

        Logger::logDebug("[ShellProcessRunner] " + shellPath_ + " -c " + commandLine);

        bp::child child(bp::exe = shellPath_, bp::args = args, ec);
        if (ec) {
            Logger::logError("[ShellProcessRunner] Failed to spawn " + shellPath_ + ": " + ec.message());
            return false;
        }

        child.wait(ec);
        if (ec) {
            Logger::logError("[ShellProcessRunner] Wait failed: " + ec.message());
            return false;
        }

        int exitCode = child.exit_code();
        if (exitCode != 0) {
            Logger::logWarning("[ShellProcessRunner] Command exited with status " + std::to_string(exitCode));
            return false;
        }

        return true;
    }
} // namespace lpdispatch::process
