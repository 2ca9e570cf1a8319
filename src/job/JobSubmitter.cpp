#include "lpdispatch/job/JobSubmitter.hpp"
#include "lpdispatch/logger/Logger.hpp"

#include <utility>

namespace lpdispatch::job {
    JobSubmitter::JobSubmitter(std::shared_ptr<storage::ScratchStorage> scratch,
                               std::shared_ptr<process::ProcessRunner> runner,
                               bool cleanupScratch,
                               CommandBuilder::Settings settings)
            : scratch_(std::move(scratch)),
              runner_(std::move(runner)),
              builder_(scratch_, std::move(settings)),
              cleanupScratch_(cleanupScratch) {
    }

    types::Result JobSubmitter::submit(const JobOptions &options, const Content &content) {
        types::Result built = builder_.build(options, content);
        if (!built.isSuccess()) {
            Logger::logError("[JobSubmitter] Build failed (" + types::resultCodeToString(built.code) + "): " +
                             built.message);
            return built;
        }

        Logger::logInfo("[JobSubmitter] Submitting: " + *built.commandLine);
        bool submitted = runner_ && runner_->run(*built.commandLine);

        if (built.scratchPath && cleanupScratch_ && scratch_) {
            scratch_->discard(*built.scratchPath);
            built.scratchPath.reset();
        }

        if (!submitted) {
            Logger::logError("[JobSubmitter] Submission failed for " +
                             toolVariantToString(options.variant) + " job");
            types::Result failed = types::Result::submissionFailed();
            failed.commandLine = built.commandLine;
            failed.scratchPath = built.scratchPath;
            return failed;
        }

        Logger::logInfo("[JobSubmitter] Job submitted");
        built.message = "Job submitted";
        return built;
    }

    types::Result JobSubmitter::preview(const JobOptions &options, const Content &content) const {
        types::Result built = builder_.build(options, content);
        if (built.isSuccess() && built.scratchPath) {
            Logger::logInfo("[JobSubmitter] Dry run keeps scratch file " + built.scratchPath->string() +
                            ", delete it when no longer needed");
        }
        return built;
    }
} // namespace lpdispatch::job
