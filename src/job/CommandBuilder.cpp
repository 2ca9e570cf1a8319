#include "lpdispatch/job/CommandBuilder.hpp"
#include "lpdispatch/job/ToolDialect.hpp"
#include "lpdispatch/logger/Logger.hpp"
#include "lpdispatch/shell/ShellEscaper.hpp"
#include "lpdispatch/types/Error.hpp"

#include <sstream>
#include <utility>

namespace lpdispatch::job {

    using shell::ShellEscaper;

    CommandBuilder::CommandBuilder(std::shared_ptr<storage::ScratchStorage> scratch)
            : CommandBuilder(std::move(scratch), Settings{}) {
    }

    CommandBuilder::CommandBuilder(std::shared_ptr<storage::ScratchStorage> scratch, Settings settings)
            : scratch_(std::move(scratch)), settings_(std::move(settings)) {
    }

    types::Result CommandBuilder::build(const JobOptions &options, const Content &content) const {
        const ToolDialect &dialect = dialectFor(options.variant);
        std::ostringstream oss;

        oss << dialect.program;

        if (options.destination) {
            oss << " " << dialect.destinationFlag << " " << ShellEscaper::escape(*options.destination);
        }

        if (options.copies) {
            oss << " " << dialect.copiesFlag << (dialect.copiesAttached ? "" : " ") << *options.copies;
        }

        if (options.title) {
            oss << " " << dialect.titleFlag << " " << ShellEscaper::escape(*options.title);
        }

        // Raw on purpose: the spooler parses key=value itself
        for (const auto &[key, value]: options.jobOptions) {
            oss << " -o " << key << "=" << value;
        }

        std::optional<std::filesystem::path> scratchPath;

        if (const auto *file = content.asFileReference()) {
            if (file->path.empty()) {
                Logger::logError("[CommandBuilder] Refusing file reference with empty path");
                return types::Result::emptyPath();
            }
            oss << " " << ShellEscaper::escapePath(file->path);
        } else if (const auto *text = content.asInlineText()) {
            types::Result materialized = materialize(*text);
            if (!materialized.isSuccess()) {
                return materialized;
            }
            scratchPath = materialized.scratchPath;
            oss << " " << ShellEscaper::escapePath(*scratchPath);
        }

        std::string commandLine = oss.str();
        Logger::logDebug("[CommandBuilder] Built: " + commandLine);
        return types::Result::built(commandLine, std::move(scratchPath));
    }

    types::Result CommandBuilder::materialize(const InlineText &text) const {
        if (!scratch_) {
            Logger::logError("[CommandBuilder] Inline text requires a scratch storage");
            return types::Result::scratchIoError("No scratch storage configured");
        }

        std::filesystem::path path;
        try {
            path = scratch_->newPath(settings_.scratchPrefix, settings_.scratchExtension);
        } catch (const types::ScratchIoException &e) {
            Logger::logError("[CommandBuilder] " + std::string(e.what()));
            return types::Result::scratchIoError(e.what());
        }

        types::Result written = scratch_->writeAll(path, text.text);
        if (!written.isSuccess()) {
            scratch_->discard(path);
            return written;
        }

        types::Result result = types::Result::success("Scratch file written");
        result.scratchPath = path;
        return result;
    }

} // namespace lpdispatch::job
