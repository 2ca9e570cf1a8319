#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <utility>

namespace lpdispatch::types {

    enum class ResultCode {
        Success,
        EmptyPath,
        ScratchIoError,
        SubmissionFailed
    };

    /**
     * @brief Esito di una build o di una submission.
     *
     * commandLine e scratchPath sono valorizzati solo sul successo di una build.
     */
    struct Result {
        ResultCode code;
        std::string message;
        std::optional<std::string> commandLine;
        std::optional<std::filesystem::path> scratchPath;

        inline bool isSuccess() const {
            return code == ResultCode::Success;
        }

        inline bool isEmptyPath() const {
            return code == ResultCode::EmptyPath;
        }

        inline bool isScratchIoError() const {
            return code == ResultCode::ScratchIoError;
        }

        inline bool isSubmissionFailed() const {
            return code == ResultCode::SubmissionFailed;
        }

        static inline Result success(const std::string &msg = "Success") {
            return {ResultCode::Success, msg, std::nullopt, std::nullopt};
        }

        static inline Result built(const std::string &commandLine,
                                   std::optional<std::filesystem::path> scratchPath = std::nullopt) {
            return {ResultCode::Success, "Command built", commandLine, std::move(scratchPath)};
        }

        static inline Result emptyPath() {
            return {ResultCode::EmptyPath, "File reference has an empty path", std::nullopt, std::nullopt};
        }

        static inline Result scratchIoError(const std::string &msg = "Scratch file I/O failed") {
            return {ResultCode::ScratchIoError, msg, std::nullopt, std::nullopt};
        }

        static inline Result submissionFailed(const std::string &msg = "Submission failed") {
            return {ResultCode::SubmissionFailed, msg, std::nullopt, std::nullopt};
        }
    };

    inline std::string resultCodeToString(ResultCode code) {
        switch (code) {
            case ResultCode::Success: return "Success";
            case ResultCode::EmptyPath: return "EmptyPath";
            case ResultCode::ScratchIoError: return "ScratchIoError";
            case ResultCode::SubmissionFailed: return "SubmissionFailed";
            default: return "Unknown";
        }
    }

}
