#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <variant>

namespace lpdispatch::job {

    struct InlineText {
        std::string text;
    };

    struct FileReference {
        std::filesystem::path path;
    };

    /**
     * @brief Contenuto da stampare: testo inline o un file esistente.
     *
     * Il testo inline non ha un path finche' non viene materializzato nello scratch storage.
     */
    class Content {
    public:
        static Content text(std::string text) {
            return Content(InlineText{std::move(text)});
        }

        static Content file(std::filesystem::path path) {
            return Content(FileReference{std::move(path)});
        }

        bool isInlineText() const {
            return std::holds_alternative<InlineText>(value_);
        }

        bool isFileReference() const {
            return std::holds_alternative<FileReference>(value_);
        }

        const InlineText *asInlineText() const {
            return std::get_if<InlineText>(&value_);
        }

        const FileReference *asFileReference() const {
            return std::get_if<FileReference>(&value_);
        }

    private:
        explicit Content(std::variant<InlineText, FileReference> value) : value_(std::move(value)) {}

        std::variant<InlineText, FileReference> value_;
    };
}
