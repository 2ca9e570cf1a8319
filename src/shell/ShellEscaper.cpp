#include "lpdispatch/shell/ShellEscaper.hpp"

namespace lpdispatch::shell {

    namespace {
        constexpr char QUOTE = '\'';
        constexpr const char *ESCAPED_QUOTE = "'\"'\"'";
    }

    std::string ShellEscaper::escape(const std::string &value) {
        if (value.empty()) {
            return "''";
        }

        std::string result;
        result.reserve(value.length() + 2);

        result += QUOTE;
        for (char c: value) {
            if (c == QUOTE) {
                result += ESCAPED_QUOTE;
            } else {
                result += c;
            }
        }
        result += QUOTE;

        return result;
    }

    std::string ShellEscaper::escapePath(const std::filesystem::path &path) {
        return escape(path.string());
    }

} // namespace lpdispatch::shell
