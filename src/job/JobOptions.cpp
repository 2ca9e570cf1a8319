#include "lpdispatch/job/JobOptions.hpp"

#include <utility>

namespace lpdispatch::job {
    JobOptionsBuilder &JobOptionsBuilder::destination(const std::string &destination) {
        options_.destination = destination;
        return *this;
    }

    JobOptionsBuilder &JobOptionsBuilder::destinationIf(const std::optional<std::string> &destination) {
        options_.destination = destination;
        return *this;
    }

    JobOptionsBuilder &JobOptionsBuilder::clearDestination() {
        options_.destination.reset();
        return *this;
    }

    JobOptionsBuilder &JobOptionsBuilder::copies(uint32_t copies) {
        options_.copies = copies;
        return *this;
    }

    JobOptionsBuilder &JobOptionsBuilder::clearCopies() {
        options_.copies.reset();
        return *this;
    }

    JobOptionsBuilder &JobOptionsBuilder::title(const std::string &title) {
        options_.title = title;
        return *this;
    }

    JobOptionsBuilder &JobOptionsBuilder::clearTitle() {
        options_.title.reset();
        return *this;
    }

    JobOptionsBuilder &JobOptionsBuilder::jobOptions(std::map<std::string, std::string> jobOptions) {
        options_.jobOptions = std::move(jobOptions);
        return *this;
    }

    JobOptionsBuilder &JobOptionsBuilder::jobOption(const std::string &key, const std::string &value) {
        options_.jobOptions[key] = value;
        return *this;
    }

    JobOptionsBuilder &JobOptionsBuilder::variant(ToolVariant variant) {
        options_.variant = variant;
        return *this;
    }

    JobOptionsBuilder &JobOptionsBuilder::useLpr(bool useLpr) {
        options_.variant = useLpr ? ToolVariant::Lpr : ToolVariant::Lp;
        return *this;
    }

    JobOptions JobOptionsBuilder::build() const {
        return options_;
    }

    std::optional<std::pair<std::string, std::string>> parseJobOption(const std::string &assignment) {
        auto pos = assignment.find('=');
        if (pos == std::string::npos || pos == 0) {
            return std::nullopt;
        }
        return std::make_pair(assignment.substr(0, pos), assignment.substr(pos + 1));
    }
} // namespace lpdispatch::job
