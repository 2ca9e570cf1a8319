#include "lpdispatch/application/Cli.hpp"
#include "lpdispatch/types/Error.hpp"

#include <limits>
#include <vector>

namespace po = boost::program_options;

namespace lpdispatch::application {
    Cli::Cli() : visible_("Options") {
        visible_.add_options()
                ("help,h", "show this help")
                ("config,c", po::value<std::string>()->default_value("lpdispatch.json"), "configuration file")
                ("variant", po::value<std::string>(), "command dialect: lp or lpr")
                ("lpr", "shorthand for --variant lpr")
                ("destination,d", po::value<std::string>(), "printer or queue name")
                ("copies,n", po::value<std::string>(), "number of copies (1 or more)")
                ("title,t", po::value<std::string>(), "job title")
                ("option,o", po::value<std::vector<std::string>>()->composing(), "job option KEY=VALUE, repeatable")
                ("text", po::value<std::string>(), "print this text instead of a file")
                ("dry-run", "print the command line without running it")
                ("keep-scratch", "do not delete the scratch file of --text after submission")
                ("verbose,v", "debug logging");

        po::options_description hidden;
        hidden.add_options()("file", po::value<std::string>(), "file to print");

        all_.add(visible_).add(hidden);
        positional_.add("file", 1);
    }

    po::variables_map Cli::parse(int argc, const char *const argv[]) const {
        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(all_).positional(positional_).run(), vm);
        po::notify(vm);
        return vm;
    }

    job::JobOptions Cli::buildJobOptions(const po::variables_map &vm, const config::SubmitConfig &submitConfig) {
        job::JobOptionsBuilder builder;

        auto variant = job::toolVariantFromString(submitConfig.variant);
        if (!variant) {
            throw types::ConfigException("unknown variant \"" + submitConfig.variant + "\"");
        }

        if (vm.count("variant")) {
            const auto &name = vm["variant"].as<std::string>();
            variant = job::toolVariantFromString(name);
            if (!variant) {
                throw po::invalid_option_value(name);
            }
            if (vm.count("lpr") && *variant != job::ToolVariant::Lpr) {
                throw po::error("--lpr conflicts with --variant " + name);
            }
        } else if (vm.count("lpr")) {
            variant = job::ToolVariant::Lpr;
        }
        builder.variant(*variant);

        if (vm.count("destination")) {
            builder.destination(vm["destination"].as<std::string>());
        } else if (!submitConfig.destination.empty()) {
            builder.destination(submitConfig.destination);
        }

        if (vm.count("copies")) {
            builder.copies(parseCopies(vm["copies"].as<std::string>()));
        }

        if (vm.count("title")) {
            builder.title(vm["title"].as<std::string>());
        }

        if (vm.count("option")) {
            for (const auto &assignment: vm["option"].as<std::vector<std::string>>()) {
                auto parsed = job::parseJobOption(assignment);
                if (!parsed) {
                    throw po::error("job option \"" + assignment + "\" is not KEY=VALUE");
                }
                builder.jobOption(parsed->first, parsed->second);
            }
        }

        return builder.build();
    }

    job::Content Cli::buildContent(const po::variables_map &vm) {
        if (vm.count("text") == vm.count("file")) {
            throw po::error("exactly one of --text or FILE is required");
        }
        if (vm.count("text")) {
            return job::Content::text(vm["text"].as<std::string>());
        }
        return job::Content::file(vm["file"].as<std::string>());
    }

    uint32_t Cli::parseCopies(const std::string &value) {
        if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
            throw po::invalid_option_value(value);
        }

        uint64_t copies = 0;
        for (char c: value) {
            copies = copies * 10 + static_cast<uint64_t>(c - '0');
            if (copies > std::numeric_limits<uint32_t>::max()) {
                throw po::invalid_option_value(value);
            }
        }

        if (copies < 1) {
            throw po::invalid_option_value(value);
        }
        return static_cast<uint32_t>(copies);
    }

    int Cli::exitCodeFor(const types::Result &result) {
        switch (result.code) {
            case types::ResultCode::Success: return EXIT_OK;
            case types::ResultCode::SubmissionFailed: return EXIT_SUBMISSION_FAILED;
            case types::ResultCode::EmptyPath:
            case types::ResultCode::ScratchIoError:
            default: return EXIT_USAGE;
        }
    }
} // namespace lpdispatch::application
