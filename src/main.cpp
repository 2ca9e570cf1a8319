#include "lpdispatch/application/Cli.hpp"
#include "lpdispatch/config/ConfigManager.hpp"
#include "lpdispatch/job/JobSubmitter.hpp"
#include "lpdispatch/logger/Logger.hpp"
#include "lpdispatch/process/impl/ShellProcessRunner.hpp"
#include "lpdispatch/storage/impl/TempScratchStorage.hpp"

#include <iostream>
#include <memory>
#include <string>

namespace po = boost::program_options;

using namespace lpdispatch;
using namespace lpdispatch::application;

namespace {
    void printUsage(const Cli &cli) {
        std::cout << "Usage: lpdispatch [options] (--text TEXT | FILE)\n\n" << cli.visibleOptions() << std::endl;
    }

    int run(int argc, char *argv[]) {
        Cli cli;

        try {
            po::variables_map vm = cli.parse(argc, argv);

            if (vm.count("help")) {
                printUsage(cli);
                return EXIT_OK;
            }

            auto &configManager = config::ConfigManager::getInstance();
            configManager.loadFromFile(vm["config"].as<std::string>());
            configManager.loadFromEnv();

            auto validation = configManager.validate();
            if (!validation.isValid) {
                for (const auto &error: validation.errors) {
                    Logger::logError("[Config] " + error);
                }
                return EXIT_USAGE;
            }

            auto loggingConfig = configManager.getLoggingConfig();
            Logger::init(loggingConfig.fileEnabled, loggingConfig.directory);
            Logger::setMinLevel(vm.count("verbose") ? LogLevel::Debug : Logger::parseLevel(loggingConfig.level));

            auto submitConfig = configManager.getSubmitConfig();
            auto scratchConfig = configManager.getScratchConfig();

            job::JobOptions options = Cli::buildJobOptions(vm, submitConfig);
            job::Content content = Cli::buildContent(vm);

            auto scratch = std::make_shared<storage::TempScratchStorage>(scratchConfig.directory);
            auto runner = std::make_shared<process::ShellProcessRunner>(submitConfig.shell);

            job::CommandBuilder::Settings settings;
            settings.scratchPrefix = scratchConfig.prefix;
            settings.scratchExtension = scratchConfig.extension;

            bool cleanup = scratchConfig.cleanupAfterSubmit && !vm.count("keep-scratch");
            job::JobSubmitter submitter(scratch, runner, cleanup, settings);

            if (vm.count("dry-run") || submitConfig.dryRun) {
                types::Result preview = submitter.preview(options, content);
                if (!preview.isSuccess()) {
                    std::cerr << "lpdispatch: " << preview.message << std::endl;
                    return Cli::exitCodeFor(preview);
                }
                std::cout << *preview.commandLine << std::endl;
                return EXIT_OK;
            }

            types::Result result = submitter.submit(options, content);
            if (!result.isSuccess()) {
                std::cerr << "lpdispatch: " << result.message << std::endl;
            }
            return Cli::exitCodeFor(result);
        } catch (const po::error &ex) {
            std::cerr << "lpdispatch: " << ex.what() << std::endl;
            printUsage(cli);
            return EXIT_USAGE;
        } catch (const std::exception &ex) {
            Logger::logError("Fatal error: " + std::string(ex.what()));
            return EXIT_USAGE;
        }
    }
}

int main(int argc, char *argv[]) {
    int exitCode = run(argc, argv);
    Logger::shutdown();
    return exitCode;
}
