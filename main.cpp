#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/AgeAdapter.hpp"
#include "application/PipelineOrchestrator.hpp"
#include "application/SafetyEngine.hpp"
#include "application/TextUtils.hpp"
#include "application/stages/AgeAdapterStage.hpp"
#include "application/stages/ContentFilterStage.hpp"
#include "domain/RandomSource.hpp"
#include "domain/SafetyErrors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/SafetyIncidentStoreFs.hpp"

namespace fs = std::filesystem;
using namespace sunflower;

namespace {

struct Options {
    std::string configPath;
    std::string dataDir;
    std::optional<unsigned int> seed;
    bool dumpConfig = false;
};

void PrintUsage() {
    std::cerr << "Usage: sunflower [--config <file>] [--data <dir>] [--seed <n>] [--dump-config]\n"
              << "Reads turns from stdin, one per line:\n"
              << "  session|child_name|age|input|draft_response\n";
}

bool ParseArgs(int argc, char** argv, Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](const char* flag) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "[Main] " << flag << " needs a value" << std::endl;
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--config") {
            auto v = next("--config");
            if (!v) return false;
            options.configPath = *v;
        } else if (arg == "--data") {
            auto v = next("--data");
            if (!v) return false;
            options.dataDir = *v;
        } else if (arg == "--seed") {
            auto v = next("--seed");
            if (!v) return false;
            try {
                options.seed = static_cast<unsigned int>(std::stoul(*v));
            } catch (const std::exception&) {
                std::cerr << "[Main] Invalid seed: " << *v << std::endl;
                return false;
            }
        } else if (arg == "--dump-config") {
            options.dumpConfig = true;
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else {
            std::cerr << "[Main] Unknown argument: " << arg << std::endl;
            return false;
        }
    }
    return true;
}

std::vector<std::string> SplitFields(const std::string& line, std::size_t maxFields) {
    std::vector<std::string> fields;
    std::size_t start = 0;
    while (fields.size() + 1 < maxFields) {
        std::size_t bar = line.find('|', start);
        if (bar == std::string::npos) break;
        fields.push_back(line.substr(start, bar - start));
        start = bar + 1;
    }
    fields.push_back(line.substr(start));
    return fields;
}

std::shared_ptr<const application::AppConfig> LoadConfig(const Options& options) {
    if (!options.configPath.empty()) {
        return infrastructure::ConfigLoader::LoadFromFile(options.configPath);
    }
    fs::path userConfig = infrastructure::PathUtils::GetDefaultConfigFile();
    if (fs::exists(userConfig)) {
        return infrastructure::ConfigLoader::LoadFromFile(userConfig.string());
    }
    std::cout << "[Main] Using built-in configuration." << std::endl;
    return infrastructure::ConfigLoader::LoadDefaults();
}

} // namespace

int main(int argc, char** argv) {
    Options options;
    if (!ParseArgs(argc, argv, options)) {
        PrintUsage();
        return 2;
    }

    if (options.dumpConfig) {
        std::cout << infrastructure::ConfigLoader::DefaultConfigJson().dump(2) << std::endl;
        return 0;
    }

    std::shared_ptr<const application::AppConfig> config;
    try {
        config = LoadConfig(options);
    } catch (const domain::ConfigurationError& e) {
        std::cerr << "[Main] " << e.what() << std::endl;
        return 1;
    }

    std::shared_ptr<domain::RandomSource> random;
    if (options.seed) {
        random = std::make_shared<domain::SeededRandomSource>(*options.seed);
    } else {
        random = std::make_shared<domain::FirstChoiceSource>();
    }

    fs::path dataDir = options.dataDir.empty() ? infrastructure::PathUtils::GetAppDataDir() : fs::path(options.dataDir);
    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    auto incidents = std::make_shared<infrastructure::SafetyIncidentStoreFs>(dataDir.string(), persistence);

    std::unique_ptr<application::PipelineOrchestrator> orchestrator;
    std::shared_ptr<application::SafetyEngine> engine;
    try {
        engine = std::make_shared<application::SafetyEngine>(config, random);
        auto adapter = std::make_shared<const application::AgeAdapter>(config, random);
        auto safetyStage = std::make_shared<application::stages::ContentFilterStage>(config, engine, incidents);
        std::vector<std::shared_ptr<domain::PipelineStage>> stages{
            std::make_shared<application::stages::AgeAdapterStage>(config, adapter)};
        orchestrator = std::make_unique<application::PipelineOrchestrator>(config, safetyStage, stages);
    } catch (const domain::ConfigurationError& e) {
        std::cerr << "[Main] " << e.what() << std::endl;
        return 1;
    }

    std::cout << "[Main] Sunflower pipeline ready. Incidents are stored under " << dataDir << std::endl;

    int exitCode = 0;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (application::TextUtils::IsBlank(line) || line[0] == '#') continue;

        std::vector<std::string> fields = SplitFields(line, 5);
        if (fields.size() < 4) {
            std::cerr << "[Main] Skipping line without session|child_name|age|input" << std::endl;
            exitCode = 1;
            continue;
        }

        domain::PipelineContext context;
        context.sessionId = application::TextUtils::Trim(fields[0]);
        context.childName = application::TextUtils::Trim(fields[1]);
        context.profileId = context.childName;
        try {
            context.childAge = std::stoi(fields[2]);
        } catch (const std::exception&) {
            std::cerr << "[Main] Age is not a number: " << fields[2] << std::endl;
            exitCode = 1;
            continue;
        }
        context.inputText = fields[3];
        if (fields.size() > 4) context.responseText = fields[4];

        try {
            application::PipelineOutcome outcome = orchestrator->process(std::move(context));
            std::cout << "[" << application::StatusToString(outcome.status) << "] " << outcome.response << std::endl;
        } catch (const domain::StageExecutionError& e) {
            std::cerr << "[Main] Stage '" << e.stageName() << "' failed: " << e.detail() << std::endl;
            std::cout << "[error] " << e.what() << std::endl;
            exitCode = 1;
        }
    }

    persistence->stop();

    auto stats = engine->getStatistics();
    std::cerr << "[Main] Checks: " << stats.totalChecks << ", blocked: " << stats.blocked
              << ", parent alerts: " << stats.parentAlerts << std::endl;
    if (persistence->failedWrites() > 0) {
        std::cerr << "[Main] " << persistence->failedWrites() << " incident writes failed." << std::endl;
        exitCode = 1;
    }
    return exitCode;
}
