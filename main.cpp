#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "application/TranscriptionJobService.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/AudioUtils.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/OpenAITranscriptionAdapter.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/TranscriptStoreFs.hpp"
#include "infrastructure/WhisperCppAdapter.hpp"

namespace fs = std::filesystem;
using namespace longscribe;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitPartial = 2;

domain::CancellationToken g_cancel;

void OnSignal(int) {
    g_cancel.cancel();
}

struct CliArgs {
    std::string audioPath;
    std::string configPath;
    std::string backend;
    std::string outputDir;
    bool diarize = false;
};

void PrintUsage() {
    std::cerr << "Usage: longscribe <audio-file> [--config <settings.json>] [--backend http|whisper_cpp]\n"
              << "                  [--out <dir>] [--diarize]" << std::endl;
}

bool ParseArgs(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](std::string& target) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "--config") {
            if (!next(args.configPath)) return false;
        } else if (arg == "--backend") {
            if (!next(args.backend)) return false;
        } else if (arg == "--out") {
            if (!next(args.outputDir)) return false;
        } else if (arg == "--diarize") {
            args.diarize = true;
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        } else if (args.audioPath.empty()) {
            args.audioPath = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            return false;
        }
    }
    return !args.audioPath.empty();
}

std::shared_ptr<domain::ChunkInvoker> CreateInvoker(const infrastructure::AppConfig& config) {
    if (config.backend == "whisper_cpp") {
        std::string modelPath = config.whisperCpp.modelPath;
        if (modelPath.empty()) {
            modelPath = (infrastructure::PathUtils::GetDataHome() / "LongScribe" / "models" / "ggml-base.bin").string();
        }
        return std::make_shared<infrastructure::WhisperCppAdapter>(modelPath, config.language, config.whisperCpp.threads);
    }
    if (config.backend == "http") {
        auto apiKey = infrastructure::ConfigLoader::ResolveApiKey(config.http);
        if (!apiKey) {
            std::cerr << "[Main] Warning: " << config.http.apiKeyEnv << " is not set, sending requests without auth" << std::endl;
        }
        infrastructure::OpenAITranscriptionClient client(config.http.baseUrl, config.http.endpoint,
                                                         apiKey, config.http.readTimeoutSec);
        infrastructure::TranscriptionRequestOptions options;
        options.model = config.http.model;
        options.responseFormat = config.http.responseFormat;
        options.language = config.language;
        options.temperature = config.temperature;
        return std::make_shared<infrastructure::OpenAITranscriptionAdapter>(std::move(client), options);
    }
    throw std::invalid_argument("Unknown backend: " + config.backend);
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!ParseArgs(argc, argv, args)) {
        PrintUsage();
        return kExitError;
    }

    const std::string configPath = args.configPath.empty()
        ? infrastructure::PathUtils::DefaultSettingsPath().string()
        : args.configPath;
    auto config = infrastructure::ConfigLoader::Load(configPath);
    if (!args.backend.empty()) config.backend = args.backend;
    if (!args.outputDir.empty()) config.outputDirectory = args.outputDir;
    if (args.diarize) config.diarize = true;
    if (config.outputDirectory.empty()) {
        config.outputDirectory = infrastructure::PathUtils::GetTranscriptsDir().string();
    }

    std::signal(SIGINT, OnSignal);
    std::signal(SIGTERM, OnSignal);

    try {
        std::string error;
        auto audio = infrastructure::AudioUtils::LoadAudioFile(args.audioPath, error);
        if (!audio) {
            std::cerr << "[Main] " << error << std::endl;
            return kExitError;
        }

        auto assembler = std::make_shared<application::TranscriptAssembler>(CreateInvoker(config), config.assembler);
        auto persistence = std::make_shared<infrastructure::PersistenceService>();
        auto store = std::make_shared<infrastructure::TranscriptStoreFs>(config.outputDirectory, persistence);

        application::JobOptions jobOptions;
        jobOptions.diarize = config.diarize;
        jobOptions.resegment = config.resegment;
        jobOptions.saveToHistory = config.saveToHistory;
        jobOptions.language = config.language;
        application::TranscriptionJobService jobs(assembler, store, jobOptions);

        const std::string name = fs::path(args.audioPath).stem().string();
        auto report = jobs.run(audio, name, g_cancel, [](int folded, int total) {
            std::cerr << "[Main] Progress: " << folded << "/" << total << " chunks" << std::endl;
        });
        persistence->flush();

        if (report.outcome.state == application::AssemblyState::Cancelled) {
            std::cerr << "[Main] Cancelled" << std::endl;
            return kExitError;
        }

        std::cout << (report.diarizedText.empty() ? report.text : report.diarizedText) << std::endl;

        for (const auto& gap : report.outcome.gaps) {
            std::cerr << "[Main] Gap in chunk " << gap.chunkIndex << " [" << gap.logicalStartMs << "ms, "
                      << gap.logicalEndMs << "ms): " << gap.reason << std::endl;
        }
        if (persistence->failedWrites() > 0) {
            std::cerr << "[Main] " << persistence->failedWrites() << " output file(s) could not be written" << std::endl;
        }
        return report.outcome.isFullySuccessful() ? kExitOk : kExitPartial;
    } catch (const domain::PlanningError& e) {
        std::cerr << "[Main] " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[Main] Fatal: " << e.what() << std::endl;
    }
    return kExitError;
}
