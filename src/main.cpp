#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "audio/audio_preprocessor.hpp"
#include "audio/ffmpeg_audio_decoder.hpp"
#include "core/capability_registry.hpp"
#include "core/transcription_service.hpp"
#include "diar/spectral_diarizer.hpp"
#include "export/transcript_exporter.hpp"
#include "stt/whisper_transcriber.hpp"
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

using namespace speechjobs;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] <audio file>...\n"
              << "Options:\n"
              << "  --config <path>         Configuration file (default: config/speechjobs.json)\n"
              << "  --language <code>       Language hint, e.g. en (default: auto-detect)\n"
              << "  --model <size>          tiny, base, small, medium or large\n"
              << "  --diarize               Label speakers\n"
              << "  --speakers <n>          Expected number of speakers\n"
              << "  --format <fmt>          txt, json or srt (default: txt)\n"
              << "  --output <path>         Output file, or directory when several inputs are given\n"
              << "  --speaker-name <id=name> Display name for a speaker label (repeatable)\n"
              << "  --timeout <seconds>     Cancel jobs still running after this long (default: none)\n"
              << "  --keep-jobs             Do not delete finished jobs\n"
              << "  --help, -h              Show this help message\n";
}

std::string outputPathFor(const std::string& output, const std::string& input, size_t inputCount,
                          exporting::ExportFormat format) {
    if (output.empty()) {
        return "";
    }
    if (inputCount == 1 && !std::filesystem::is_directory(output)) {
        return output;
    }
    std::filesystem::path name = std::filesystem::path(input).stem();
    name += "." + exporting::exportFormatToString(format);
    return (std::filesystem::path(output) / name).string();
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        utils::Logger::initialize();

        std::string configPath = "config/speechjobs.json";
        core::JobOptions options;
        bool modelGiven = false;
        std::string formatName = "txt";
        std::string output;
        exporting::SpeakerNames speakerNames;
        std::vector<std::string> inputs;
        int timeoutSeconds = 0;
        bool keepJobs = false;

        // Parse command line arguments
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw utils::ValidationException("Missing value for option", arg);
                }
                return argv[++i];
            };

            if (arg == "--config") {
                configPath = next();
            } else if (arg == "--language") {
                options.language = next();
            } else if (arg == "--model") {
                std::string size = next();
                auto parsed = core::parseModelSize(size);
                if (!parsed) {
                    throw utils::ValidationException("Unknown model size", size);
                }
                options.model_size = *parsed;
                modelGiven = true;
            } else if (arg == "--diarize") {
                options.enable_diarization = true;
            } else if (arg == "--speakers") {
                options.num_speakers = std::stoi(next());
            } else if (arg == "--format") {
                formatName = next();
            } else if (arg == "--output") {
                output = next();
            } else if (arg == "--speaker-name") {
                std::string mapping = next();
                auto eq = mapping.find('=');
                if (eq == std::string::npos || eq == 0) {
                    throw utils::ValidationException("Expected <id>=<name>", mapping);
                }
                speakerNames[mapping.substr(0, eq)] = mapping.substr(eq + 1);
            } else if (arg == "--timeout") {
                timeoutSeconds = std::stoi(next());
            } else if (arg == "--keep-jobs") {
                keepJobs = true;
            } else if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else if (!arg.empty() && arg[0] == '-') {
                std::cerr << "Unknown option: " << arg << std::endl;
                printUsage(argv[0]);
                return 2;
            } else {
                inputs.push_back(arg);
            }
        }

        if (inputs.empty()) {
            printUsage(argv[0]);
            return 2;
        }
        auto format = exporting::parseExportFormat(formatName);

        // Load configuration
        auto config = utils::ConfigLoader::load(configPath);
        utils::Logger::setLevel(config.log_level);

        auto validation = utils::ConfigLoader::validate(config);
        for (const auto& warning : validation.warnings) {
            utils::Logger::warn("Config: " + warning);
        }
        if (!validation.isValid) {
            for (const auto& error : validation.errors) {
                std::cerr << "Config error: " << error << std::endl;
            }
            return 1;
        }

        if (!modelGiven) {
            auto configured = core::parseModelSize(config.whisper.model_size);
            if (!configured) {
                throw utils::ValidationException("Unknown model size in configuration", config.whisper.model_size);
            }
            options.model_size = *configured;
        }

        // Capabilities
        auto registry = std::make_shared<core::CapabilityRegistry>(config.capabilities);
        const auto whisperSettings = config.whisper;
        registry->registerTranscriberFactory([whisperSettings](const core::CapabilityKey& key) {
            stt::WhisperModelConfig modelConfig;
            modelConfig.models_path = whisperSettings.models_path;
            modelConfig.model_size = key.model;
            modelConfig.device = key.device;
            modelConfig.threads = whisperSettings.threads;
            return std::make_shared<stt::WhisperTranscriber>(modelConfig);
        });
        registry->registerDiarizerFactory([](const core::CapabilityKey&) {
            return std::make_shared<diar::SpectralDiarizer>();
        });

        auto preprocessor = std::make_shared<audio::AudioPreprocessor>(
            config.audio, config.max_upload_size_mb, config.processed_dir);
        preprocessor->addDecoder(std::make_shared<audio::WavAudioDecoder>());
        preprocessor->addDecoder(std::make_shared<audio::FfmpegAudioDecoder>());

        core::TranscriptionService service(config, registry, preprocessor);
        service.start();

        // Submit everything first so jobs run in parallel
        std::vector<std::pair<std::string, std::string>> jobs; // input, job id
        int failures = 0;
        for (const auto& input : inputs) {
            try {
                auto receipt = service.submit(input, std::filesystem::path(input).filename().string(), options);
                jobs.emplace_back(input, receipt.job_id);
                std::cerr << input << ": job " << receipt.job_id << " "
                          << core::jobStatusToString(receipt.status) << std::endl;
            } catch (const utils::SpeechJobsException& e) {
                std::cerr << input << ": " << utils::error_utils::errorKindToCode(e.kind())
                          << ": " << e.what() << std::endl;
                ++failures;
            }
        }

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeoutSeconds);
        for (const auto& entry : jobs) {
            const auto& input = entry.first;
            const auto& jobId = entry.second;

            auto job = service.status(jobId);
            while (!job->isTerminal()) {
                if (timeoutSeconds > 0 && std::chrono::steady_clock::now() >= deadline) {
                    service.cancel(jobId);
                }
                job = service.progress().waitForTerminal(jobId, std::chrono::seconds(1));
            }

            if (job->status == core::JobStatus::FAILED) {
                std::cerr << input << ": " << job->error->code << ": " << job->error->message << std::endl;
                ++failures;
            } else {
                for (const auto& warning : job->result->warnings) {
                    std::cerr << input << ": warning: " << warning << std::endl;
                }

                std::string rendered = service.exportResult(jobId, format, speakerNames);
                std::string target = outputPathFor(output, input, inputs.size(), format);
                if (target.empty()) {
                    std::cout << rendered << std::endl;
                } else {
                    std::ofstream file(target, std::ios::binary);
                    if (!file || !(file << rendered)) {
                        std::cerr << input << ": cannot write " << target << std::endl;
                        ++failures;
                    } else {
                        std::cerr << input << ": wrote " << target << std::endl;
                    }
                }
            }

            if (!keepJobs) {
                service.remove(jobId);
            }
        }

        service.stop();
        return failures == 0 ? 0 : 1;

    } catch (const utils::SpeechJobsException& e) {
        std::cerr << "Error: " << utils::error_utils::errorKindToCode(e.kind()) << ": " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
