#include "validate_command.hpp"
#include "threat_guard/common/config.hpp"
#include "threat_guard/common/logger.hpp"
#include "threat_guard/format/json_formatter.hpp"
#include "threat_guard/image/image_codec.hpp"
#include "threat_guard/upload/artifact_paths.hpp"
#include "threat_guard/upload/validation_pipeline.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace threat_guard {
namespace cli {

void ValidateCommand::setup(CLI::App* subcommand) {
    subcommand->add_option("file", file_path_, "Candidate upload file")
               ->required()
               ->check(CLI::ExistingFile);
    subcommand->add_option("--mime", mime_type_, "Declared MIME type");
    subcommand->add_option("--caller", caller_id_, "Caller identifier");
    subcommand->add_option("--ip", ip_, "Caller IP address");
    subcommand->add_option("--user-agent", user_agent_, "Caller user agent");
    subcommand->add_option("-o,--output", output_path_, "Write sanitized image to PATH");
    subcommand->add_option("--storage-root", storage_root_,
                          "Store the sanitized image below DIR as an avatar artifact");
    subcommand->add_option("--previous", previous_artifact_,
                          "Previous artifact path to remove after a successful store");
    subcommand->add_flag("--json", json_output_, "Output as JSON");
    bindCallback(subcommand);
}

int ValidateCommand::execute() {
    const auto& config = common::Config::instance().global();

    auto bytes = readFileBytes(file_path_);
    if (!bytes) {
        std::cerr << "Error: Cannot read file: " << file_path_ << std::endl;
        return 2;
    }

    auto sink = std::make_shared<events::SecurityEventSink>(
        std::make_shared<events::LoggerEventWriter>(), config.events);
    auto codec = std::make_shared<image::OpenCvImageCodec>();
    upload::UploadValidationPipeline pipeline(config.upload, config.scanner, codec, sink);

    upload::UploadFile file;
    file.name = std::filesystem::path(file_path_).filename().string();
    file.declared_mime_type = mime_type_;
    file.size = bytes->size();
    file.bytes = std::move(*bytes);

    upload::CallerContext context;
    context.caller_id = caller_id_;
    context.ip = ip_;
    context.user_agent = user_agent_;

    auto verdict = pipeline.validate(file, context);

    nlohmann::json output = format::JsonFormatter::format(verdict);
    int exit_code = verdict.accepted ? 0 : 1;

    if (verdict.accepted && verdict.sanitized_bytes) {
        if (!output_path_.empty() && !writeOutput(*verdict.sanitized_bytes)) {
            exit_code = 2;
        }

        if (!storage_root_.empty()) {
            upload::DirectoryArtifactStorage storage(storage_root_);
            std::string artifact = upload::ArtifactPaths::makeStoragePath(caller_id_);

            if (storage.store(artifact, *verdict.sanitized_bytes)) {
                output["artifact"] = artifact;
                auto removal = upload::removePreviousArtifact(storage, previous_artifact_, caller_id_, sink.get());
                output["previous_artifact"] = upload::to_string(removal);
            } else {
                std::cerr << "Error: Cannot store artifact below " << storage_root_ << std::endl;
                exit_code = 2;
            }
        }
    }

    size_t flushed = sink->flushQueue();
    if (flushed > 0) {
        common::Logger::instance().debug("[Validate] Flushed buffered events | count={}", flushed);
    }

    if (json_output_) {
        std::cout << output.dump(2) << std::endl;
        return exit_code;
    }

    if (verdict.accepted) {
        std::cout << file_path_ << ": ACCEPTED [" << scan::to_string(verdict.detected_type) << ", "
                  << verdict.width << "x" << verdict.height << "]";
        if (verdict.sanitized_bytes) {
            std::cout << " sanitized=" << common::formatBytes(verdict.sanitized_bytes->size());
        }
        if (output.contains("artifact")) {
            std::cout << " artifact=" << output["artifact"].get<std::string>();
        }
        std::cout << "\n";
    } else {
        std::cout << file_path_ << ": REJECTED ["
                  << core::RejectionKindHelper::toString(*verdict.rejection_reason) << ", "
                  << common::to_string(verdict.severity) << "] " << verdict.message << "\n";
    }

    return exit_code;
}

bool ValidateCommand::writeOutput(const common::Bytes& bytes) const {
    std::ofstream out(output_path_, std::ios::binary | std::ios::trunc);
    if (!out) {
        std::cerr << "Error: Cannot open output: " << output_path_ << std::endl;
        return false;
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        std::cerr << "Error: Write failed: " << output_path_ << std::endl;
        return false;
    }
    common::Logger::instance().info("[Validate] Sanitized output written | path={} | size={}",
                                    output_path_, bytes.size());
    return true;
}

}}
