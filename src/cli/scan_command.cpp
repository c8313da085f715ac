#include "scan_command.hpp"
#include "threat_guard/common/config.hpp"
#include "threat_guard/common/logger.hpp"
#include "threat_guard/format/json_formatter.hpp"
#include "threat_guard/scan/content_scanner.hpp"
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <chrono>
#include <iomanip>
#include <iostream>

namespace threat_guard {
namespace cli {

namespace {

struct FileScan {
    std::string path;
    bool read_ok = false;
    size_t file_size = 0;
    scan::ContentAnalysisResult result;
    int64_t scan_time_ms = 0;
};

}

void ScanCommand::setup(CLI::App* subcommand) {
    subcommand->add_option("files", files_, "Files to analyze")
               ->required();
    subcommand->add_option("--max-bytes", max_bytes_,
                          "Bytes inspected per file (default: from config)");
    subcommand->add_option("-t,--threads", threads_, "Number of threads")
               ->check(CLI::Range(1, 64));
    subcommand->add_flag("--json", json_output_, "Output as JSON");
    subcommand->add_flag("-q,--quiet", quiet_, "Only print files at HIGH risk or above");
    bindCallback(subcommand);
}

int ScanCommand::execute() {
    const auto& config = common::Config::instance().global().scanner;
    size_t max_bytes = max_bytes_ > 0 ? max_bytes_ : config.max_analysis_bytes;

    scan::ContentThreatScanner scanner(config);
    std::vector<FileScan> scans(files_.size());

    common::Logger::instance().info("[Scan] Starting | files={} | threads={} | max_bytes={}",
                                    files_.size(), threads_, max_bytes);

    tbb::task_arena arena(threads_);
    arena.execute([&] {
        tbb::parallel_for(size_t(0), files_.size(), [&](size_t i) {
            FileScan& entry = scans[i];
            entry.path = files_[i];

            auto bytes = readFileBytes(entry.path, max_bytes);
            if (!bytes) {
                return;
            }

            auto start = std::chrono::steady_clock::now();
            entry.read_ok = true;
            entry.file_size = bytes->size();
            entry.result = scanner.analyze(common::asView(*bytes), max_bytes);
            entry.scan_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();
        });
    });

    bool any_threat = false;
    bool any_error = false;
    nlohmann::json output = nlohmann::json::array();
    bool colors = !json_output_ && useColors();

    for (const auto& entry : scans) {
        if (!entry.read_ok) {
            any_error = true;
            if (json_output_) {
                output.push_back({{"file", entry.path}, {"error", "unreadable"}});
            } else {
                std::cerr << entry.path << ": ERROR (unreadable)\n";
            }
            continue;
        }

        bool elevated = common::rank(entry.result.risk_level) >= common::rank(common::RiskLevel::HIGH);
        if (elevated) {
            any_threat = true;
        }

        if (json_output_) {
            output.push_back(format::JsonFormatter::format(entry.path, entry.result));
            continue;
        }

        if (quiet_ && !elevated) {
            continue;
        }

        std::string risk = common::to_string(entry.result.risk_level);
        std::cout << entry.path << ": ";
        if (colors) {
            std::cout << riskColor(entry.result.risk_level) << risk << "\033[0m";
        } else {
            std::cout << risk;
        }
        std::cout << " [" << scan::to_string(entry.result.recommendation) << ", "
                  << common::formatBytes(entry.file_size) << ", "
                  << entry.scan_time_ms << "ms]\n";

        for (const auto& evidence : entry.result.evidence) {
            std::cout << "  - " << evidence.kind << " @" << evidence.byte_offset
                      << " (" << std::fixed << std::setprecision(2) << evidence.confidence << ") "
                      << evidence.description << "\n";
        }
    }

    if (json_output_) {
        std::cout << output.dump(2) << std::endl;
    }

    common::Logger::instance().info("[Scan] Completed | files={} | threats={} | errors={}",
                                    scans.size(), any_threat, any_error);

    if (any_threat) {
        return 1;
    }
    return any_error ? 2 : 0;
}

}}
