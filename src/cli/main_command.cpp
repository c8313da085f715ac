#include "main_command.hpp"
#include "threat_guard/common/constants.hpp"
#include "threat_guard/common/logger.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <unistd.h>

namespace threat_guard {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

void MainCommand::printVersion() const {
    std::cout << constants::version::getFullVersion() << "\n";
    std::cout << "Upload and request threat detection toolkit\n";
}

void MainCommand::bindCallback(CLI::App* subcommand) {
    subcommand_ = subcommand;
    subcommand->callback([this]() { was_called_ = true; });
}

std::optional<common::Bytes> MainCommand::readFileBytes(const std::string& path, size_t max_bytes) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        common::Logger::instance().error("[CLI] Not a regular file | path={}", path);
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        common::Logger::instance().error("[CLI] Cannot open file | path={}", path);
        return std::nullopt;
    }

    auto file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        common::Logger::instance().error("[CLI] Cannot stat file | path={} | error={}", path, ec.message());
        return std::nullopt;
    }

    size_t to_read = static_cast<size_t>(file_size);
    if (max_bytes > 0 && to_read > max_bytes) {
        to_read = max_bytes;
    }

    common::Bytes bytes(to_read);
    if (to_read > 0 && !file.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(to_read))) {
        common::Logger::instance().error("[CLI] Read failed | path={}", path);
        return std::nullopt;
    }
    return bytes;
}

bool MainCommand::useColors() {
    return isatty(STDOUT_FILENO);
}

std::string MainCommand::riskColor(common::RiskLevel level) {
    switch (level) {
        case common::RiskLevel::CRITICAL: return "\033[1;31m";
        case common::RiskLevel::HIGH: return "\033[31m";
        case common::RiskLevel::MEDIUM: return "\033[33m";
        case common::RiskLevel::LOW: return "\033[32m";
        default: return "";
    }
}

}}
