#pragma once

#include "threat_guard/common/types.hpp"
#include <CLI/CLI.hpp>
#include <optional>
#include <string>

namespace threat_guard {
namespace cli {

class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();

    bool wasCalled() const { return was_called_; }
    void printVersion() const;

protected:
    CLI::App* subcommand_ = nullptr;
    bool was_called_ = false;
    bool json_output_ = false;

    void bindCallback(CLI::App* subcommand);

    static std::optional<common::Bytes> readFileBytes(const std::string& path, size_t max_bytes = 0);
    static bool useColors();
    static std::string riskColor(common::RiskLevel level);
};

}}
