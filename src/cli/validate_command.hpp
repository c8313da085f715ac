#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace threat_guard {
namespace cli {

class ValidateCommand : public MainCommand {
public:
    ValidateCommand() = default;

    void setup(CLI::App* subcommand);
    int execute();

private:
    std::string file_path_;
    std::string mime_type_;
    std::string caller_id_ = "cli";
    std::string ip_ = "127.0.0.1";
    std::string user_agent_ = "threat-guard-cli";
    std::string output_path_;
    std::string storage_root_;
    std::string previous_artifact_;

    bool writeOutput(const common::Bytes& bytes) const;
};

}}
