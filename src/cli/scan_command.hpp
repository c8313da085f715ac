#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>
#include <vector>

namespace threat_guard {
namespace cli {

class ScanCommand : public MainCommand {
public:
    ScanCommand() = default;

    void setup(CLI::App* subcommand);
    int execute();

private:
    std::vector<std::string> files_;
    size_t max_bytes_ = 0;
    int threads_ = 4;
    bool quiet_ = false;
};

}}
