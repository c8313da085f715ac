#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>
#include <vector>

namespace threat_guard {
namespace cli {

class ClassifyCommand : public MainCommand {
public:
    ClassifyCommand() = default;

    void setup(CLI::App* subcommand);
    int execute();

private:
    std::vector<std::string> targets_;
};

}}
