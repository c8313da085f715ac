#include "classify_command.hpp"
#include "threat_guard/common/logger.hpp"
#include "threat_guard/format/json_formatter.hpp"
#include "threat_guard/network/ip_classifier.hpp"
#include <iostream>

namespace threat_guard {
namespace cli {

void ClassifyCommand::setup(CLI::App* subcommand) {
    subcommand->add_option("targets", targets_, "IP addresses or URLs to classify")
               ->required();
    subcommand->add_flag("--json", json_output_, "Output as JSON");
    bindCallback(subcommand);
}

int ClassifyCommand::execute() {
    network::IPClassifier classifier;
    nlohmann::json output = nlohmann::json::array();
    bool any_blocked = false;
    bool colors = !json_output_ && useColors();

    for (const auto& target : targets_) {
        std::optional<network::IPClassification> result;
        bool is_url = target.find("://") != std::string::npos;

        if (is_url) {
            auto authority = network::parseUrlAuthority(target);
            if (!authority) {
                any_blocked = true;
                if (json_output_) {
                    output.push_back({{"address", target}, {"error", "unparseable URL"}});
                } else {
                    std::cout << target << ": invalid URL\n";
                }
                continue;
            }

            result = classifier.classifyUrlHost(target);
            if (!result) {
                if (json_output_) {
                    output.push_back({{"address", target}, {"host", authority->host}, {"ip_literal", false}});
                } else {
                    std::cout << target << ": host '" << authority->host
                              << "' is a domain name (not resolved)\n";
                }
                continue;
            }
        } else {
            result = classifier.classify(target);
        }

        if (!result->allowed_for_outbound) {
            any_blocked = true;
        }

        common::Logger::instance().debug("[Classify] Result | target={} | risk={} | allowed={}",
                                         target, common::to_string(result->risk_level),
                                         result->allowed_for_outbound);

        if (json_output_) {
            output.push_back(format::JsonFormatter::format(target, *result));
            continue;
        }

        std::string risk = common::to_string(result->risk_level);
        std::cout << target << ": ";
        if (colors) {
            std::cout << riskColor(result->risk_level) << risk << "\033[0m";
        } else {
            std::cout << risk;
        }
        std::cout << " [" << network::to_string(result->address_family) << ", "
                  << (result->allowed_for_outbound ? "allowed" : "blocked") << "] "
                  << result->reason << "\n";
    }

    if (json_output_) {
        std::cout << output.dump(2) << std::endl;
    }

    return any_blocked ? 1 : 0;
}

}}
