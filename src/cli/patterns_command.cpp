#include "patterns_command.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace essay_anonymizer {
namespace cli {

PatternsCommand::PatternsCommand() : was_called_(false) {}

void PatternsCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    addPatternOptions(subcommand);

    subcommand->add_flag("--regex", show_regex_,
                        "Show the regular expression behind each label");
    subcommand->add_flag("--json", json_output_,
                        "Output as JSON");

    subcommand->callback([this]() { was_called_ = true; });
}

bool PatternsCommand::wasCalled() const {
    return was_called_;
}

int PatternsCommand::execute() {
    auto detectors = buildActiveDetectors();

    if (json_output_) {
        nlohmann::json json = nlohmann::json::array();
        for (const auto& detector : detectors) {
            json.push_back({{"label", detector.label}, {"pattern", detector.source}});
        }
        std::cout << json.dump(2) << "\n";
        return 0;
    }

    for (const auto& detector : detectors) {
        std::cout << detector.label;
        if (show_regex_) {
            std::cout << "\t" << detector.source;
        }
        std::cout << "\n";
    }
    return 0;
}

}}
