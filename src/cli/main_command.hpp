#pragma once

#include "essay_anonymizer/redact/detector.hpp"
#include <CLI/CLI.hpp>
#include <string>
#include <vector>

namespace essay_anonymizer {
namespace cli {

class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();

    virtual bool validateArguments() const;

protected:
    CLI::App* subcommand_ = nullptr;

    std::string names_file_;
    std::vector<std::string> custom_regex_;
    std::vector<std::string> disable_;

    // --names-file, --custom-regex, --disable
    void addPatternOptions(CLI::App* subcommand);

    // Detector set after config and command-line disable requests are applied.
    redact::DetectorSet buildActiveDetectors() const;
};

}}
