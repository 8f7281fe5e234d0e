#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>

namespace essay_anonymizer {
namespace cli {

class PatternsCommand : public MainCommand {
public:
    PatternsCommand();

    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

private:
    bool was_called_;
    bool json_output_ = false;
    bool show_regex_ = false;
};

}}
