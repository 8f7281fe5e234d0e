#include "main_command.hpp"
#include "essay_anonymizer/common/config.hpp"
#include "essay_anonymizer/common/logger.hpp"
#include "essay_anonymizer/redact/pattern_filter.hpp"

namespace essay_anonymizer {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

bool MainCommand::validateArguments() const {
    return true;
}

void MainCommand::addPatternOptions(CLI::App* subcommand) {
    subcommand->add_option("--names-file", names_file_,
                           "File with names to redact, one per line")
                           ->check(CLI::ExistingFile);
    subcommand->add_option("--custom-regex", custom_regex_,
                           "Custom regex to redact (repeatable)")
                           ->multi_option_policy(CLI::MultiOptionPolicy::TakeAll);
    subcommand->add_option("--disable", disable_,
                           "Disable a pattern label, or a prefix with a trailing * (repeatable)")
                           ->multi_option_policy(CLI::MultiOptionPolicy::TakeAll);
}

redact::DetectorSet MainCommand::buildActiveDetectors() const {
    const auto& config = common::Config::instance().global();

    std::vector<std::string> names;
    if (!names_file_.empty()) {
        names = redact::loadNames(names_file_);
    }

    auto detectors = redact::buildDetectorSet(custom_regex_, names);

    std::vector<std::string> requests = config.redact.disable;
    requests.insert(requests.end(), disable_.begin(), disable_.end());

    auto active = redact::filterDetectors(detectors, requests);
    common::Logger::instance().debug("[Patterns] Active detectors | total={} | active={} | disable_requests={}",
                                     detectors.size(), active.size(), requests.size());
    return active;
}

}}
