#pragma once

#include "../common/types.hpp"
#include "../redact/detector.hpp"
#include "../redact/mask_resolver.hpp"
#include <filesystem>
#include <optional>
#include <vector>

namespace essay_anonymizer {
namespace scan {

struct ProcessOptions {
    std::filesystem::path input_root;
    bool input_is_directory = false;
    std::optional<std::filesystem::path> output_root;
    bool dry_run = false;
    bool skip_clean = false;
    int threads = 4;
};

class DocumentProcessor {
public:
    DocumentProcessor(const redact::DetectorSet& detectors,
                      const redact::MaskResolver& resolver,
                      ProcessOptions options);

    // Never throws for per-document I/O problems; those are recorded on the
    // outcome with counts cleared.
    common::RedactionOutcome process(const std::filesystem::path& file) const;

    // Outcomes are returned in the order of `files`.
    std::vector<common::RedactionOutcome> processAll(const std::vector<std::filesystem::path>& files) const;

    std::optional<std::filesystem::path> targetFor(const std::filesystem::path& file) const;

private:
    const redact::DetectorSet& detectors_;
    const redact::MaskResolver& resolver_;
    ProcessOptions options_;
};

}}
