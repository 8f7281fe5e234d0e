#pragma once

#include "detector.hpp"
#include "mask_resolver.hpp"
#include <map>
#include <string>

namespace essay_anonymizer {
namespace redact {

struct PassOptions {
    bool preview_only = false;
    bool skip_clean = false;
};

struct PassResult {
    std::string content;
    std::map<std::string, int> counts;
    int total = 0;
    bool skipped = false;
    bool should_write = false;
};

// Runs every detector, in order, over the progressively redacted content.
// Credit-card candidates failing the Luhn check are left verbatim and zero
// length matches are ignored. No I/O.
PassResult applyPass(const std::string& original,
                     const DetectorSet& detectors,
                     const MaskResolver& resolver,
                     const PassOptions& options = {});

}}
