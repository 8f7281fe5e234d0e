#include "essay_anonymizer/redact/redaction_pass.hpp"
#include "essay_anonymizer/redact/luhn.hpp"
#include "essay_anonymizer/common/constants.hpp"

namespace essay_anonymizer {
namespace redact {

namespace {

std::string runDetector(const std::string& content,
                        const Detector& detector,
                        const MaskResolver& resolver,
                        std::map<std::string, int>& counts) {
    const bool luhn_gated = detector.label == constants::labels::CREDIT_CARD;

    std::string out;
    out.reserve(content.size());

    int index = 0;
    auto last = content.cbegin();
    for (std::sregex_iterator it(content.begin(), content.end(), detector.pattern), end; it != end; ++it) {
        const auto& match = *it;
        if (match.length(0) == 0) {
            continue;
        }

        std::string raw = match.str(0);
        if (luhn_gated && !isLuhnValidToken(raw)) {
            continue;
        }

        ++index;
        ++counts[detector.label];

        out.append(last, match[0].first);
        out += resolver.resolve(detector.label, index, raw);
        last = match[0].second;
    }

    if (index == 0) {
        return content;
    }
    out.append(last, content.cend());
    return out;
}

}

PassResult applyPass(const std::string& original,
                     const DetectorSet& detectors,
                     const MaskResolver& resolver,
                     const PassOptions& options) {
    PassResult result;
    result.content = original;

    for (const auto& detector : detectors) {
        result.content = runDetector(result.content, detector, resolver, result.counts);
    }

    for (const auto& [label, count] : result.counts) {
        result.total += count;
    }

    if (options.skip_clean && result.total == 0) {
        result.skipped = true;
    }
    result.should_write = !options.preview_only && !result.skipped;
    return result;
}

}}
