#include "essay_anonymizer/scan/document_processor.hpp"
#include "essay_anonymizer/redact/redaction_pass.hpp"
#include "essay_anonymizer/common/constants.hpp"
#include "essay_anonymizer/common/logger.hpp"
#include "essay_anonymizer/core/error_codes.hpp"
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>

namespace essay_anonymizer {
namespace scan {

namespace {

using core::RedactErrorCode;

void markFailed(common::RedactionOutcome& outcome, RedactErrorCode code, const std::string& message) {
    outcome.counts.clear();
    outcome.total = 0;
    outcome.skipped = false;
    outcome.error_code = code;
    outcome.error_message = message;
    outcome.error_context = common::makeContext("Processor")
        .with("file", outcome.source)
        .with("error_code", core::RedactErrorCodeHelper::toString(code));
}

}

DocumentProcessor::DocumentProcessor(const redact::DetectorSet& detectors,
                                     const redact::MaskResolver& resolver,
                                     ProcessOptions options)
    : detectors_(detectors), resolver_(resolver), options_(std::move(options)) {}

std::optional<std::filesystem::path> DocumentProcessor::targetFor(const std::filesystem::path& file) const {
    if (!options_.output_root) {
        return std::nullopt;
    }

    std::filesystem::path rel = options_.input_is_directory
        ? file.lexically_relative(options_.input_root)
        : file.filename();
    if (rel.empty()) {
        rel = file.filename();
    }
    return *options_.output_root / rel;
}

common::RedactionOutcome DocumentProcessor::process(const std::filesystem::path& file) const {
    common::RedactionOutcome outcome;
    outcome.source = file.string();

    auto target = targetFor(file);
    if (target) {
        outcome.target = target->string();
    }

    std::string content;
    {
        std::ifstream in(file, std::ios::binary);
        if (!in) {
            markFailed(outcome, RedactErrorCode::DOCUMENT_READ_FAILED, "failed to open " + file.string());
            return outcome;
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        if (in.bad()) {
            markFailed(outcome, RedactErrorCode::DOCUMENT_READ_FAILED, "failed to read " + file.string());
            return outcome;
        }
        content = buffer.str();
    }

    redact::PassOptions pass_options;
    pass_options.preview_only = options_.dry_run;
    pass_options.skip_clean = options_.skip_clean;

    redact::PassResult result;
    try {
        result = redact::applyPass(content, detectors_, resolver_, pass_options);
    } catch (const std::regex_error& e) {
        markFailed(outcome, RedactErrorCode::DOCUMENT_REDACT_FAILED, e.what());
        return outcome;
    }

    outcome.counts = std::move(result.counts);
    outcome.total = result.total;
    outcome.skipped = result.skipped;
    if (result.skipped) {
        outcome.target.reset();
    }

    if (result.should_write && target) {
        std::error_code ec;
        std::filesystem::create_directories(target->parent_path(), ec);
        if (ec) {
            markFailed(outcome, RedactErrorCode::DOCUMENT_WRITE_FAILED,
                       "failed to create " + target->parent_path().string() + ": " + ec.message());
            return outcome;
        }

        std::ofstream out(*target, std::ios::binary | std::ios::trunc);
        out.write(result.content.data(), static_cast<std::streamsize>(result.content.size()));
        if (!out) {
            markFailed(outcome, RedactErrorCode::DOCUMENT_WRITE_FAILED, "failed to write " + target->string());
            return outcome;
        }
    }

    common::Logger::instance().debug("[Processor] Document processed | file={} | total={} | skipped={}",
                                     outcome.source, outcome.total, outcome.skipped);
    return outcome;
}

std::vector<common::RedactionOutcome> DocumentProcessor::processAll(
    const std::vector<std::filesystem::path>& files) const {
    std::vector<common::RedactionOutcome> outcomes(files.size());

    int threads = std::clamp(options_.threads, 1, constants::limits::MAX_THREADS);
    common::Logger::instance().debug("[Processor] Parallel mode | threads={} | files={}", threads, files.size());

    tbb::task_arena arena(threads);
    arena.execute([&] {
        tbb::parallel_for(size_t(0), files.size(), [&](size_t i) {
            try {
                outcomes[i] = process(files[i]);
            } catch (const std::exception& e) {
                outcomes[i].source = files[i].string();
                markFailed(outcomes[i], RedactErrorCode::DOCUMENT_REDACT_FAILED, e.what());
                common::Logger::instance().error("[Processor] Exception | {}",
                                                 common::formatContext(*outcomes[i].error_context));
            }
        });
    });

    for (const auto& outcome : outcomes) {
        if (outcome.failed()) {
            common::Logger::instance().warn("[Processor] Document failed | file={} | error={}",
                                            outcome.source, outcome.error_message.value_or(""));
        }
    }
    return outcomes;
}

}}
