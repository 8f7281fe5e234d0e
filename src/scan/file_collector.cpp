#include "essay_anonymizer/scan/file_collector.hpp"
#include "essay_anonymizer/common/logger.hpp"
#include "essay_anonymizer/core/error_codes.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace essay_anonymizer {
namespace scan {

namespace {

using core::RedactError;
using core::RedactErrorCode;

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string stripSlashes(std::string s) {
    while (s.size() > 1 && s.back() == '/') {
        s.pop_back();
    }
    return s;
}

std::string relativeKey(const std::filesystem::path& path, const std::filesystem::path& root) {
    return stripSlashes(path.lexically_relative(root).lexically_normal().generic_string());
}

}

std::set<std::string> parseExtensions(const std::string& raw) {
    std::set<std::string> result;
    std::stringstream ss(raw);
    std::string part;
    while (std::getline(ss, part, ',')) {
        std::string ext = toLower(trim(part));
        if (ext.empty()) {
            continue;
        }
        if (ext.front() != '.') {
            ext.insert(ext.begin(), '.');
        }
        result.insert(ext);
    }
    return result;
}

std::set<std::string> buildExcludeDirs(const std::vector<std::string>& values) {
    std::set<std::string> result;
    for (const auto& raw : values) {
        std::string trimmed = stripSlashes(trim(raw));
        if (trimmed.empty()) {
            continue;
        }
        std::string base = std::filesystem::path(trimmed).filename().string();
        if (!base.empty()) {
            result.insert(base);
        }
    }
    return result;
}

std::set<std::string> buildExcludePaths(const std::vector<std::string>& values) {
    std::set<std::string> result;
    for (const auto& raw : values) {
        std::string trimmed = trim(raw);
        if (trimmed.empty()) {
            continue;
        }
        std::string cleaned = stripSlashes(std::filesystem::path(trimmed).lexically_normal().generic_string());
        while (!cleaned.empty() && cleaned.front() == '/') {
            cleaned.erase(cleaned.begin());
        }
        if (cleaned.empty() || cleaned == ".") {
            continue;
        }
        result.insert(cleaned);
    }
    return result;
}

std::vector<std::filesystem::path> collectFiles(const std::filesystem::path& input,
                                                const CollectOptions& options) {
    std::error_code ec;
    auto status = std::filesystem::status(input, ec);
    if (ec || !std::filesystem::exists(status)) {
        throw RedactError(RedactErrorCode::INPUT_NOT_FOUND,
                          "failed to access input path: " + input.string(),
                          common::makeContext("Collector").with("path", input.string()));
    }

    if (!std::filesystem::is_directory(status)) {
        return {input};
    }

    const std::filesystem::path root = input.lexically_normal();
    std::vector<std::filesystem::path> files;
    size_t excluded = 0;

    std::filesystem::recursive_directory_iterator it(root, ec);
    if (ec) {
        throw RedactError(RedactErrorCode::COLLECTION_FAILED,
                          "failed to collect files: " + ec.message(),
                          common::makeContext("Collector").with("path", root.string()));
    }

    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw RedactError(RedactErrorCode::COLLECTION_FAILED,
                              "failed to collect files: " + ec.message(),
                              common::makeContext("Collector").with("path", root.string()));
        }

        const auto& entry = *it;
        std::error_code entry_ec;
        const bool is_dir = entry.is_directory(entry_ec);

        if (options.exclude_paths.count(relativeKey(entry.path(), root))) {
            ++excluded;
            if (is_dir) {
                it.disable_recursion_pending();
            }
            continue;
        }

        if (is_dir) {
            if (options.exclude_dirs.count(entry.path().filename().string())) {
                ++excluded;
                it.disable_recursion_pending();
            }
            continue;
        }

        if (!entry.is_regular_file(entry_ec)) {
            continue;
        }

        if (!options.extensions.empty() &&
            !options.extensions.count(toLower(entry.path().extension().string()))) {
            continue;
        }

        files.push_back(entry.path());
    }

    if (ec) {
        throw RedactError(RedactErrorCode::COLLECTION_FAILED,
                          "failed to collect files: " + ec.message(),
                          common::makeContext("Collector").with("path", root.string()));
    }

    std::sort(files.begin(), files.end());

    common::Logger::instance().debug("[Collector] Files collected | root={} | files={} | excluded={}",
                                     root.string(), files.size(), excluded);
    return files;
}

}}
