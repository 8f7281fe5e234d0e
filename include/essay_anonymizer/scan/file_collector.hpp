#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace essay_anonymizer {
namespace scan {

struct CollectOptions {
    std::set<std::string> extensions;      // lower-case, dot-prefixed; empty accepts all
    std::set<std::string> exclude_dirs;    // directory base names
    std::set<std::string> exclude_paths;   // normalised paths relative to the root
};

std::set<std::string> parseExtensions(const std::string& raw);
std::set<std::string> buildExcludeDirs(const std::vector<std::string>& values);
std::set<std::string> buildExcludePaths(const std::vector<std::string>& values);

// A regular file input yields exactly that file. A directory is walked
// recursively and the result is sorted by path.
// Throws RedactError(INPUT_NOT_FOUND | COLLECTION_FAILED).
std::vector<std::filesystem::path> collectFiles(const std::filesystem::path& input,
                                                const CollectOptions& options);

}}
