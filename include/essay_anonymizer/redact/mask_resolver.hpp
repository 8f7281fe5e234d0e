#pragma once

#include <optional>
#include <string>

namespace essay_anonymizer {
namespace redact {

struct MaskConfig {
    std::string literal;
    std::optional<std::string> mask_template;
    bool hash_enabled = false;
    std::string salt;
    int hash_length = 0;

    // Validates and normalises the inputs. A blank template counts as none;
    // hashing without a template selects the default hash template.
    // Throws RedactError(CONFIGURATION_ERROR).
    static MaskConfig create(std::string literal,
                             const std::string& mask_template,
                             bool hash_enabled,
                             std::string salt,
                             int hash_length);
};

class MaskResolver {
public:
    explicit MaskResolver(MaskConfig config);

    // Replacement token for one match; index is 1-based per label within a
    // single document pass.
    std::string resolve(const std::string& label, int index, const std::string& match) const;

    const MaskConfig& config() const { return config_; }

private:
    MaskConfig config_;
};

std::string applyTemplate(const std::string& mask_template, const std::string& label, int index);

// First `length` lowercase hex characters of SHA-256(salt || value).
std::string hashFragment(const std::string& salt, const std::string& value, int length);

}}
