#include "essay_anonymizer/redact/mask_resolver.hpp"
#include "essay_anonymizer/common/constants.hpp"
#include "essay_anonymizer/core/error_codes.hpp"
#include <openssl/evp.h>
#include <utility>

namespace essay_anonymizer {
namespace redact {

namespace {

void replaceAll(std::string& text, const std::string& placeholder, const std::string& value) {
    size_t pos = 0;
    while ((pos = text.find(placeholder, pos)) != std::string::npos) {
        text.replace(pos, placeholder.size(), value);
        pos += value.size();
    }
}

bool isBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string trimmed(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

}

MaskConfig MaskConfig::create(std::string literal,
                              const std::string& mask_template,
                              bool hash_enabled,
                              std::string salt,
                              int hash_length) {
    using core::RedactError;
    using core::RedactErrorCode;

    MaskConfig config;
    config.literal = std::move(literal);
    config.hash_enabled = hash_enabled;
    config.salt = std::move(salt);
    config.hash_length = hash_length;

    if (!isBlank(mask_template)) {
        config.mask_template = trimmed(mask_template);
    }

    if (!hash_enabled) {
        return config;
    }

    if (hash_length < 1 || hash_length > constants::mask::MAX_HASH_LENGTH) {
        throw RedactError(RedactErrorCode::CONFIGURATION_ERROR,
                          "hash length must be between 1 and 64",
                          common::makeContext("MaskResolver").with("hash_length", std::to_string(hash_length)));
    }

    if (!config.mask_template) {
        config.mask_template = constants::mask::DEFAULT_HASH_TEMPLATE;
    } else if (config.mask_template->find(constants::mask::HASH_PLACEHOLDER) == std::string::npos) {
        throw RedactError(RedactErrorCode::CONFIGURATION_ERROR,
                          "mask template must include {hash} when hashing is enabled",
                          common::makeContext("MaskResolver").with("template", *config.mask_template));
    }

    return config;
}

MaskResolver::MaskResolver(MaskConfig config)
    : config_(std::move(config)) {}

std::string MaskResolver::resolve(const std::string& label, int index, const std::string& match) const {
    if (!config_.mask_template) {
        return config_.literal;
    }

    std::string token = applyTemplate(*config_.mask_template, label, index);
    if (config_.hash_enabled) {
        replaceAll(token, constants::mask::HASH_PLACEHOLDER,
                   hashFragment(config_.salt, match, config_.hash_length));
    }
    return token;
}

std::string applyTemplate(const std::string& mask_template, const std::string& label, int index) {
    std::string out = mask_template;
    replaceAll(out, constants::mask::LABEL_PLACEHOLDER, label);
    replaceAll(out, constants::mask::INDEX_PLACEHOLDER, std::to_string(index));
    return out;
}

std::string hashFragment(const std::string& salt, const std::string& value, int length) {
    const std::string input = salt + value;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    EVP_Digest(input.data(), input.size(), digest, &digest_len, EVP_sha256(), nullptr);

    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        out += hex[digest[i] >> 4];
        out += hex[digest[i] & 0x0f];
    }

    if (length > 0 && static_cast<size_t>(length) < out.size()) {
        out.resize(static_cast<size_t>(length));
    }
    return out;
}

}}
