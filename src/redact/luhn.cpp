#include "essay_anonymizer/redact/luhn.hpp"
#include "essay_anonymizer/common/constants.hpp"

namespace essay_anonymizer {
namespace redact {

bool isLuhnValid(const std::string& digits) {
    if (digits.size() < constants::luhn::MIN_DIGITS || digits.size() > constants::luhn::MAX_DIGITS) {
        return false;
    }

    int sum = 0;
    bool double_it = false;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        char ch = *it;
        if (ch < '0' || ch > '9') {
            return false;
        }
        int digit = ch - '0';
        if (double_it) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }
        sum += digit;
        double_it = !double_it;
    }
    return sum % 10 == 0;
}

bool isLuhnValidToken(const std::string& token) {
    std::string digits;
    digits.reserve(token.size());
    for (char ch : token) {
        if (ch != ' ' && ch != '-') {
            digits += ch;
        }
    }
    return isLuhnValid(digits);
}

}}
