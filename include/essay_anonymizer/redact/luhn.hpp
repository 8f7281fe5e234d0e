#pragma once

#include <string>

namespace essay_anonymizer {
namespace redact {

// Mod-10 check over a bare digit string of 13 to 19 digits.
bool isLuhnValid(const std::string& digits);

// Strips spaces and hyphens from a candidate card token, then checks it.
bool isLuhnValidToken(const std::string& token);

}}
