///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file session_code.cpp
 * @brief Session code generation and validation
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "session/session_code.h"

#include <cstring>

namespace FlightBridge {

std::string GenerateSessionCode(std::mt19937& rng) {
    const size_t alphabet_size = std::strlen(SESSION_CODE_ALPHABET);
    std::uniform_int_distribution<size_t> pick(0, alphabet_size - 1);

    std::string code(SESSION_CODE_LENGTH, '-');
    for (size_t i = 0; i < SESSION_CODE_LENGTH; ++i) {
        if (i != 4) {
            code[i] = SESSION_CODE_ALPHABET[pick(rng)];
        }
    }
    return code;
}

std::string GenerateSessionCode() {
    std::random_device seed;
    std::mt19937 rng(seed());
    return GenerateSessionCode(rng);
}

bool IsValidSessionCode(const std::string& code) {
    if (code.size() != SESSION_CODE_LENGTH) {
        return false;
    }
    for (size_t i = 0; i < code.size(); ++i) {
        if (i == 4) {
            if (code[i] != '-') return false;
        } else if (code[i] == '\0' || std::strchr(SESSION_CODE_ALPHABET, code[i]) == nullptr) {
            return false;
        }
    }
    return true;
}

} // namespace FlightBridge
