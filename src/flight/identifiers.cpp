///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file identifiers.cpp
 * @brief Airport identifier normalization
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "flight/identifiers.h"

#include <algorithm>
#include <cctype>

namespace FlightBridge {

std::string Trim(const std::string& value) {
    const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    auto begin = std::find_if_not(value.begin(), value.end(), is_space);
    auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
    if (begin >= end) {
        return std::string();
    }
    return std::string(begin, end);
}

std::string NormalizeIdentifier(const std::string& value) {
    std::string out = Trim(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

bool IsValidIcao(const std::string& value) {
    const std::string trimmed = Trim(value);
    if (trimmed.size() < 3 || trimmed.size() > 4) {
        return false;
    }
    return std::all_of(trimmed.begin(), trimmed.end(),
                       [](unsigned char c) { return std::isalpha(c) != 0; });
}

bool IsValidString(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return c >= 0x20 && c < 0x7F; });
}

std::optional<std::string> ParseIcao(const std::optional<std::string>& value) {
    if (!value || !IsValidIcao(*value)) {
        return std::nullopt;
    }
    return NormalizeIdentifier(*value);
}

std::optional<std::string> NormalizeOptional(const std::optional<std::string>& value) {
    if (!value) {
        return std::nullopt;
    }
    std::string normalized = NormalizeIdentifier(*value);
    if (normalized.empty()) {
        return std::nullopt;
    }
    return normalized;
}

} // namespace FlightBridge
