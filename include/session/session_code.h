///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file session_code.h
 * @brief Remote viewing session codes ("XXXX-XXXX")
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <cstddef>
#include <random>
#include <string>

namespace FlightBridge {

/// No 0/O or 1/I, so codes survive being read aloud
constexpr const char* SESSION_CODE_ALPHABET = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
constexpr size_t SESSION_CODE_LENGTH = 9;

std::string GenerateSessionCode();
std::string GenerateSessionCode(std::mt19937& rng);

/// Exactly four alphabet characters, '-', four alphabet characters
bool IsValidSessionCode(const std::string& code);

} // namespace FlightBridge
