#pragma once

#include "core/constants.hpp"

#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>

namespace vtrack::hash {

// Hex SHA-256 of `input`, truncated to `length` characters (at most 64).
[[nodiscard]] auto digest_hex(std::string_view input, std::size_t length = constants::limits::fingerprint_length) -> std::string;

// Fingerprint of an ordered field tuple. Fields are joined with the ASCII unit
// separator so ("ab", "c") and ("a", "bc") never collide.
[[nodiscard]] auto fingerprint(std::span<const std::string_view> fields, std::size_t length = constants::limits::fingerprint_length) -> std::string;
[[nodiscard]] auto fingerprint(std::initializer_list<std::string_view> fields, std::size_t length = constants::limits::fingerprint_length) -> std::string;

// Riot ids are case-insensitive, so the handle and tag are folded first.
[[nodiscard]] auto player_fingerprint(std::string_view handle, std::string_view tag, std::uint64_t owner_id) -> std::string;

} // namespace vtrack::hash
