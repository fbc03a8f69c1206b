#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace vtrack::constants {

// UI Text
namespace text {
inline constexpr std::string_view unknown_command = "Unknown command";
inline constexpr std::string_view invalid_riot_id = "Invalid format. Please use `username#tag` (e.g. `AGreenFruit#PEPE`)";
inline constexpr std::string_view invalid_region = "Unknown region. Use one of: eu, na, latam, br, ap, kr";
inline constexpr std::string_view storage_failed = "An error occurred while talking to the database. Please try again later.";
inline constexpr std::string_view no_players = "You are not tracking anyone yet. Use `/add` to start.";
inline constexpr std::string_view not_tracking = "You are not tracking that player";
inline constexpr std::string_view no_recorded_match = "No match has been recorded for that player yet";

inline constexpr std::string_view ok_prefix = "✅ ";
inline constexpr std::string_view err_prefix = "❌ ";
inline constexpr std::string_view info_prefix = "ℹ️ ";
} // namespace text

// HenrikDev Valorant API
namespace api {
inline constexpr std::string_view base_url = "https://api.henrikdev.xyz/valorant/v4/matches";
inline constexpr std::string_view mode = "competitive";
// Only the most recent match is ever requested.
inline constexpr int page_size = 1;
} // namespace api

// Database layout
namespace db {
inline constexpr std::string_view schema = "valorant";
inline constexpr std::string_view players_table = "valorant.players";
inline constexpr std::string_view matches_table = "valorant.match_stats";
} // namespace db

// Match result labels
namespace result {
inline constexpr std::string_view victory = "Victory";
inline constexpr std::string_view defeat = "Defeat";
inline constexpr std::string_view draw = "Draw";
} // namespace result

// Embed colours
namespace colors {
inline constexpr std::uint32_t green = 0x57F287;
inline constexpr std::uint32_t red = 0xED4245;
inline constexpr std::uint32_t grey = 0x95A5A6;
} // namespace colors

// Limits
namespace limits {
inline constexpr std::size_t fingerprint_length = 16;
inline constexpr int team_size = 5;
inline constexpr std::chrono::seconds delivery_timeout{15};
} // namespace limits

} // namespace vtrack::constants
