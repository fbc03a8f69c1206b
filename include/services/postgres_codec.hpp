#pragma once

#include "core/utils.hpp"
#include "models/match.hpp"
#include "models/player.hpp"

#include <libpq-fe.h>

#include <array>
#include <charconv>
#include <string>
#include <vector>

// Text-format encoding of rows exchanged with PostgreSQL. No connection needed.
namespace vtrack::pg {

inline constexpr std::string_view player_columns = "handle, tag, discord_id, region, fingerprint, EXTRACT(EPOCH FROM created_at)::BIGINT";

inline constexpr std::string_view match_columns = "match_id, handle, tag, agent, game_score, kills, deaths, assists, damage_delta, headshot_percentage, "
																									"adr, acs, team_placement, map_name, match_result, EXTRACT(EPOCH FROM created_at)::BIGINT";

// Shortest representation that reads back to the same double.
[[nodiscard]] inline auto exact(double v) -> std::string { return std::format("{}", v); }

[[nodiscard]] inline auto epoch_of(type::timestamp tp) -> std::string { return std::to_string(tp.time_since_epoch().count()); }

template <typename T>
[[nodiscard]] auto parse_number(const PGresult *res, int row, int col) -> std::expected<T, type::error>
{
	std::string_view text{PQgetvalue(res, row, col)};
	T value{};
	auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (ec != std::errc{} || ptr != text.data() + text.size()) {
		return std::unexpected(type::error{std::format("column {} holds '{}', not a number", PQfname(res, col), text)});
	}
	return value;
}

// $1..$7: handle, tag, discord_id, region, fingerprint, account_key, created_at epoch
[[nodiscard]] auto player_params(const tracked_player &player) -> std::array<std::string, 7>;

// $1..$18: match_id, handle, tag, account_key, agent, game_score, kills, deaths, assists, kd_ratio,
// damage_delta, headshot_percentage, adr, acs, team_placement, map_name, match_result, created_at epoch
[[nodiscard]] auto match_params(const match_record &match) -> std::array<std::string, 18>;

// Rows selected with `player_columns`.
[[nodiscard]] auto read_players(const PGresult *res) -> std::expected<std::vector<tracked_player>, type::error>;

// One row selected with `match_columns`.
[[nodiscard]] auto read_match(const PGresult *res, int row) -> std::expected<match_record, type::error>;

} // namespace vtrack::pg
