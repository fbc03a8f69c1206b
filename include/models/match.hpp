#pragma once

#include "core/constants.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <cmath>
#include <optional>

namespace vtrack {

class match_record {
public:
	std::string match_id;
	std::string player_name;
	std::string player_tag;
	std::string agent;
	std::string game_score;
	int kills{};
	int deaths{};
	int assists{};
	int damage_delta{};
	double headshot_percentage{};
	double adr{};
	double acs{};
	int team_placement{1};
	std::string map_name;
	std::string match_result;
	type::timestamp created_at{};

	[[nodiscard]] auto operator==(const match_record &) const -> bool = default;

	// Computed rather than stored on the object; persisted alongside for queries.
	[[nodiscard]] auto kd_ratio(this const auto &self) -> double
	{
		return self.deaths > 0 ? std::round(static_cast<double>(self.kills) / self.deaths * 100.0) / 100.0 : static_cast<double>(self.kills);
	}

	[[nodiscard]] auto kda(this const auto &self) -> std::string { return std::format("{}/{}/{}", self.kills, self.deaths, self.assists); }

	[[nodiscard]] auto is_victory(this const auto &self) -> bool { return self.match_result == constants::result::victory; }
	[[nodiscard]] auto is_draw(this const auto &self) -> bool { return self.match_result == constants::result::draw; }
};

// Round half away from zero to `digits` decimals.
[[nodiscard]] inline auto round_to(double value, int digits) -> double
{
	const double scale = std::pow(10.0, digits);
	return std::round(value * scale) / scale;
}

// Utility function for formatting timestamps
[[nodiscard]] inline auto format_timestamp(type::timestamp tp) -> std::string { return std::format("{:%Y-%m-%d %H:%M:%S} UTC", tp); }

} // namespace vtrack
