#include "core/constants.hpp"
#include "ui/embed_builder.hpp"

#include <format>

namespace vtrack::ui {

auto embed_builder::build_help() -> dpp::embed
{
	dpp::embed e;
	e.set_title("Valorant Tracker / Help");

	e.add_field("Tracking",
							"• `/add <username#tag> [region]` start tracking a player\n"
							"• `/remove <username#tag>` stop tracking a player\n"
							"• `/list` show the players you track",
							false);

	e.add_field("Matches",
							"• New competitive matches are sent to you as a direct message\n"
							"• `/last <username#tag>` show the last recorded match",
							false);

	e.add_field("Misc", "• `/ping` check that the bot is alive\n", false);

	return e;
}

auto embed_builder::build_player_list(std::span<const tracked_player> players, std::string_view default_region) -> dpp::embed
{
	dpp::embed e;
	e.set_title("Tracked players");

	std::string desc;
	for (const auto &p : players) {
		desc += std::format("**{}** ({}) since {}\n", p.display_name(), p.region_or(default_region), format_timestamp(p.created_at));
	}

	e.set_description(desc);
	return e;
}

auto embed_builder::result_color(const match_record &match) -> std::uint32_t
{
	if (match.is_victory())
		return constants::colors::green;
	if (match.is_draw())
		return constants::colors::grey;
	return constants::colors::red;
}

auto embed_builder::build_match(const match_record &m) -> dpp::embed
{
	dpp::embed e;
	e.set_title("🎮 New Match Detected!");
	e.set_description(std::format("**{}#{}** just finished a match!", m.player_name, m.player_tag));
	e.set_color(result_color(m));

	e.add_field("Agent", m.agent, true);
	e.add_field("Map", m.map_name.empty() ? "Unknown" : m.map_name, true);
	e.add_field("Result", m.match_result.empty() ? "Unknown" : m.match_result, true);

	e.add_field("Score", m.game_score, true);
	e.add_field("K/D/A", m.kda(), true);
	e.add_field("K/D Ratio", std::format("{:.2f}", m.kd_ratio()), true);

	e.add_field("ACS", std::format("{:.1f}", m.acs), true);
	e.add_field("ADR", std::format("{:.1f}", m.adr), true);
	e.add_field("HS%", std::format("{:.1f}%", m.headshot_percentage), true);

	e.add_field("Damage Δ", std::format("{:+d}", m.damage_delta), true);
	e.add_field("Team Rank", std::format("#{}/{}", m.team_placement, constants::limits::team_size), true);
	// Keeps the three-column grid aligned
	e.add_field("\u200b", "\u200b", true);

	e.set_footer(std::format("Match ID: {}", m.match_id), "");

	return e;
}

} // namespace vtrack::ui
