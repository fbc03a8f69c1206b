#include "core/constants.hpp"
#include "services/henrik_parser.hpp"

#include <algorithm>
#include <vector>

namespace vtrack::henrik {

namespace {

auto is_player(const nlohmann::json &p, std::string_view handle, std::string_view tag) -> bool
{
	return p.is_object() && util::iequals(p.value("name", ""), handle) && util::iequals(p.value("tag", ""), tag);
}

auto score_of(const nlohmann::json &p) -> int
{
	if (auto it = p.find("stats"); it != p.end() && it->is_object()) {
		return it->value("score", 0);
	}
	return 0;
}

// v4 returns a flat player list, v3 nests it under `all_players`.
auto player_list(const nlohmann::json &match) -> std::expected<nlohmann::json, type::error>
{
	const auto &players = match.at("players");
	if (players.is_array()) {
		return players;
	}
	if (players.is_object() && players.contains("all_players") && players.at("all_players").is_array()) {
		return players.at("all_players");
	}
	return std::unexpected(type::error{"unexpected shape for match players"});
}

auto team_placement(const nlohmann::json &players, const nlohmann::json &self) -> int
{
	const auto team_id = self.value("team_id", std::string{});

	std::vector<const nlohmann::json *> team;
	for (const auto &p : players) {
		if (p.is_object() && p.value("team_id", std::string{}) == team_id) {
			team.push_back(&p);
		}
	}

	std::ranges::stable_sort(team, std::ranges::greater{}, [](const nlohmann::json *p) { return score_of(*p); });

	auto it = std::ranges::find(team, &self);
	if (it == team.end()) {
		return constants::limits::team_size;
	}
	return std::clamp(static_cast<int>(std::distance(team.begin(), it)) + 1, 1, constants::limits::team_size);
}

} // namespace

auto parse_latest_match(const nlohmann::json &body, std::string_view handle, std::string_view tag) -> std::expected<std::optional<match_record>, type::error>
{
	try { // The try block is for nlohmann::json
		if (!body.is_object() || !body.contains("data")) {
			return std::unexpected(type::error{"response has no data field"});
		}

		const auto &matches = body.at("data");
		if (matches.is_null() || (matches.is_array() && matches.empty())) {
			return std::nullopt;
		}
		if (!matches.is_array()) {
			return std::unexpected(type::error{"response data is not a list of matches"});
		}

		const auto &latest = matches.front();
		if (!latest.is_object()) {
			return std::unexpected(type::error{"latest match is not an object"});
		}

		const auto &metadata = latest.at("metadata");
		auto match_id = metadata.at("match_id").get<std::string>();
		if (match_id.empty()) {
			return std::unexpected(type::error{"match has an empty id"});
		}

		auto players = player_list(latest);
		if (!players) {
			return std::unexpected(players.error());
		}

		auto self_it = std::find_if(players->begin(), players->end(), [&](const nlohmann::json &p) { return is_player(p, handle, tag); });
		if (self_it == players->end()) {
			return std::nullopt;
		}
		const auto &self = *self_it;
		const auto stats = self.value("stats", nlohmann::json::object());

		// Rounds from the player's team perspective
		const auto team_id = self.value("team_id", std::string{});
		nlohmann::json own_team = nlohmann::json::object();
		if (auto teams = latest.find("teams"); teams != latest.end() && teams->is_array()) {
			for (const auto &t : *teams) {
				if (t.is_object() && t.value("team_id", std::string{}) == team_id) {
					own_team = t;
					break;
				}
			}
		}
		const auto rounds = own_team.value("rounds", nlohmann::json::object());
		const int rounds_won = rounds.value("won", 0);
		const int rounds_lost = rounds.value("lost", 0);
		const int total_rounds = std::max(rounds_won + rounds_lost, 1);

		const auto damage = stats.value("damage", nlohmann::json::object());
		const int dealt = damage.value("dealt", 0);
		const int received = damage.value("received", 0);

		const int headshots = stats.value("headshots", 0);
		const int shots = headshots + stats.value("bodyshots", 0) + stats.value("legshots", 0);

		std::string result;
		if (own_team.value("won", false))
			result = constants::result::victory;
		else if (own_team.contains("rounds") && rounds_won == rounds_lost)
			result = constants::result::draw;
		else
			result = constants::result::defeat;

		std::string map_name = "Unknown";
		if (auto map = metadata.find("map"); map != metadata.end()) {
			if (map->is_object())
				map_name = map->value("name", map_name);
			else if (map->is_string())
				map_name = map->get<std::string>();
		}

		std::string agent = "Unknown";
		if (auto a = self.find("agent"); a != self.end() && a->is_object()) {
			agent = a->value("name", agent);
		}

		match_record mr;
		mr.match_id = std::move(match_id);
		mr.player_name = std::string{handle};
		mr.player_tag = std::string{tag};
		mr.agent = std::move(agent);
		mr.game_score = std::format("{}-{}", rounds_won, rounds_lost);
		mr.kills = stats.value("kills", 0);
		mr.deaths = stats.value("deaths", 0);
		mr.assists = stats.value("assists", 0);
		mr.damage_delta = dealt - received;
		mr.headshot_percentage = shots > 0 ? round_to(headshots * 100.0 / shots, 1) : 0.0;
		mr.adr = round_to(static_cast<double>(dealt) / total_rounds, 1);
		mr.acs = round_to(static_cast<double>(stats.value("score", 0)) / total_rounds, 1);
		mr.team_placement = team_placement(*players, self);
		mr.map_name = std::move(map_name);
		mr.match_result = std::move(result);
		mr.created_at = util::now();

		return mr;
	} catch (const nlohmann::json::exception &e) {
		return std::unexpected(type::error{std::format("malformed match payload: {}", e.what())});
	}
}

auto parse_latest_match(std::string_view body, std::string_view handle, std::string_view tag) -> std::expected<std::optional<match_record>, type::error>
{
	auto json = nlohmann::json::parse(body, nullptr, false);
	if (json.is_discarded()) {
		return std::unexpected(type::error{"response body is not valid JSON"});
	}
	return parse_latest_match(json, handle, tag);
}

} // namespace vtrack::henrik
