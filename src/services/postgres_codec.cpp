#include "services/postgres_codec.hpp"

namespace vtrack::pg {

namespace {

auto text_at(const PGresult *res, int row, int col) -> std::string { return std::string{PQgetvalue(res, row, col)}; }

} // namespace

auto player_params(const tracked_player &player) -> std::array<std::string, 7>
{
	return {player.handle,
					player.tag,
					std::to_string(util::id_to_u64(player.owner_id)),
					player.region,
					player.fingerprint,
					util::account_key(player.handle, player.tag),
					epoch_of(player.created_at)};
}

auto match_params(const match_record &m) -> std::array<std::string, 18>
{
	return {m.match_id,
					m.player_name,
					m.player_tag,
					util::account_key(m.player_name, m.player_tag),
					m.agent,
					m.game_score,
					std::to_string(m.kills),
					std::to_string(m.deaths),
					std::to_string(m.assists),
					exact(m.kd_ratio()),
					std::to_string(m.damage_delta),
					exact(m.headshot_percentage),
					exact(m.adr),
					exact(m.acs),
					std::to_string(m.team_placement),
					m.map_name,
					m.match_result,
					epoch_of(m.created_at)};
}

auto read_players(const PGresult *res) -> std::expected<std::vector<tracked_player>, type::error>
{
	std::vector<tracked_player> players;
	const int rows = PQntuples(res);
	players.reserve(static_cast<std::size_t>(rows));

	for (int row = 0; row < rows; ++row) {
		auto owner = parse_number<std::uint64_t>(res, row, 2);
		if (!owner)
			return std::unexpected(owner.error());
		auto epoch = parse_number<std::int64_t>(res, row, 5);
		if (!epoch)
			return std::unexpected(epoch.error());

		players.push_back({.handle = text_at(res, row, 0),
											 .tag = text_at(res, row, 1),
											 .owner_id = dpp::snowflake{*owner},
											 .fingerprint = text_at(res, row, 4),
											 .region = text_at(res, row, 3),
											 .created_at = type::timestamp{std::chrono::seconds{*epoch}}});
	}
	return players;
}

auto read_match(const PGresult *res, int row) -> std::expected<match_record, type::error>
{
	match_record mr;
	mr.match_id = text_at(res, row, 0);
	mr.player_name = text_at(res, row, 1);
	mr.player_tag = text_at(res, row, 2);
	mr.agent = text_at(res, row, 3);
	mr.game_score = text_at(res, row, 4);
	mr.map_name = text_at(res, row, 13);
	mr.match_result = text_at(res, row, 14);

	auto kills = parse_number<int>(res, row, 5);
	auto deaths = parse_number<int>(res, row, 6);
	auto assists = parse_number<int>(res, row, 7);
	auto delta = parse_number<int>(res, row, 8);
	auto hs = parse_number<double>(res, row, 9);
	auto adr = parse_number<double>(res, row, 10);
	auto acs = parse_number<double>(res, row, 11);
	auto placement = parse_number<int>(res, row, 12);
	auto epoch = parse_number<std::int64_t>(res, row, 15);

	if (!kills)
		return std::unexpected(kills.error());
	if (!deaths)
		return std::unexpected(deaths.error());
	if (!assists)
		return std::unexpected(assists.error());
	if (!delta)
		return std::unexpected(delta.error());
	if (!hs)
		return std::unexpected(hs.error());
	if (!adr)
		return std::unexpected(adr.error());
	if (!acs)
		return std::unexpected(acs.error());
	if (!placement)
		return std::unexpected(placement.error());
	if (!epoch)
		return std::unexpected(epoch.error());

	mr.kills = *kills;
	mr.deaths = *deaths;
	mr.assists = *assists;
	mr.damage_delta = *delta;
	mr.headshot_percentage = *hs;
	mr.adr = *adr;
	mr.acs = *acs;
	mr.team_placement = *placement;
	mr.created_at = type::timestamp{std::chrono::seconds{*epoch}};
	return mr;
}

} // namespace vtrack::pg
