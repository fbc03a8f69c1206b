#include "services/postgres_codec.hpp"
#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <memory>

using namespace vtrack;

namespace {

using result_ptr = std::unique_ptr<PGresult, decltype(&PQclear)>;

// A server-less result set with text columns, filled the way libpq fills a SELECT.
auto make_result(const std::vector<std::string> &names, const std::vector<std::vector<std::string>> &rows) -> result_ptr
{
	result_ptr res{PQmakeEmptyPGresult(nullptr, PGRES_TUPLES_OK), &PQclear};

	std::vector<PGresAttDesc> attrs(names.size());
	for (std::size_t i = 0; i < names.size(); ++i) {
		attrs[i] = PGresAttDesc{};
		attrs[i].name = const_cast<char *>(names[i].c_str());
		attrs[i].typlen = -1;
	}
	if (PQsetResultAttrs(res.get(), static_cast<int>(attrs.size()), attrs.data()) == 0) {
		ADD_FAILURE() << "PQsetResultAttrs failed";
		return res;
	}

	for (std::size_t r = 0; r < rows.size(); ++r) {
		for (std::size_t c = 0; c < rows[r].size(); ++c) {
			auto &value = rows[r][c];
			if (PQsetvalue(res.get(), static_cast<int>(r), static_cast<int>(c), const_cast<char *>(value.c_str()), static_cast<int>(value.size())) == 0) {
				ADD_FAILURE() << "PQsetvalue failed at " << r << "," << c;
			}
		}
	}
	return res;
}

const std::vector<std::string> match_names = {
		"match_id", "handle", "tag", "agent", "game_score", "kills", "deaths", "assists",
		"damage_delta", "headshot_percentage", "adr", "acs", "team_placement", "map_name", "match_result", "created_at"};

// Values in `pg::match_columns` order, encoded the way inserts encode them.
auto match_row(const match_record &m) -> std::vector<std::string>
{
	return {m.match_id,
					m.player_name,
					m.player_tag,
					m.agent,
					m.game_score,
					std::to_string(m.kills),
					std::to_string(m.deaths),
					std::to_string(m.assists),
					std::to_string(m.damage_delta),
					pg::exact(m.headshot_percentage),
					pg::exact(m.adr),
					pg::exact(m.acs),
					std::to_string(m.team_placement),
					m.map_name,
					m.match_result,
					pg::epoch_of(m.created_at)};
}

} // namespace

TEST(PostgresCodec, ExactEncodingKeepsEveryBit)
{
	for (double v : {0.1 + 0.2, 33.3, 251.7, 1.0 / 3.0, 0.0, 99.99999999999999}) {
		auto text = pg::exact(v);
		double back = 0;
		auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), back);
		ASSERT_EQ(ec, std::errc{}) << text;
		EXPECT_EQ(back, v) << text;
	}
}

TEST(PostgresCodec, MatchRowReadsBackIdentical)
{
	auto m = vtrack::testing::sample_match("M1");
	m.headshot_percentage = 33.3;
	m.adr = 0.1 + 0.2;
	m.acs = 1.0 / 3.0;

	auto res = make_result(match_names, {match_row(m)});
	auto back = pg::read_match(res.get(), 0);
	ASSERT_TRUE(back.has_value()) << back.error().what();
	EXPECT_EQ(*back, m);
}

TEST(PostgresCodec, NonNumericColumnIsAnError)
{
	auto row = match_row(vtrack::testing::sample_match("M1"));
	row[6] = "ten";

	auto res = make_result(match_names, {row});
	auto back = pg::read_match(res.get(), 0);
	ASSERT_FALSE(back.has_value());
	EXPECT_NE(back.error().message.find("deaths"), std::string::npos);
}

TEST(PostgresCodec, PlayerRowsReadBack)
{
	auto p = tracked_player::make({.handle = "Émile", .tag = "EU"}, dpp::snowflake{1038042178439614505ull}, "eu");
	p.created_at = type::timestamp{std::chrono::seconds{1'700'000'000}};

	auto params = pg::player_params(p);
	// handle, tag, discord_id, region, fingerprint, created_at epoch
	auto res = make_result({"handle", "tag", "discord_id", "region", "fingerprint", "created_at"},
												 {{params[0], params[1], params[2], params[3], params[4], params[6]}});

	auto players = pg::read_players(res.get());
	ASSERT_TRUE(players.has_value()) << players.error().what();
	ASSERT_EQ(players->size(), 1u);
	EXPECT_EQ(players->front(), p);
}

TEST(PostgresCodec, ParamsCarryTheFoldedAccountKey)
{
	auto p = tracked_player::make({.handle = "ÉMILE", .tag = "EU"}, dpp::snowflake{5});
	EXPECT_EQ(pg::player_params(p)[5], util::account_key("émile", "eu"));

	auto m = vtrack::testing::sample_match("M1", "Émile", "Eu");
	auto params = pg::match_params(m);
	EXPECT_EQ(params[3], pg::player_params(p)[5]);
	EXPECT_EQ(params[9], pg::exact(m.kd_ratio()));
	EXPECT_EQ(params[17], "1700000000");
}
