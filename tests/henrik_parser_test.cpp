#include "services/henrik_parser.hpp"

#include <gtest/gtest.h>

using namespace vtrack;
using nlohmann::json;

namespace {

auto player(std::string name, std::string tag, std::string team, int score, int kills, int deaths, int assists) -> json
{
	return {{"name", std::move(name)},
					{"tag", std::move(tag)},
					{"team_id", std::move(team)},
					{"agent", {{"name", "Jett"}}},
					{"stats",
					 {{"score", score},
						{"kills", kills},
						{"deaths", deaths},
						{"assists", assists},
						{"headshots", 15},
						{"bodyshots", 30},
						{"legshots", 5},
						{"damage", {{"dealt", 3600}, {"received", 2800}}}}}};
}

auto response(int red_won, int blue_won, bool red_wins, std::string tracked = "Foo") -> json
{
	json players = json::array();
	players.push_back(player("Teammate", "AAA", "Red", 6000, 25, 12, 3));
	players.push_back(player(std::move(tracked), "123", "Red", 5500, 20, 10, 5));
	players.push_back(player("Other", "BBB", "Red", 3000, 10, 15, 8));
	players.push_back(player("Enemy", "CCC", "Blue", 7000, 30, 14, 2));

	return {{"status", 200},
					{"data",
					 json::array({{{"metadata", {{"match_id", "M1"}, {"map", {{"id", "x"}, {"name", "Ascent"}}}}},
												 {"players", players},
												 {"teams", json::array({{{"team_id", "Red"}, {"rounds", {{"won", red_won}, {"lost", blue_won}}}, {"won", red_wins}},
																								{{"team_id", "Blue"}, {"rounds", {{"won", blue_won}, {"lost", red_won}}}, {"won", !red_wins && red_won != blue_won}}})}}})}};
}

} // namespace

TEST(HenrikParser, ExtractsPlayerStats)
{
	auto res = henrik::parse_latest_match(response(13, 11, true), "foo", "123");
	ASSERT_TRUE(res.has_value()) << res.error().what();
	ASSERT_TRUE(res->has_value());

	const auto &m = **res;
	EXPECT_EQ(m.match_id, "M1");
	EXPECT_EQ(m.player_name, "foo");
	EXPECT_EQ(m.player_tag, "123");
	EXPECT_EQ(m.agent, "Jett");
	EXPECT_EQ(m.map_name, "Ascent");
	EXPECT_EQ(m.game_score, "13-11");
	EXPECT_EQ(m.match_result, "Victory");
	EXPECT_EQ(m.kills, 20);
	EXPECT_EQ(m.deaths, 10);
	EXPECT_EQ(m.assists, 5);
	EXPECT_EQ(m.damage_delta, 800);
	EXPECT_DOUBLE_EQ(m.headshot_percentage, 30.0);
	EXPECT_DOUBLE_EQ(m.adr, 150.0);
	EXPECT_DOUBLE_EQ(m.acs, round_to(5500.0 / 24.0, 1));
	// second-highest score among the three Red players
	EXPECT_EQ(m.team_placement, 2);
}

TEST(HenrikParser, MatchesNonAsciiHandleInAnyCase)
{
	auto res = henrik::parse_latest_match(response(13, 11, true, "Émile"), "émile", "123");
	ASSERT_TRUE(res.has_value()) << res.error().what();
	ASSERT_TRUE(res->has_value());
	EXPECT_EQ((*res)->match_id, "M1");
	EXPECT_EQ((*res)->kills, 20);

	auto upper = henrik::parse_latest_match(response(13, 11, true, "straße"), "STRASSE", "123");
	ASSERT_TRUE(upper.has_value() && upper->has_value());
	EXPECT_EQ((*upper)->team_placement, 2);
}

TEST(HenrikParser, DefeatAndDraw)
{
	auto lost = henrik::parse_latest_match(response(9, 13, false), "Foo", "123");
	ASSERT_TRUE(lost.has_value() && lost->has_value());
	EXPECT_EQ((*lost)->match_result, "Defeat");
	EXPECT_EQ((*lost)->game_score, "9-13");

	auto draw = henrik::parse_latest_match(response(12, 12, false), "Foo", "123");
	ASSERT_TRUE(draw.has_value() && draw->has_value());
	EXPECT_EQ((*draw)->match_result, "Draw");
}

TEST(HenrikParser, AcceptsNestedPlayerList)
{
	auto body = response(13, 5, true);
	auto &match = body["data"][0];
	match["players"] = json{{"all_players", match["players"]}};

	auto res = henrik::parse_latest_match(body, "Foo", "123");
	ASSERT_TRUE(res.has_value()) << res.error().what();
	ASSERT_TRUE(res->has_value());
	EXPECT_EQ((*res)->kills, 20);
}

TEST(HenrikParser, EmptyHistoryIsNotFound)
{
	auto res = henrik::parse_latest_match(json{{"status", 200}, {"data", json::array()}}, "Foo", "123");
	ASSERT_TRUE(res.has_value());
	EXPECT_FALSE(res->has_value());
}

TEST(HenrikParser, PlayerMissingFromMatchIsNotFound)
{
	auto res = henrik::parse_latest_match(response(13, 11, true), "Stranger", "000");
	ASSERT_TRUE(res.has_value());
	EXPECT_FALSE(res->has_value());
}

TEST(HenrikParser, MalformedPayloadsAreErrors)
{
	EXPECT_FALSE(henrik::parse_latest_match(std::string_view{"<html>rate limited</html>"}, "Foo", "123").has_value());
	EXPECT_FALSE(henrik::parse_latest_match(json{{"status", 200}}, "Foo", "123").has_value());
	EXPECT_FALSE(henrik::parse_latest_match(json{{"data", "oops"}}, "Foo", "123").has_value());
	EXPECT_FALSE(henrik::parse_latest_match(json{{"data", json::array({json{{"players", json::array()}}})}}, "Foo", "123").has_value());

	auto no_id = response(13, 11, true);
	no_id["data"][0]["metadata"]["match_id"] = "";
	EXPECT_FALSE(henrik::parse_latest_match(no_id, "Foo", "123").has_value());

	auto bad_kills = response(13, 11, true);
	bad_kills["data"][0]["players"][1]["stats"]["kills"] = "twenty";
	EXPECT_FALSE(henrik::parse_latest_match(bad_kills, "Foo", "123").has_value());
}

TEST(HenrikParser, ParsesRawBody)
{
	auto res = henrik::parse_latest_match(std::string_view{response(13, 11, true).dump()}, "Foo", "123");
	ASSERT_TRUE(res.has_value()) << res.error().what();
	ASSERT_TRUE(res->has_value());
	EXPECT_EQ((*res)->match_id, "M1");
}
