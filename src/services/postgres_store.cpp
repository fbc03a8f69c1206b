#include "core/constants.hpp"
#include "services/postgres_codec.hpp"
#include "services/postgres_store.hpp"

#include <array>
#include <format>

namespace vtrack {

namespace {

constexpr std::array schema_statements = {
		std::string_view{"CREATE SCHEMA IF NOT EXISTS valorant"},
		std::string_view{R"sql(
CREATE TABLE IF NOT EXISTS valorant.players (
	handle      TEXT        NOT NULL,
	tag         TEXT        NOT NULL,
	discord_id  BIGINT      NOT NULL,
	region      TEXT        NOT NULL DEFAULT '',
	fingerprint TEXT        NOT NULL UNIQUE,
	account_key TEXT        NOT NULL,
	created_at  TIMESTAMPTZ NOT NULL DEFAULT now()
))sql"},
		std::string_view{R"sql(
CREATE TABLE IF NOT EXISTS valorant.match_stats (
	match_id            TEXT             PRIMARY KEY,
	handle              TEXT             NOT NULL,
	tag                 TEXT             NOT NULL,
	account_key         TEXT             NOT NULL,
	agent               TEXT             NOT NULL,
	game_score          TEXT             NOT NULL,
	kills               INTEGER          NOT NULL,
	deaths              INTEGER          NOT NULL,
	assists             INTEGER          NOT NULL,
	kd_ratio            DOUBLE PRECISION NOT NULL,
	damage_delta        INTEGER          NOT NULL,
	headshot_percentage DOUBLE PRECISION NOT NULL CHECK (headshot_percentage BETWEEN 0 AND 100),
	adr                 DOUBLE PRECISION NOT NULL,
	acs                 DOUBLE PRECISION NOT NULL,
	team_placement      SMALLINT         NOT NULL CHECK (team_placement BETWEEN 1 AND 5),
	map_name            TEXT,
	match_result        TEXT,
	created_at          TIMESTAMPTZ      NOT NULL DEFAULT now()
))sql"},
		std::string_view{"CREATE INDEX IF NOT EXISTS players_account_idx ON valorant.players (account_key)"},
		std::string_view{"CREATE INDEX IF NOT EXISTS match_stats_account_idx ON valorant.match_stats (account_key, created_at DESC)"},
};

} // namespace

postgres_store::postgres_store(std::string conninfo, type::log_sink log) : conninfo_(std::move(conninfo)), log_(std::move(log)) {}

auto postgres_store::connect() -> std::expected<std::monostate, type::error>
{
	std::scoped_lock lock(mutex_);

	conn_.reset(PQconnectdb(conninfo_.c_str()));
	if (!conn_ || PQstatus(conn_.get()) != CONNECTION_OK) {
		std::string reason = conn_ ? PQerrorMessage(conn_.get()) : "out of memory";
		conn_.reset();
		return std::unexpected(type::error{std::format("cannot connect to PostgreSQL: {}", util::trim(reason))});
	}

	log_(dpp::ll_info, std::format("Connected to PostgreSQL database {}", PQdb(conn_.get())));
	return std::monostate{};
}

auto postgres_store::is_connected() const -> bool
{
	std::scoped_lock lock(mutex_);
	return conn_ && PQstatus(conn_.get()) == CONNECTION_OK;
}

auto postgres_store::exec_once(std::string_view sql, std::span<const std::string> params) -> std::expected<result_ptr, type::error>
{
	std::vector<const char *> values;
	values.reserve(params.size());
	for (const auto &p : params) {
		values.push_back(p.c_str());
	}

	const std::string query{sql};
	result_ptr res{PQexecParams(conn_.get(), query.c_str(), static_cast<int>(values.size()), nullptr, values.data(), nullptr, nullptr, 0), &PQclear};

	const auto status = PQresultStatus(res.get());
	if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
		std::string_view reason = res ? PQresultErrorMessage(res.get()) : PQerrorMessage(conn_.get());
		return std::unexpected(type::error{std::string{util::trim(reason)}});
	}
	return res;
}

auto postgres_store::exec(std::string_view sql, std::span<const std::string> params) -> std::expected<result_ptr, type::error>
{
	if (!conn_) {
		return std::unexpected(type::error{"database is not connected"});
	}

	if (PQstatus(conn_.get()) != CONNECTION_OK) {
		log_(dpp::ll_warning, "PostgreSQL connection lost, reconnecting");
		PQreset(conn_.get());
	}

	auto res = exec_once(sql, params);
	if (!res && PQstatus(conn_.get()) == CONNECTION_BAD) {
		log_(dpp::ll_warning, std::format("PostgreSQL connection dropped during query ({}), retrying once", res.error().what()));
		PQreset(conn_.get());
		if (PQstatus(conn_.get()) == CONNECTION_OK) {
			res = exec_once(sql, params);
		}
	}
	return res;
}

auto postgres_store::ensure_schema() -> std::expected<std::monostate, type::error>
{
	std::scoped_lock lock(mutex_);

	for (auto stmt : schema_statements) {
		if (auto res = exec(stmt, {}); !res) {
			return std::unexpected(type::error{std::format("schema setup failed: {}", res.error().what())});
		}
	}
	return std::monostate{};
}

auto postgres_store::upsert_player(const tracked_player &player) -> std::expected<bool, type::error>
{
	static const std::string sql = std::format("INSERT INTO {} (handle, tag, discord_id, region, fingerprint, account_key, created_at) "
																						 "VALUES ($1, $2, $3, $4, $5, $6, to_timestamp($7)) "
																						 "ON CONFLICT (fingerprint) DO NOTHING RETURNING fingerprint",
																						 constants::db::players_table);

	const auto params = pg::player_params(player);

	std::scoped_lock lock(mutex_);
	auto res = exec(sql, params);
	if (!res) {
		return std::unexpected(type::error{std::format("insert player {} failed: {}", player.display_name(), res.error().what())});
	}
	return PQntuples(res->get()) == 1;
}

auto postgres_store::remove_player(std::string_view handle, std::string_view tag, dpp::snowflake owner) -> std::expected<bool, type::error>
{
	static const std::string sql = std::format("DELETE FROM {} WHERE fingerprint = $1", constants::db::players_table);

	const std::array params{hash::player_fingerprint(handle, tag, util::id_to_u64(owner))};

	std::scoped_lock lock(mutex_);
	auto res = exec(sql, params);
	if (!res) {
		return std::unexpected(type::error{std::format("remove player {}#{} failed: {}", handle, tag, res.error().what())});
	}
	return std::string_view{PQcmdTuples(res->get())} != "0";
}

auto postgres_store::list_players(dpp::snowflake owner) -> std::expected<std::vector<tracked_player>, type::error>
{
	static const std::string sql =
			std::format("SELECT {} FROM {} WHERE discord_id = $1 ORDER BY created_at, handle", pg::player_columns, constants::db::players_table);

	const std::array params{std::to_string(util::id_to_u64(owner))};

	std::scoped_lock lock(mutex_);
	auto res = exec(sql, params);
	if (!res) {
		return std::unexpected(type::error{std::format("list players failed: {}", res.error().what())});
	}
	return pg::read_players(res->get());
}

auto postgres_store::list_all_players() -> std::expected<std::vector<tracked_player>, type::error>
{
	static const std::string sql = std::format("SELECT {} FROM {} ORDER BY created_at, handle", pg::player_columns, constants::db::players_table);

	std::scoped_lock lock(mutex_);
	auto res = exec(sql, {});
	if (!res) {
		return std::unexpected(type::error{std::format("list all players failed: {}", res.error().what())});
	}
	return pg::read_players(res->get());
}

auto postgres_store::try_insert_match(const match_record &m) -> std::expected<bool, type::error>
{
	static const std::string sql = std::format("INSERT INTO {} (match_id, handle, tag, account_key, agent, game_score, kills, deaths, assists, kd_ratio, "
																						 "damage_delta, headshot_percentage, adr, acs, team_placement, map_name, match_result, created_at) "
																						 "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, $16, $17, to_timestamp($18)) "
																						 "ON CONFLICT (match_id) DO NOTHING RETURNING match_id",
																						 constants::db::matches_table);

	const auto params = pg::match_params(m);

	std::scoped_lock lock(mutex_);
	auto res = exec(sql, params);
	if (!res) {
		return std::unexpected(type::error{std::format("insert match {} failed: {}", m.match_id, res.error().what())});
	}
	return PQntuples(res->get()) == 1;
}

auto postgres_store::owners_of(std::string_view handle, std::string_view tag) -> std::expected<std::vector<dpp::snowflake>, type::error>
{
	static const std::string sql = std::format("SELECT DISTINCT discord_id FROM {} WHERE account_key = $1 ORDER BY discord_id",
																						 constants::db::players_table);

	const std::array params{util::account_key(handle, tag)};

	std::scoped_lock lock(mutex_);
	auto res = exec(sql, params);
	if (!res) {
		return std::unexpected(type::error{std::format("owner lookup for {}#{} failed: {}", handle, tag, res.error().what())});
	}

	std::vector<dpp::snowflake> owners;
	for (int row = 0; row < PQntuples(res->get()); ++row) {
		auto id = pg::parse_number<std::uint64_t>(res->get(), row, 0);
		if (!id)
			return std::unexpected(id.error());
		owners.emplace_back(*id);
	}
	return owners;
}

auto postgres_store::latest_match(std::string_view handle, std::string_view tag) -> std::expected<std::optional<match_record>, type::error>
{
	static const std::string sql =
			std::format("SELECT {} FROM {} WHERE account_key = $1 ORDER BY created_at DESC LIMIT 1", pg::match_columns,
									constants::db::matches_table);

	const std::array params{util::account_key(handle, tag)};

	std::scoped_lock lock(mutex_);
	auto res = exec(sql, params);
	if (!res) {
		return std::unexpected(type::error{std::format("latest match lookup for {}#{} failed: {}", handle, tag, res.error().what())});
	}
	if (PQntuples(res->get()) == 0) {
		return std::nullopt;
	}

	auto mr = pg::read_match(res->get(), 0);
	if (!mr) {
		return std::unexpected(mr.error());
	}
	return std::optional{std::move(*mr)};
}

} // namespace vtrack
