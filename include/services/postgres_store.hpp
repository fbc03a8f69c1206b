#pragma once

#include "services/match_store.hpp"

#include <libpq-fe.h>

#include <memory>
#include <mutex>
#include <span>

namespace vtrack {

class postgres_store final : public match_store {
public:
	postgres_store(std::string conninfo, type::log_sink log);

	[[nodiscard]] auto connect() -> std::expected<std::monostate, type::error>;

	[[nodiscard]] auto ensure_schema() -> std::expected<std::monostate, type::error> override;

	[[nodiscard]] auto upsert_player(const tracked_player &player) -> std::expected<bool, type::error> override;
	[[nodiscard]] auto remove_player(std::string_view handle, std::string_view tag, dpp::snowflake owner) -> std::expected<bool, type::error> override;
	[[nodiscard]] auto list_players(dpp::snowflake owner) -> std::expected<std::vector<tracked_player>, type::error> override;
	[[nodiscard]] auto list_all_players() -> std::expected<std::vector<tracked_player>, type::error> override;

	[[nodiscard]] auto try_insert_match(const match_record &match) -> std::expected<bool, type::error> override;
	[[nodiscard]] auto owners_of(std::string_view handle, std::string_view tag) -> std::expected<std::vector<dpp::snowflake>, type::error> override;
	[[nodiscard]] auto latest_match(std::string_view handle, std::string_view tag) -> std::expected<std::optional<match_record>, type::error> override;

	[[nodiscard]] auto is_connected() const -> bool override;

private:
	using conn_ptr = std::unique_ptr<PGconn, decltype(&PQfinish)>;
	using result_ptr = std::unique_ptr<PGresult, decltype(&PQclear)>;

	std::string conninfo_;
	type::log_sink log_;
	conn_ptr conn_{nullptr, &PQfinish};
	// one libpq connection is shared by the command handlers and the polling thread
	mutable std::mutex mutex_;

	// Runs a parameterised statement (text format). A broken connection is reset and the statement retried once.
	[[nodiscard]] auto exec(std::string_view sql, std::span<const std::string> params) -> std::expected<result_ptr, type::error>;
	[[nodiscard]] auto exec_once(std::string_view sql, std::span<const std::string> params) -> std::expected<result_ptr, type::error>;
};

} // namespace vtrack
