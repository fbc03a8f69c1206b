#pragma once

#include "core/utils.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vtrack {

struct db_config {
	std::string host{"localhost"};
	std::string port{"5432"};
	std::string name{"valorant_tracker"};
	std::string user{"postgres"};
	std::string password;

	// libpq keyword/value connection string, values quoted.
	[[nodiscard]] auto conninfo() const -> std::string;
};

struct config {
	std::string bot_token;
	std::string api_key;
	db_config db;
	std::chrono::minutes interval{1};
	std::string region{"na"};
	std::string platform{"pc"};
	std::chrono::seconds request_timeout{10};
	std::size_t fetch_concurrency{4};
	std::optional<dpp::snowflake> guild_id;

	using lookup_fn = std::function<std::optional<std::string>(std::string_view)>;

	// Build from an arbitrary key lookup; empty values count as unset.
	[[nodiscard]] static auto from_lookup(const lookup_fn &lookup) -> std::expected<config, type::error>;

	// Seeds the environment from ./.env, then reads it. The bot token falls back to ./.bot_token.
	[[nodiscard]] static auto from_env() -> std::expected<config, type::error>;
};

[[nodiscard]] auto is_valid_region(std::string_view region) -> bool;

// KEY=VALUE lines; blank lines, '#' comments and an optional `export ` prefix are
// skipped, matching single or double quotes around the value are stripped.
[[nodiscard]] auto parse_dotenv(std::string_view content) -> std::vector<std::pair<std::string, std::string>>;

// Exports every pair from `path` that is not already set. Returns how many were applied.
auto load_dotenv(const std::filesystem::path &path) -> std::size_t;

} // namespace vtrack
