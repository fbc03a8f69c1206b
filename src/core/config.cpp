#include "core/config.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace vtrack {

namespace {

constexpr std::array valid_regions = {std::string_view{"eu"}, std::string_view{"na"}, std::string_view{"latam"},
																			std::string_view{"br"}, std::string_view{"ap"}, std::string_view{"kr"}};

auto quote_conninfo(std::string_view value) -> std::string
{
	std::string out = "'";
	for (char c : value) {
		if (c == '\'' || c == '\\')
			out.push_back('\\');
		out.push_back(c);
	}
	out.push_back('\'');
	return out;
}

auto parse_positive(std::string_view key, std::string_view value) -> std::expected<long, type::error>
{
	long parsed = 0;
	auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
	if (ec != std::errc{} || ptr != value.data() + value.size() || parsed < 1) {
		return std::unexpected(type::error{std::format("{} must be a positive integer, got '{}'", key, value)});
	}
	return parsed;
}

} // namespace

auto db_config::conninfo() const -> std::string
{
	auto info = std::format("host={} port={} dbname={} user={}", quote_conninfo(host), quote_conninfo(port), quote_conninfo(name), quote_conninfo(user));
	if (!password.empty()) {
		info += std::format(" password={}", quote_conninfo(password));
	}
	return info;
}

auto is_valid_region(std::string_view region) -> bool { return std::ranges::find(valid_regions, region) != valid_regions.end(); }

auto config::from_lookup(const lookup_fn &lookup) -> std::expected<config, type::error>
{
	auto get = [&](std::string_view key) -> std::optional<std::string> {
		auto v = lookup(key);
		if (!v || v->empty())
			return std::nullopt;
		return v;
	};

	config cfg;

	if (auto v = get("DISCORD_BOT_TOKEN"))
		cfg.bot_token = *v;
	else
		return std::unexpected(type::error{"DISCORD_BOT_TOKEN is required to run the bot"});

	if (auto v = get("HENRIK_API_KEY"))
		cfg.api_key = *v;
	else
		return std::unexpected(type::error{"HENRIK_API_KEY is required to query match history"});

	cfg.db.host = get("DB_HOST").value_or(cfg.db.host);
	cfg.db.port = get("DB_PORT").value_or(cfg.db.port);
	cfg.db.name = get("DB_NAME").value_or(cfg.db.name);
	cfg.db.user = get("DB_USER").value_or(cfg.db.user);
	cfg.db.password = get("DB_PASSWORD").value_or("");

	if (auto v = get("TRACKER_INTERVAL_MINUTES")) {
		auto minutes = parse_positive("TRACKER_INTERVAL_MINUTES", *v);
		if (!minutes)
			return std::unexpected(minutes.error());
		cfg.interval = std::chrono::minutes{*minutes};
	}

	if (auto v = get("REQUEST_TIMEOUT_SECONDS")) {
		auto seconds = parse_positive("REQUEST_TIMEOUT_SECONDS", *v);
		if (!seconds)
			return std::unexpected(seconds.error());
		cfg.request_timeout = std::chrono::seconds{*seconds};
	}

	if (auto v = get("TRACKER_FETCH_CONCURRENCY")) {
		auto parallel = parse_positive("TRACKER_FETCH_CONCURRENCY", *v);
		if (!parallel)
			return std::unexpected(parallel.error());
		cfg.fetch_concurrency = static_cast<std::size_t>(*parallel);
	}

	if (auto v = get("VALORANT_REGION")) {
		auto region = util::to_lower(*v);
		if (!is_valid_region(region))
			return std::unexpected(type::error{std::format("VALORANT_REGION '{}' is not one of eu, na, latam, br, ap, kr", *v)});
		cfg.region = std::move(region);
	}

	cfg.platform = util::to_lower(get("VALORANT_PLATFORM").value_or(cfg.platform));

	if (auto v = get("DISCORD_GUILD_ID")) {
		std::uint64_t id = 0;
		auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), id);
		if (ec != std::errc{} || ptr != v->data() + v->size() || id == 0)
			return std::unexpected(type::error{std::format("DISCORD_GUILD_ID must be a snowflake, got '{}'", *v)});
		cfg.guild_id = dpp::snowflake{id};
	}

	return cfg;
}

auto config::from_env() -> std::expected<config, type::error>
{
	load_dotenv(".env");

	std::string file_token;
	if (std::getenv("DISCORD_BOT_TOKEN") == nullptr) {
		std::ifstream(".bot_token") >> file_token;
	}

	return from_lookup([&](std::string_view key) -> std::optional<std::string> {
		if (const char *v = std::getenv(std::string{key}.c_str()))
			return std::string{v};
		if (key == "DISCORD_BOT_TOKEN" && !file_token.empty())
			return file_token;
		return std::nullopt;
	});
}

auto parse_dotenv(std::string_view content) -> std::vector<std::pair<std::string, std::string>>
{
	std::vector<std::pair<std::string, std::string>> out;

	std::istringstream in{std::string{content}};
	std::string raw;
	while (std::getline(in, raw)) {
		auto line = util::trim(raw);
		if (line.empty() || line.front() == '#')
			continue;

		if (line.starts_with("export "))
			line = util::trim(line.substr(7));

		auto eq = line.find('=');
		if (eq == std::string_view::npos)
			continue;

		auto key = util::trim(line.substr(0, eq));
		auto value = util::trim(line.substr(eq + 1));
		if (key.empty())
			continue;

		if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
			value = value.substr(1, value.size() - 2);
		}

		out.emplace_back(std::string{key}, std::string{value});
	}

	return out;
}

auto load_dotenv(const std::filesystem::path &path) -> std::size_t
{
	std::ifstream file(path);
	if (!file)
		return 0;

	std::stringstream buffer;
	buffer << file.rdbuf();

	std::size_t applied = 0;
	for (const auto &[key, value] : parse_dotenv(buffer.str())) {
		// overwrite = 0: the real environment always wins
		if (std::getenv(key.c_str()) == nullptr && ::setenv(key.c_str(), value.c_str(), 0) == 0) {
			++applied;
		}
	}
	return applied;
}

} // namespace vtrack
