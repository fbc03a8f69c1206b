#pragma once

#include <dpp/dpp.h>

#include <chrono>
#include <expected>
#include <format>
#include <functional>
#include <string>

namespace vtrack {

namespace type {
// Strong type aliases
using timestamp = std::chrono::sys_seconds;

// Error handling
struct error {
	std::string message;

	constexpr error(std::string_view sv) : message(sv) {}

	constexpr error() = default;
	constexpr error(const error &) = default;
	constexpr error(error &&) noexcept = default;
	constexpr error &operator=(const error &) = default;
	constexpr error &operator=(error &&) noexcept = default;

	// explicit object parameter
	[[nodiscard]] auto what(this const auto &self) -> std::string_view { return self.message; }
};

// Where non-Discord components write their log lines. main binds it to dpp::cluster::log.
using log_sink = std::function<void(dpp::loglevel, const std::string &)>;
} // namespace type

namespace util {
// Force the const conversion operator and silence -Wconversion noise.
[[nodiscard]] constexpr auto id_to_u64(const dpp::snowflake &id) noexcept -> std::uint64_t
{
	// the const qualifier in argument would make it picks operator uint64_t() const
	return static_cast<std::uint64_t>(id);
}

// Handy mention formatter.
[[nodiscard]] inline auto mention(const dpp::snowflake &id) -> std::string { return std::format("<@{}>", id_to_u64(id)); }

[[nodiscard]] inline auto now() -> type::timestamp { return std::chrono::time_point_cast<type::timestamp::duration>(std::chrono::system_clock::now()); }

// ASCII-only lower casing, for region and platform codes.
[[nodiscard]] inline auto to_lower(std::string_view sv) -> std::string
{
	std::string out{sv};
	for (auto &c : out) {
		if (c >= 'A' && c <= 'Z') {
			c = static_cast<char>(c - 'A' + 'a');
		}
	}
	return out;
}

[[nodiscard]] inline auto trim(std::string_view sv) -> std::string_view
{
	constexpr std::string_view ws = " \t\r\n";
	auto first = sv.find_first_not_of(ws);
	if (first == std::string_view::npos) {
		return {};
	}
	auto last = sv.find_last_not_of(ws);
	return sv.substr(first, last - first + 1);
}

// Unicode case folding (ICU full folding) of UTF-8 text. Riot ids are compared and hashed through this.
[[nodiscard]] auto fold_case(std::string_view sv) -> std::string;

// Folded "handle#tag", the key an account is stored and looked up under.
[[nodiscard]] inline auto account_key(std::string_view handle, std::string_view tag) -> std::string
{
	return std::format("{}#{}", fold_case(handle), fold_case(tag));
}

[[nodiscard]] inline auto iequals(std::string_view a, std::string_view b) -> bool { return fold_case(a) == fold_case(b); }

// Silence a logger entirely; handy for tests and tools.
[[nodiscard]] inline auto null_sink() -> type::log_sink
{
	return [](dpp::loglevel, const std::string &) {};
}

} // namespace util

} // namespace vtrack
