#pragma once

#include "core/utils.hpp"
#include "models/match.hpp"
#include <nlohmann/json.hpp>

#include <optional>

namespace vtrack::henrik {

// Turns a v4 matches response body into the match record of `handle#tag`.
// Returns std::nullopt when the list is empty or the player is not in the match,
// and an error when the payload does not have the expected shape.
[[nodiscard]] auto parse_latest_match(const nlohmann::json &body, std::string_view handle, std::string_view tag)
		-> std::expected<std::optional<match_record>, type::error>;

[[nodiscard]] auto parse_latest_match(std::string_view body, std::string_view handle, std::string_view tag)
		-> std::expected<std::optional<match_record>, type::error>;

} // namespace vtrack::henrik
