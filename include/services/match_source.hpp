#pragma once

#include "core/utils.hpp"
#include "models/match.hpp"
#include "models/player.hpp"

#include <optional>

namespace vtrack {

// Where the latest competitive match of a player comes from.
// A value of std::nullopt means "no competitive history / account not visible";
// an error means the lookup itself failed and nothing can be concluded this cycle.
class match_source {
public:
	virtual ~match_source() = default;

	[[nodiscard]] virtual auto latest_match(const riot_id &id, std::string_view region) -> std::expected<std::optional<match_record>, type::error> = 0;
};

} // namespace vtrack
