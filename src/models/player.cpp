#include "core/constants.hpp"
#include "models/player.hpp"

namespace vtrack {

auto riot_id::parse(std::string_view text) -> std::expected<riot_id, type::error>
{
	auto trimmed = util::trim(text);
	auto hash_pos = trimmed.find('#');
	if (hash_pos == std::string_view::npos) {
		return std::unexpected(type::error{constants::text::invalid_riot_id});
	}

	auto handle = util::trim(trimmed.substr(0, hash_pos));
	auto tag = util::trim(trimmed.substr(hash_pos + 1));
	if (handle.empty() || tag.empty()) {
		return std::unexpected(type::error{"Both username and tag are required"});
	}

	return riot_id{.handle = std::string{handle}, .tag = std::string{tag}};
}

} // namespace vtrack
