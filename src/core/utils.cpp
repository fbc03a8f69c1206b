#include "core/utils.hpp"

#include <unicode/stringpiece.h>
#include <unicode/unistr.h>

namespace vtrack::util {

auto fold_case(std::string_view sv) -> std::string
{
	// Malformed UTF-8 sequences come back as U+FFFD.
	auto text = icu::UnicodeString::fromUTF8(icu::StringPiece(sv.data(), static_cast<int32_t>(sv.size())));
	text.foldCase();

	std::string out;
	text.toUTF8String(out);
	return out;
}

} // namespace vtrack::util
