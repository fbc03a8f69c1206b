#include "core/hash.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>

#include <array>
#include <memory>
#include <stdexcept>

namespace vtrack::hash {

namespace {

using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

auto sha256(std::string_view input) -> std::array<unsigned char, 32>
{
	std::array<unsigned char, 32> out{};
	md_ctx_ptr ctx{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
	unsigned int len = 0;

	// Only fails on allocation failure, which is not recoverable here.
	if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 || EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
			EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) {
		throw std::runtime_error("SHA-256 digest failed");
	}
	return out;
}

} // namespace

auto digest_hex(std::string_view input, std::size_t length) -> std::string
{
	static constexpr std::string_view hex = "0123456789abcdef";

	std::string out;
	out.reserve(64);
	for (auto byte : sha256(input)) {
		out.push_back(hex[byte >> 4]);
		out.push_back(hex[byte & 0x0F]);
	}

	if (length < out.size()) {
		out.resize(length);
	}
	return out;
}

auto fingerprint(std::span<const std::string_view> fields, std::size_t length) -> std::string
{
	std::string joined;
	bool first = true;
	for (auto f : fields) {
		if (!first)
			joined.push_back('\x1f');
		joined.append(f);
		first = false;
	}
	return digest_hex(joined, length);
}

auto fingerprint(std::initializer_list<std::string_view> fields, std::size_t length) -> std::string
{
	return fingerprint(std::span<const std::string_view>{fields.begin(), fields.size()}, length);
}

auto player_fingerprint(std::string_view handle, std::string_view tag, std::uint64_t owner_id) -> std::string
{
	auto h = util::fold_case(handle);
	auto t = util::fold_case(tag);
	auto o = std::to_string(owner_id);
	return fingerprint({h, t, o});
}

} // namespace vtrack::hash
