#pragma once
#include <string>
#include <string_view>
#include <system_error>

namespace bindery {
enum class Errc: int {
	eCapacityExceeded = 1,
	eOutOfRegionSpace,
	eRegionNotMappable,
	eLayoutMismatch,
	eBindingConflict,
	eReservedBindingViolation,
	ePushConstantMismatch,
	eBuildFailed,
	eStaleHandle,
	eInvalidBytecode,
};
auto to_string(Errc code) -> std::string_view;
auto error_category() noexcept -> const std::error_category&;
inline auto make_error_code(Errc code) noexcept -> std::error_code {
	return std::error_code((int)code, error_category());
}

// thrown for every error this library reports, vulkan errors stay vk::SystemError
struct Error: public std::system_error {
	Error(Errc code, const std::string& message): std::system_error(make_error_code(code), message) {}
	auto errc() const noexcept -> Errc {
		return (Errc)code().value();
	}
};
} // namespace bindery

template<> struct std::is_error_code_enum<bindery::Errc>: public std::true_type {};
