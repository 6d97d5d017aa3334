#include <string>
#include "bindery/core/error.hpp"

namespace bindery {
namespace {
struct ErrorCategory: public std::error_category {
	auto name() const noexcept -> const char* override {
		return "bindery";
	}
	auto message(int ev) const -> std::string override {
		return std::string(to_string((Errc)ev));
	}
};
} // namespace

auto to_string(Errc code) -> std::string_view {
	switch (code) {
		case Errc::eCapacityExceeded: return "CapacityExceeded";
		case Errc::eOutOfRegionSpace: return "OutOfRegionSpace";
		case Errc::eRegionNotMappable: return "RegionNotMappable";
		case Errc::eLayoutMismatch: return "LayoutMismatch";
		case Errc::eBindingConflict: return "BindingConflict";
		case Errc::eReservedBindingViolation: return "ReservedBindingViolation";
		case Errc::ePushConstantMismatch: return "PushConstantMismatch";
		case Errc::eBuildFailed: return "BuildFailed";
		case Errc::eStaleHandle: return "StaleHandle";
		case Errc::eInvalidBytecode: return "InvalidBytecode";
	}
	return "unknown";
}
auto error_category() noexcept -> const std::error_category& {
	static ErrorCategory category;
	return category;
}
} // namespace bindery
