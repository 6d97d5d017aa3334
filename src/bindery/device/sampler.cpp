#include "bindery/device/sampler.hpp"

namespace bindery {
auto SamplerDesc::from_name(std::string_view name) -> std::optional<SamplerDesc> {
	constexpr std::string_view prefix = "sampler_";
	if (!name.starts_with(prefix)) return std::nullopt;
	std::string_view suffix = name.substr(prefix.size());
	if (suffix.size() < 3) return std::nullopt;

	SamplerDesc desc;
	switch (suffix[0]) {
		case 'n': desc.filter = vk::Filter::eNearest; break;
		case 'l': desc.filter = vk::Filter::eLinear; break;
		default: return std::nullopt;
	}
	switch (suffix[1]) {
		case 'n': desc.mipmap = vk::SamplerMipmapMode::eNearest; break;
		case 'l': desc.mipmap = vk::SamplerMipmapMode::eLinear; break;
		default: return std::nullopt;
	}
	suffix = suffix.substr(2);
	if (suffix == "r") desc.address = vk::SamplerAddressMode::eRepeat;
	else if (suffix == "mr") desc.address = vk::SamplerAddressMode::eMirroredRepeat;
	else if (suffix == "c") desc.address = vk::SamplerAddressMode::eClampToEdge;
	else if (suffix == "cb") desc.address = vk::SamplerAddressMode::eClampToBorder;
	else return std::nullopt;
	return desc;
}
} // namespace bindery
