#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <string_view>
#include <vulkan/vulkan.hpp>

namespace bindery {
struct SamplerDesc {
	vk::Filter filter = vk::Filter::eLinear;
	vk::SamplerMipmapMode mipmap = vk::SamplerMipmapMode::eLinear;
	vk::SamplerAddressMode address = vk::SamplerAddressMode::eRepeat;
	auto operator<=>(const SamplerDesc&) const = default;

	// decodes the suffix of "sampler_<filter><mipmap><address>",
	// filter and mipmap are n|l, address is r|mr|c|cb
	auto static from_name(std::string_view name) -> std::optional<SamplerDesc>;
};

// one sampler per distinct description, shared by immutable sampler bindings
struct SamplerCache {
	void init(vk::Device device) {
		_device = device;
	}
	void destroy() {
		std::lock_guard lock(_mutex);
		for (auto& [_, sampler]: _samplers) _device.destroySampler(sampler);
		_samplers.clear();
	}
	auto get(const SamplerDesc& desc) -> vk::Sampler {
		std::lock_guard lock(_mutex);
		auto it = _samplers.find(desc);
		if (it != _samplers.end()) return it->second;
		vk::Sampler sampler = _device.createSampler({
			.magFilter = desc.filter,
			.minFilter = desc.filter,
			.mipmapMode = desc.mipmap,
			.addressModeU = desc.address,
			.addressModeV = desc.address,
			.addressModeW = desc.address,
			.mipLodBias = 0.0f,
			.anisotropyEnable = vk::False,
			.maxAnisotropy = 1.0f,
			.compareEnable = vk::False,
			.compareOp = vk::CompareOp::eAlways,
			.minLod = 0.0f,
			.maxLod = vk::LodClampNone,
			.borderColor = vk::BorderColor::eIntOpaqueBlack,
			.unnormalizedCoordinates = vk::False,
		});
		_samplers.emplace(desc, sampler);
		return sampler;
	}

	std::mutex _mutex;
	vk::Device _device = nullptr;
	std::map<SamplerDesc, vk::Sampler> _samplers;
};
} // namespace bindery
