#pragma once
#include <map>
#include <span>
#include <mutex>
#include <vector>
#include <cstdint>
#include <vulkan/vulkan.hpp>
#include "bindery/pipeline/cache.hpp"
#include "bindery/pipeline/layout.hpp"
#include "bindery/pipeline/reflection.hpp"

namespace bindery {
// Shader bytecode registered by content, reflection runs once per module.
struct ShaderLibrary {
	// identical bytecode yields the same identity
	auto add(std::span<const uint32_t> code) -> ShaderIdentity;
	auto contains(const ShaderIdentity& id) const -> bool;
	auto get(const ShaderIdentity& id) const -> const ShaderReflection&;
	auto code(const ShaderIdentity& id) const -> std::span<const uint32_t>;
	// merged layout of a stage set, memoized
	auto layout(std::span<const ShaderIdentity> ids) -> const PipelineLayoutSpec&;

private:
	struct Entry {
		std::vector<uint32_t> code;
		ShaderReflection reflection;
	};
	auto get_locked(const ShaderIdentity& id) const -> const Entry&;

	mutable std::mutex _mutex;
	std::map<ShaderIdentity, Entry> _shaders;
	std::map<std::vector<ShaderIdentity>, PipelineLayoutSpec> _layouts;
};

// Creates the Vulkan pipeline behind a cache key.
// A single compute stage makes a compute pipeline, anything else uses dynamic rendering
// with dynamic viewport and scissor.
struct PipelineFactory {
	struct CreateInfo {
		vk::Device device;
		ShaderLibrary* library_p;
		PipelineLayouts* layouts_p;
	};
	void init(const CreateInfo& info) {
		_device = info.device;
		_library_p = info.library_p;
		_layouts_p = info.layouts_p;
	}

	// builds through a transient pipeline cache whose data becomes the persisted blob
	auto build(const PipelineKey& key) -> PipelineCache::Built;
	// rebuilds with a persisted blob seeding the driver cache
	auto restore(const PipelineKey& key, std::span<const uint8_t> blob) -> vk::Pipeline;

	auto static get_module_deprecation() -> bool& {
		static bool _shader_modules_deprecated = true;
		return _shader_modules_deprecated;
	}
	void static set_module_deprecation(vk::PhysicalDevice physical_device);

private:
	auto create(const PipelineKey& key, vk::PipelineCache cache) -> vk::Pipeline;
	auto create_compute(const PipelineKey& key, vk::PipelineLayout layout, vk::PipelineCache cache,
		const vk::PipelineShaderStageCreateInfo& stage) -> vk::Pipeline;
	auto create_graphics(const PipelineKey& key, vk::PipelineLayout layout, vk::PipelineCache cache,
		std::span<const vk::PipelineShaderStageCreateInfo> stages) -> vk::Pipeline;

	vk::Device _device = nullptr;
	ShaderLibrary* _library_p = nullptr;
	PipelineLayouts* _layouts_p = nullptr;
};
} // namespace bindery
