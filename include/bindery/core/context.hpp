#pragma once
#include <span>
#include <limits>
#include <vector>
#include <cstdint>
#include <optional>
#include <filesystem>
#include <vulkan/vulkan.hpp>
#include <vk_mem_alloc.hpp>
#include "bindery/core/timeline.hpp"
#include "bindery/device/blocks.hpp"
#include "bindery/device/region.hpp"
#include "bindery/device/sampler.hpp"
#include "bindery/device/bindless.hpp"
#include "bindery/entities/camera.hpp"
#include "bindery/entities/material.hpp"
#include "bindery/pipeline/cache.hpp"
#include "bindery/pipeline/layout.hpp"
#include "bindery/pipeline/pipeline.hpp"

namespace bindery {
// Process-wide owner of the binding model.
// init after the device exists, destroy before the device goes away.
// A null device keeps it headless: no vulkan objects, region memory has to be wrapped.
struct Context {
	struct CreateInfo {
		vk::Device device;
		vk::PhysicalDevice physical_device;
		vma::Allocator vmalloc;
		uint32_t frames_in_flight = 2;
		BindlessTable::Limits bindless = {};
		size_t pipeline_capacity = 256;
		std::filesystem::path cache_path = {}; // empty disables persistence
		vk::DeviceSize material_region_size = 1 << 20;
		vk::ImageView fallback_view = nullptr;
		vk::Sampler fallback_sampler = nullptr;
		// externally owned host-visible memory, allocated through vmalloc when empty
		std::optional<RegionAllocator::WrapInfo> camera_memory = std::nullopt;
		std::optional<RegionAllocator::WrapInfo> material_memory = std::nullopt;
	};
	auto static get() noexcept -> Context& {
		static Context instance;
		return instance;
	}
	void init(const CreateInfo& info);
	void destroy();

	// Waits until the frame that last used this frame's slice retired, then recycles
	// released resources and applies descriptor writes. Returns the epoch the frame's
	// submission must signal, or nothing if the timeout elapsed first.
	auto begin_frame(uint64_t timeout = std::numeric_limits<uint64_t>::max()) -> std::optional<uint64_t>;
	auto frame_signal(vk::PipelineStageFlags2 stages = vk::PipelineStageFlagBits2::eAllCommands) const -> vk::SemaphoreSubmitInfo;
	auto frame_index() const -> uint32_t;
	auto descriptor_set() const -> vk::DescriptorSet;
	auto bindless() -> BindlessTable& {
		return _bindless;
	}

	// camera of the frame currently being recorded
	void update_camera(const CameraBlock& camera);
	auto camera_address() const -> vk::DeviceAddress;

	auto create_material(const MaterialBlock& material) -> ResourceBlock<MaterialBlock>;
	// frames already recorded keep the previous record until they retired
	void reload_material(ResourceBlock<MaterialBlock>& block, const MaterialBlock& material);
	void release_material(const ResourceBlock<MaterialBlock>& block);
	auto material_address(const ResourceBlock<MaterialBlock>& block) const -> vk::DeviceAddress;

	auto add_shader(std::span<const uint32_t> code) -> ShaderIdentity;
	// shaders in stage order, host records are checked against the reflected buffer references
	auto pipeline(std::span<const ShaderIdentity> shaders, const FixedFunctionState& state) -> vk::Pipeline;
	auto compute_pipeline(const ShaderIdentity& shader) -> vk::Pipeline;
	auto pipeline_layout(std::span<const ShaderIdentity> shaders) -> vk::PipelineLayout;

	vk::Device _device = nullptr;
	uint32_t _frames_in_flight = 2;
	std::filesystem::path _cache_path;
	FrameTimeline _timeline;
	RegionAllocator _regions;
	ResourceBlockAllocator _blocks;
	BindlessTable _bindless;
	SamplerCache _samplers;
	ShaderLibrary _shaders;
	PipelineLayouts _layouts;
	PipelineFactory _factory;
	PipelineCache _cache;
	RegionHandle _camera_region;
	RegionHandle _material_region;
	std::vector<ResourceBlock<CameraBlock>> _cameras; // one per frame in flight

private:
	auto get_pipeline(const PipelineKey& key) -> vk::Pipeline;
};
} // namespace bindery
