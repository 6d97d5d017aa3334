#include <print>
#include <system_error>
#include <vector>
#include <algorithm>
#include "bindery/core/context.hpp"

namespace bindery {
void Context::init(const CreateInfo& info) {
	_device = info.device;
	_frames_in_flight = std::max(info.frames_in_flight, 1u);
	_cache_path = info.cache_path;

	_timeline.init({ .device = info.device });
	_regions.init({
		.device = info.device,
		.vmalloc = info.vmalloc,
		.timeline_p = &_timeline,
	});
	_blocks.init({
		.regions_p = &_regions,
		.timeline_p = &_timeline,
	});
	_bindless.init({
		.device = info.device,
		.timeline_p = &_timeline,
		.limits = info.bindless,
		.fallback_view = info.fallback_view,
		.fallback_sampler = info.fallback_sampler,
	});
	_samplers.init(info.device);
	_layouts.init({
		.device = info.device,
		.bindless_p = &_bindless,
		.samplers_p = &_samplers,
	});

	// pipelines
	if (info.physical_device) PipelineFactory::set_module_deprecation(info.physical_device);
	_factory.init({
		.device = info.device,
		.library_p = &_shaders,
		.layouts_p = &_layouts,
	});
	_cache.init({
		.timeline_p = &_timeline,
		.capacity = info.pipeline_capacity,
		.tag = info.physical_device ? PipelineCache::FormatTag::from(info.physical_device.getProperties()) : PipelineCache::FormatTag{},
		.destroy = [device = info.device](vk::Pipeline pipeline) { if (device) device.destroyPipeline(pipeline); },
		.restore = [this](const PipelineKey& key, std::span<const uint8_t> blob) { return _factory.restore(key, blob); },
	});
	if (!_cache_path.empty() && _cache.load(_cache_path)) {
		std::println("loaded pipeline cache {}", _cache_path.string());
	}

	// camera slices are rewritten every frame, materials live in their own region
	vk::DeviceSize camera_stride = (sizeof(CameraBlock) + 255) & ~vk::DeviceSize(255);
	if (info.camera_memory) _camera_region = _regions.wrap(*info.camera_memory);
	else _camera_region = _regions.create({
		.size = camera_stride * _frames_in_flight,
		.usage = vk::BufferUsageFlagBits::eStorageBuffer,
		.host_accessible = true,
	});
	if (info.material_memory) _material_region = _regions.wrap(*info.material_memory);
	else _material_region = _regions.create({
		.size = info.material_region_size,
		.usage = vk::BufferUsageFlagBits::eStorageBuffer,
		.host_accessible = true,
	});
	_cameras.clear();
	for (uint32_t i = 0; i < _frames_in_flight; i++) {
		_cameras.push_back(_blocks.allocate(_camera_region, CameraBlock::from_view(glm::mat4(1), glm::mat4(1), glm::vec3(0))));
	}
}
// the device must be idle
void Context::destroy() {
	if (!_cache_path.empty()) {
		try {
			_cache.save(_cache_path);
		}
		catch (const std::system_error& error) {
			// losing the cache only costs rebuilds on the next run
			std::println("pipeline cache not saved to {}: {}", _cache_path.string(), error.what());
		}
	}
	_cache.destroy();
	_layouts.destroy();
	_samplers.destroy();
	_cameras.clear();
	_regions.destroy();
	_bindless.destroy(_device);
	_timeline.destroy(_device);
}

auto Context::begin_frame(uint64_t timeout) -> std::optional<uint64_t> {
	// the next epoch reuses the slice of the epoch frames_in_flight before it
	uint64_t next = _timeline.current() + 1;
	if (next > _frames_in_flight && !_timeline.wait(_device, next - _frames_in_flight, timeout)) {
		return std::nullopt;
	}
	_timeline.poll(_device);

	_bindless.collect_garbage();
	_blocks.collect_garbage();
	_regions.collect_garbage();
	_cache.collect_garbage();
	_bindless.flush(_device);
	return _timeline.advance();
}
auto Context::frame_signal(vk::PipelineStageFlags2 stages) const -> vk::SemaphoreSubmitInfo {
	return _timeline.signal_info(stages);
}
auto Context::frame_index() const -> uint32_t {
	return (uint32_t)(_timeline.current() % _frames_in_flight);
}
auto Context::descriptor_set() const -> vk::DescriptorSet {
	return _bindless.descriptor_set();
}

void Context::update_camera(const CameraBlock& camera) {
	_blocks.update(_cameras[frame_index()], camera);
}
auto Context::camera_address() const -> vk::DeviceAddress {
	return _blocks.address_of(_cameras[frame_index()]);
}

auto Context::create_material(const MaterialBlock& material) -> ResourceBlock<MaterialBlock> {
	return _blocks.allocate(_material_region, material);
}
void Context::reload_material(ResourceBlock<MaterialBlock>& block, const MaterialBlock& material) {
	_blocks.replace(block, material);
}
void Context::release_material(const ResourceBlock<MaterialBlock>& block) {
	_blocks.release(block);
}
auto Context::material_address(const ResourceBlock<MaterialBlock>& block) const -> vk::DeviceAddress {
	return _blocks.address_of(block);
}

auto Context::add_shader(std::span<const uint32_t> code) -> ShaderIdentity {
	return _shaders.add(code);
}
auto Context::pipeline(std::span<const ShaderIdentity> shaders, const FixedFunctionState& state) -> vk::Pipeline {
	PipelineKey key {
		.shaders = { shaders.begin(), shaders.end() },
		.layout = _shaders.layout(shaders),
		.state = state,
	};
	return get_pipeline(key);
}
auto Context::compute_pipeline(const ShaderIdentity& shader) -> vk::Pipeline {
	PipelineKey key {
		.shaders = { shader },
		.layout = _shaders.layout(std::span<const ShaderIdentity>(&shader, 1)),
		.state = {},
	};
	return get_pipeline(key);
}
auto Context::pipeline_layout(std::span<const ShaderIdentity> shaders) -> vk::PipelineLayout {
	return _layouts.get(_shaders.layout(shaders));
}
auto Context::get_pipeline(const PipelineKey& key) -> vk::Pipeline {
	validate_block(key.layout, CameraBlock::shape());
	validate_block(key.layout, MaterialBlock::shape());
	return _cache.get_or_build(key, [&] { return _factory.build(key); });
}
} // namespace bindery
