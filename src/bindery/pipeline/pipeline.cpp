#include <print>
#include <format>
#include <cstring>
#include <algorithm>
#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_to_string.hpp>
#include <vulkan/vulkan_format_traits.hpp>
#include "bindery/core/hash.hpp"
#include "bindery/core/error.hpp"
#include "bindery/pipeline/pipeline.hpp"

namespace bindery {
auto ShaderLibrary::add(std::span<const uint32_t> code) -> ShaderIdentity {
	Hasher hasher;
	hasher.add_range(code);
	uint64_t hash = hasher.value();
	{
		std::lock_guard lock(_mutex);
		for (auto& [id, _]: _shaders) {
			if (id.hash == hash) return id;
		}
	}

	// reflection is pure, keep it outside the lock
	ShaderReflection reflection = analyze(code);
	ShaderIdentity id { .hash = hash, .stage = reflection.stage };
	std::lock_guard lock(_mutex);
	_shaders.try_emplace(id, Entry {
		.code = std::vector<uint32_t>(code.begin(), code.end()),
		.reflection = std::move(reflection),
	});
	return id;
}
auto ShaderLibrary::contains(const ShaderIdentity& id) const -> bool {
	std::lock_guard lock(_mutex);
	return _shaders.contains(id);
}
auto ShaderLibrary::get(const ShaderIdentity& id) const -> const ShaderReflection& {
	std::lock_guard lock(_mutex);
	return get_locked(id).reflection;
}
auto ShaderLibrary::code(const ShaderIdentity& id) const -> std::span<const uint32_t> {
	std::lock_guard lock(_mutex);
	return get_locked(id).code;
}
auto ShaderLibrary::layout(std::span<const ShaderIdentity> ids) -> const PipelineLayoutSpec& {
	std::lock_guard lock(_mutex);
	std::vector<ShaderIdentity> key(ids.begin(), ids.end());
	auto it = _layouts.find(key);
	if (it != _layouts.end()) return it->second;

	std::vector<ShaderReflection> stages;
	stages.reserve(ids.size());
	for (auto& id: ids) stages.push_back(get_locked(id).reflection);
	auto [inserted_it, _] = _layouts.emplace(std::move(key), build_layout(stages));
	return inserted_it->second;
}
auto ShaderLibrary::get_locked(const ShaderIdentity& id) const -> const Entry& {
	auto it = _shaders.find(id);
	if (it == _shaders.end()) {
		throw Error(Errc::eStaleHandle, std::format("shader {:016x} ({}) was never added",
			id.hash, vk::to_string(id.stage)));
	}
	return it->second;
}

void PipelineFactory::set_module_deprecation(vk::PhysicalDevice physical_device) {
	auto available_extensions = physical_device.enumerateDeviceExtensionProperties();
	for (auto& available: available_extensions) {
		if (strcmp(vk::KHRMaintenance5ExtensionName, available.extensionName) == 0) {
			get_module_deprecation() = false;
			return;
		}
	}
	get_module_deprecation() = true;
}

auto PipelineFactory::build(const PipelineKey& key) -> PipelineCache::Built {
	vk::PipelineCache cache = _device.createPipelineCache({});
	PipelineCache::Built built;
	try {
		built.pipeline = create(key, cache);
		built.blob = _device.getPipelineCacheData(cache);
	}
	catch (...) {
		if (built.pipeline) _device.destroyPipeline(built.pipeline);
		_device.destroyPipelineCache(cache);
		throw;
	}
	_device.destroyPipelineCache(cache);
	return built;
}
auto PipelineFactory::restore(const PipelineKey& key, std::span<const uint8_t> blob) -> vk::Pipeline {
	vk::PipelineCache cache = _device.createPipelineCache({
		.initialDataSize = blob.size(),
		.pInitialData = blob.data(),
	});
	vk::Pipeline pipeline;
	try {
		pipeline = create(key, cache);
	}
	catch (...) {
		_device.destroyPipelineCache(cache);
		throw;
	}
	_device.destroyPipelineCache(cache);
	return pipeline;
}

auto PipelineFactory::create(const PipelineKey& key, vk::PipelineCache cache) -> vk::Pipeline {
	vk::PipelineLayout layout = _layouts_p->get(key.layout);

	// gather shader code, pointers into the create infos must stay put
	std::vector<vk::ShaderModuleCreateInfo> module_infos;
	std::vector<vk::PipelineShaderStageCreateInfo> stages;
	std::vector<vk::ShaderModule> modules;
	module_infos.reserve(key.shaders.size());
	stages.reserve(key.shaders.size());
	for (auto& id: key.shaders) {
		auto code = _library_p->code(id);
		module_infos.push_back({
			.codeSize = code.size() * sizeof(uint32_t),
			.pCode = code.data(),
		});
	}

	vk::Pipeline pipeline;
	try {
		// optionally create shader modules in the deprecated way
		for (size_t i = 0; i < key.shaders.size(); i++) {
			vk::ShaderModule module = nullptr;
			if (get_module_deprecation()) {
				module = _device.createShaderModule(module_infos[i]);
				modules.push_back(module);
			}
			stages.push_back({
				.pNext = get_module_deprecation() ? nullptr : &module_infos[i],
				.stage = key.shaders[i].stage,
				.module = module,
				.pName = _library_p->get(key.shaders[i]).entry_point.c_str(),
			});
		}

		bool compute = stages.size() == 1 && stages[0].stage == vk::ShaderStageFlagBits::eCompute;
		if (compute) pipeline = create_compute(key, layout, cache, stages[0]);
		else pipeline = create_graphics(key, layout, cache, stages);
	}
	catch (...) {
		for (auto module: modules) _device.destroyShaderModule(module);
		throw;
	}
	// destroy shader modules if previously created
	for (auto module: modules) _device.destroyShaderModule(module);
	return pipeline;
}
auto PipelineFactory::create_compute(const PipelineKey&, vk::PipelineLayout layout, vk::PipelineCache cache,
	const vk::PipelineShaderStageCreateInfo& stage) -> vk::Pipeline {
	vk::ComputePipelineCreateInfo info_compute_pipe {
		.stage = stage,
		.layout = layout,
	};
	auto [result, pipeline] = _device.createComputePipeline(cache, info_compute_pipe);
	if (result != vk::Result::eSuccess) {
		if (pipeline) _device.destroyPipeline(pipeline);
		throw Error(Errc::eBuildFailed, std::format("error creating compute pipeline: {}", vk::to_string(result)));
	}
	return pipeline;
}
auto PipelineFactory::create_graphics(const PipelineKey& key, vk::PipelineLayout layout, vk::PipelineCache cache,
	std::span<const vk::PipelineShaderStageCreateInfo> stages) -> vk::Pipeline {
	auto& state = key.state;

	// vertex attributes are tightly packed in a single binding, ordered by location
	vk::VertexInputBindingDescription bind_desc {
		.binding = 0,
		.stride = 0,
		.inputRate = vk::VertexInputRate::eVertex,
	};
	std::vector<vk::VertexInputAttributeDescription> attr_descs;
	for (auto& id: key.shaders) {
		if (id.stage != vk::ShaderStageFlagBits::eVertex) continue;
		for (auto& input: _library_p->get(id).vertex_inputs) {
			attr_descs.push_back({
				.location = input.location,
				.binding = bind_desc.binding,
				.format = input.format,
				.offset = 0, // computed below
			});
		}
	}
	auto sorter = [](auto& a, auto& b) { return a.location < b.location; };
	std::sort(std::begin(attr_descs), std::end(attr_descs), sorter);
	for (auto& attribute: attr_descs) {
		attribute.offset = bind_desc.stride;
		bind_desc.stride += vk::blockSize(attribute.format);
	}
	vk::PipelineVertexInputStateCreateInfo info_vertex_input;
	if (attr_descs.size() > 0) {
		info_vertex_input = {
			.vertexBindingDescriptionCount = 1,
			.pVertexBindingDescriptions = &bind_desc,
			.vertexAttributeDescriptionCount = (uint32_t)attr_descs.size(),
			.pVertexAttributeDescriptions = attr_descs.data(),
		};
	}

	vk::PipelineInputAssemblyStateCreateInfo info_input_assembly {
		.topology = state.topology,
		.primitiveRestartEnable = vk::False,
	};
	// viewport and scissor are set while recording
	vk::PipelineViewportStateCreateInfo info_viewport {
		.viewportCount = 1,
		.scissorCount = 1,
	};
	vk::PipelineRasterizationStateCreateInfo info_rasterization {
		.depthClampEnable = false,
		.rasterizerDiscardEnable = false,
		.polygonMode = state.polygon_mode,
		.cullMode = state.cull_mode,
		.frontFace = state.front_face,
		.depthBiasEnable = false,
		.lineWidth = 1.0,
	};
	vk::PipelineMultisampleStateCreateInfo info_multisampling {
		.rasterizationSamples = state.samples,
		.sampleShadingEnable = false,
		.alphaToCoverageEnable = false,
		.alphaToOneEnable = false,
	};
	vk::PipelineDepthStencilStateCreateInfo info_depth_stencil {
		.depthTestEnable = state.depth.test,
		.depthWriteEnable = state.depth.write,
		.depthCompareOp = state.depth.compare,
		.depthBoundsTestEnable = false,
		.stencilTestEnable = state.stencil.test,
	};
	vk::PipelineColorBlendAttachmentState info_blend_attach {
		.blendEnable = state.color.blend,
		.srcColorBlendFactor = vk::BlendFactor::eSrcAlpha,
		.dstColorBlendFactor = vk::BlendFactor::eOneMinusSrcAlpha,
		.colorBlendOp = vk::BlendOp::eAdd,
		.srcAlphaBlendFactor = vk::BlendFactor::eOne,
		.dstAlphaBlendFactor = vk::BlendFactor::eZero,
		.alphaBlendOp = vk::BlendOp::eAdd,
		.colorWriteMask =
			vk::ColorComponentFlagBits::eR |
			vk::ColorComponentFlagBits::eG |
			vk::ColorComponentFlagBits::eB |
			vk::ColorComponentFlagBits::eA,
	};
	std::vector<vk::PipelineColorBlendAttachmentState> blend_attachs(state.color.formats.size(), info_blend_attach);
	vk::PipelineColorBlendStateCreateInfo info_blend_state {
		.logicOpEnable = false,
		.attachmentCount = (uint32_t)blend_attachs.size(),
		.pAttachments = blend_attachs.data(),
		.blendConstants = std::array<float, 4>{ 1.0, 1.0, 1.0, 1.0 },
	};
	std::array<vk::DynamicState, 2> dynamic_states { vk::DynamicState::eViewport, vk::DynamicState::eScissor };
	vk::PipelineDynamicStateCreateInfo info_dynamic_state {
		.dynamicStateCount = (uint32_t)dynamic_states.size(),
		.pDynamicStates = dynamic_states.data(),
	};

	vk::PipelineRenderingCreateInfo info_rendering {
		.colorAttachmentCount = (uint32_t)state.color.formats.size(),
		.pColorAttachmentFormats = state.color.formats.data(),
		.depthAttachmentFormat = state.depth.format,
		.stencilAttachmentFormat = state.stencil.format,
	};
	vk::GraphicsPipelineCreateInfo info_pipeline {
		.pNext = &info_rendering,
		.stageCount = (uint32_t)stages.size(),
		.pStages = stages.data(),
		.pVertexInputState = &info_vertex_input,
		.pInputAssemblyState = &info_input_assembly,
		.pViewportState = &info_viewport,
		.pRasterizationState = &info_rasterization,
		.pMultisampleState = &info_multisampling,
		.pDepthStencilState = &info_depth_stencil,
		.pColorBlendState = &info_blend_state,
		.pDynamicState = &info_dynamic_state,
		.layout = layout,
	};
	auto [result, pipeline] = _device.createGraphicsPipeline(cache, info_pipeline);
	if (result != vk::Result::eSuccess) {
		if (pipeline) _device.destroyPipeline(pipeline);
		throw Error(Errc::eBuildFailed, std::format("error creating graphics pipeline: {}", vk::to_string(result)));
	}
	return pipeline;
}
} // namespace bindery
