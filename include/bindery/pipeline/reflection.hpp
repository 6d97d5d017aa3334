#pragma once
#include <span>
#include <limits>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <algorithm>
#include <vulkan/vulkan.hpp>
#include "bindery/device/sampler.hpp"

namespace bindery {
enum class BindingKind: uint32_t {
	eSampledImage,
	eSampler,
	eStorageBuffer,
	eBufferReference, // uniform block holding only device addresses
	eUniformBuffer,
	eStorageImage,
	eCombinedImageSampler,
	eUniformTexelBuffer,
	eStorageTexelBuffer,
	eUniformBufferDynamic, // "_dyn" name suffix
	eStorageBufferDynamic, // "_dyn" name suffix
	eInputAttachment,
	eAccelerationStructure, // ray queries from raster or compute stages
};
auto to_string(BindingKind kind) -> std::string_view;
auto to_descriptor_type(BindingKind kind) -> vk::DescriptorType;

struct ReflectedBinding {
	static constexpr uint32_t count_unbounded = std::numeric_limits<uint32_t>::max();

	auto unbounded() const -> bool {
		return count == count_unbounded;
	}
	// kind, count and immutable sampler, the parts a pipeline layout depends on
	auto same_shape(const ReflectedBinding& other) const -> bool {
		return kind == other.kind && count == other.count && immutable_sampler == other.immutable_sampler;
	}

	uint32_t set;
	uint32_t binding;
	BindingKind kind;
	uint32_t count = 1;
	vk::ShaderStageFlags stages;
	std::string name;
	bool bindless = false; // global texture/sampler array of the bindless table
	std::optional<SamplerDesc> immutable_sampler;
};

struct BlockMember {
	std::string name;
	uint32_t offset;
	uint32_t size;
};
// field layout of a struct reached through a buffer reference, or of a host record
struct BlockShape {
	auto size() const -> uint32_t {
		uint32_t end = 0;
		for (auto& member: members) end = std::max(end, member.offset + member.size);
		return end;
	}
	// member names may differ between stages, offsets and sizes may not
	auto same_layout(const BlockShape& other) const -> bool {
		if (members.size() != other.members.size()) return false;
		for (size_t i = 0; i < members.size(); i++) {
			if (members[i].offset != other.members[i].offset) return false;
			if (members[i].size != other.members[i].size) return false;
		}
		return true;
	}

	std::string name;
	std::vector<BlockMember> members;
};

struct PushConstantRange {
	uint32_t offset;
	uint32_t size;
	vk::ShaderStageFlags stages;
	std::vector<BlockMember> members;
};

struct VertexInput {
	uint32_t location;
	vk::Format format;
};

struct ShaderReflection {
	vk::ShaderStageFlagBits stage;
	std::string entry_point = "main";
	std::vector<ReflectedBinding> bindings;
	std::vector<PushConstantRange> push_constants;
	std::vector<BlockShape> buffer_references;
	std::vector<VertexInput> vertex_inputs;
};

// Pure analysis of one SPIR-V module, never touches a device.
// Throws InvalidBytecode for malformed modules and LayoutMismatch when two
// buffer reference structs of the same name disagree within the module.
auto analyze(std::span<const uint32_t> code) -> ShaderReflection;
} // namespace bindery
