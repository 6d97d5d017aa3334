#pragma once
#include <map>
#include <span>
#include <mutex>
#include <vector>
#include <cstdint>
#include <string_view>
#include <unordered_map>
#include <vulkan/vulkan.hpp>
#include "bindery/device/bindless.hpp"
#include "bindery/device/sampler.hpp"
#include "bindery/pipeline/reflection.hpp"

namespace bindery {
// Merged binding contract of a whole shader stage set.
// Binding numbers are unique per set, set 0 bindings 0/1 only ever hold the bindless arrays.
struct PipelineLayoutSpec {
	using BindingMap = std::map<uint32_t /*binding*/, ReflectedBinding>;

	auto find(uint32_t set, uint32_t binding) const -> const ReflectedBinding*;
	auto find_buffer_reference(std::string_view name) const -> const BlockShape*;
	// highest used set + 1, unused set numbers below it are gaps
	auto set_count() const -> uint32_t;
	// set 0 holds nothing besides the bindless arrays
	auto global_set_compatible() const -> bool;
	auto operator==(const PipelineLayoutSpec& other) const -> bool;

	std::map<uint32_t /*set*/, BindingMap> sets;
	std::vector<PushConstantRange> push_constants;
	std::vector<BlockShape> buffer_references;
	uint64_t hash = 0;
};

// Merges the reflections of all stages of one pipeline.
// Throws BindingConflict, ReservedBindingViolation, PushConstantMismatch or LayoutMismatch.
auto build_layout(std::span<const ShaderReflection> stages) -> PipelineLayoutSpec;
// checks a host record against the buffer reference of the same name,
// returns false if no stage references it and throws LayoutMismatch if the layouts differ
auto validate_block(const PipelineLayoutSpec& spec, const BlockShape& host) -> bool;

// Vulkan objects for merged specs, memoized per spec
struct PipelineLayouts {
	struct CreateInfo {
		vk::Device device;
		const BindlessTable* bindless_p;
		SamplerCache* samplers_p;
		uint32_t max_descriptor_count = 1024; // size of unbounded arrays outside the global set
	};
	void init(const CreateInfo& info);
	void destroy();
	auto get(const PipelineLayoutSpec& spec) -> vk::PipelineLayout;
	auto get_set_layouts(const PipelineLayoutSpec& spec) -> std::vector<vk::DescriptorSetLayout>;

private:
	struct Entry {
		PipelineLayoutSpec spec;
		vk::PipelineLayout layout;
		std::vector<vk::DescriptorSetLayout> set_layouts;
		std::vector<vk::DescriptorSetLayout> owned_set_layouts;
	};
	auto get_entry(const PipelineLayoutSpec& spec) -> const Entry&;
	auto create_set_layout(uint32_t set, const PipelineLayoutSpec::BindingMap& bindings) -> vk::DescriptorSetLayout;

	std::mutex _mutex;
	vk::Device _device = nullptr;
	const BindlessTable* _bindless_p = nullptr;
	SamplerCache* _samplers_p = nullptr;
	uint32_t _max_descriptor_count = 1024;
	vk::DescriptorSetLayout _empty_layout = nullptr;
	std::unordered_multimap<uint64_t, Entry> _entries;
};
} // namespace bindery
