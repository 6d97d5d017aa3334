#include <print>
#include <format>
#include <algorithm>
#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_to_string.hpp>
#include "bindery/core/hash.hpp"
#include "bindery/core/error.hpp"
#include "bindery/pipeline/layout.hpp"

namespace bindery {
namespace {
auto same_members(const std::vector<BlockMember>& a, const std::vector<BlockMember>& b) -> bool {
	if (a.size() != b.size()) return false;
	for (size_t i = 0; i < a.size(); i++) {
		if (a[i].offset != b[i].offset || a[i].size != b[i].size) return false;
	}
	return true;
}
auto same_binding(const ReflectedBinding& a, const ReflectedBinding& b) -> bool {
	return a.same_shape(b) && a.stages == b.stages && a.bindless == b.bindless;
}
auto describe(const ReflectedBinding& binding) -> std::string {
	std::string count = binding.unbounded() ? "unbounded" : std::to_string(binding.count);
	return std::format("{} [{}] \"{}\"", to_string(binding.kind), count, binding.name);
}
void hash_members(Hasher& hasher, const std::vector<BlockMember>& members) {
	hasher.add((uint64_t)members.size());
	for (auto& member: members) {
		hasher.add(member.offset);
		hasher.add(member.size);
	}
}
auto compute_hash(const PipelineLayoutSpec& spec) -> uint64_t {
	Hasher hasher;
	hasher.add((uint64_t)spec.sets.size());
	for (auto& [set, bindings]: spec.sets) {
		hasher.add(set);
		hasher.add((uint64_t)bindings.size());
		for (auto& [_, binding]: bindings) {
			hasher.add(binding.binding);
			hasher.add(binding.kind);
			hasher.add(binding.count);
			hasher.add((VkShaderStageFlags)binding.stages);
			hasher.add(binding.bindless);
			hasher.add(binding.immutable_sampler.has_value());
			if (binding.immutable_sampler) hasher.add(*binding.immutable_sampler);
		}
	}
	hasher.add((uint64_t)spec.push_constants.size());
	for (auto& range: spec.push_constants) {
		hasher.add(range.offset);
		hasher.add(range.size);
		hasher.add((VkShaderStageFlags)range.stages);
		hash_members(hasher, range.members);
	}
	hasher.add((uint64_t)spec.buffer_references.size());
	for (auto& shape: spec.buffer_references) {
		hasher.add(std::string_view(shape.name));
		hash_members(hasher, shape.members);
	}
	return hasher.value();
}

void merge_binding(PipelineLayoutSpec& spec, const ReflectedBinding& reflected) {
	// the reserved slots may only hold the bindless arrays
	bool reserved = reflected.set == 0 && (reflected.binding == BindlessRegistry::texture_binding
		|| reflected.binding == BindlessRegistry::sampler_binding);
	if (reserved && !reflected.bindless) {
		throw Error(Errc::eReservedBindingViolation, std::format("set 0 binding {} is reserved for the bindless table, found {}",
			reflected.binding, describe(reflected)));
	}

	// insert set if not present
	auto [unique_bindings_it, _] = spec.sets.emplace(reflected.set, PipelineLayoutSpec::BindingMap());
	auto& unique_bindings = unique_bindings_it->second;

	// insert binding if not present
	auto [binding_it, binding_unique] = unique_bindings.emplace(reflected.binding, reflected);
	if (binding_unique) return;

	// update stage flag if binding already existed
	auto& binding = binding_it->second;
	if (!binding.same_shape(reflected)) {
		throw Error(Errc::eBindingConflict, std::format("set {} binding {}: {} conflicts with {}",
			reflected.set, reflected.binding, describe(binding), describe(reflected)));
	}
	binding.stages |= reflected.stages;
}
void merge_push_constant(PipelineLayoutSpec& spec, const PushConstantRange& range) {
	if (spec.push_constants.empty()) {
		spec.push_constants.push_back(range);
		return;
	}
	// every declaring stage must agree on one range
	auto& merged = spec.push_constants.front();
	if (merged.offset != range.offset || merged.size != range.size) {
		throw Error(Errc::ePushConstantMismatch, std::format("push constant range [{}, {}) of {} disagrees with [{}, {}) of {}",
			range.offset, range.offset + range.size, vk::to_string(range.stages),
			merged.offset, merged.offset + merged.size, vk::to_string(merged.stages)));
	}
	if (!same_members(merged.members, range.members)) {
		throw Error(Errc::ePushConstantMismatch, std::format("push constant contents of {} differ from {}",
			vk::to_string(range.stages), vk::to_string(merged.stages)));
	}
	merged.stages |= range.stages;
}
void merge_buffer_reference(PipelineLayoutSpec& spec, const BlockShape& shape) {
	auto* merged_p = spec.find_buffer_reference(shape.name);
	if (!merged_p) {
		spec.buffer_references.push_back(shape);
		return;
	}
	if (!merged_p->same_layout(shape)) {
		throw Error(Errc::eLayoutMismatch, std::format("buffer reference {} is declared with different layouts across stages", shape.name));
	}
}
} // namespace

auto PipelineLayoutSpec::find(uint32_t set, uint32_t binding) const -> const ReflectedBinding* {
	auto set_it = sets.find(set);
	if (set_it == sets.end()) return nullptr;
	auto binding_it = set_it->second.find(binding);
	return binding_it == set_it->second.end() ? nullptr : &binding_it->second;
}
auto PipelineLayoutSpec::find_buffer_reference(std::string_view name) const -> const BlockShape* {
	for (auto& shape: buffer_references) {
		if (shape.name == name) return &shape;
	}
	return nullptr;
}
auto PipelineLayoutSpec::set_count() const -> uint32_t {
	return sets.empty() ? 0 : sets.rbegin()->first + 1;
}
auto PipelineLayoutSpec::global_set_compatible() const -> bool {
	auto set_it = sets.find(0);
	if (set_it == sets.end()) return true;
	return std::all_of(set_it->second.begin(), set_it->second.end(), [](auto& pair) { return pair.second.bindless; });
}
auto PipelineLayoutSpec::operator==(const PipelineLayoutSpec& other) const -> bool {
	if (hash != other.hash) return false;
	if (sets.size() != other.sets.size()) return false;
	for (auto& [set, bindings]: sets) {
		auto other_it = other.sets.find(set);
		if (other_it == other.sets.end() || other_it->second.size() != bindings.size()) return false;
		for (auto& [index, binding]: bindings) {
			auto binding_it = other_it->second.find(index);
			if (binding_it == other_it->second.end() || !same_binding(binding, binding_it->second)) return false;
		}
	}
	if (push_constants.size() != other.push_constants.size()) return false;
	for (size_t i = 0; i < push_constants.size(); i++) {
		auto& a = push_constants[i];
		auto& b = other.push_constants[i];
		if (a.offset != b.offset || a.size != b.size || a.stages != b.stages) return false;
		if (!same_members(a.members, b.members)) return false;
	}
	if (buffer_references.size() != other.buffer_references.size()) return false;
	for (size_t i = 0; i < buffer_references.size(); i++) {
		if (buffer_references[i].name != other.buffer_references[i].name) return false;
		if (!buffer_references[i].same_layout(other.buffer_references[i])) return false;
	}
	return true;
}

auto build_layout(std::span<const ShaderReflection> stages) -> PipelineLayoutSpec {
	PipelineLayoutSpec spec;
	for (auto& stage: stages) {
		for (auto& binding: stage.bindings) merge_binding(spec, binding);
		for (auto& range: stage.push_constants) merge_push_constant(spec, range);
		for (auto& shape: stage.buffer_references) merge_buffer_reference(spec, shape);
	}
	spec.hash = compute_hash(spec);
	return spec;
}
auto validate_block(const PipelineLayoutSpec& spec, const BlockShape& host) -> bool {
	auto* reflected_p = spec.find_buffer_reference(host.name);
	if (!reflected_p) return false;
	if (!reflected_p->same_layout(host)) {
		std::string detail;
		for (size_t i = 0; i < std::max(host.members.size(), reflected_p->members.size()); i++) {
			auto field = [&](const std::vector<BlockMember>& members) {
				return i < members.size() ? std::format("{}@{}+{}", members[i].name, members[i].offset, members[i].size) : std::string("-");
			};
			detail += std::format("\n\thost {} | shader {}", field(host.members), field(reflected_p->members));
		}
		throw Error(Errc::eLayoutMismatch, std::format("host record {} does not match its shader layout:{}", host.name, detail));
	}
	return true;
}

void PipelineLayouts::init(const CreateInfo& info) {
	_device = info.device;
	_bindless_p = info.bindless_p;
	_samplers_p = info.samplers_p;
	_max_descriptor_count = info.max_descriptor_count;
	if (_device) _empty_layout = _device.createDescriptorSetLayout({});
}
void PipelineLayouts::destroy() {
	std::lock_guard lock(_mutex);
	for (auto& [_, entry]: _entries) {
		_device.destroyPipelineLayout(entry.layout);
		for (auto& layout: entry.owned_set_layouts) _device.destroyDescriptorSetLayout(layout);
	}
	_entries.clear();
	if (_empty_layout) _device.destroyDescriptorSetLayout(_empty_layout);
	_empty_layout = nullptr;
}
auto PipelineLayouts::get(const PipelineLayoutSpec& spec) -> vk::PipelineLayout {
	std::lock_guard lock(_mutex);
	return get_entry(spec).layout;
}
auto PipelineLayouts::get_set_layouts(const PipelineLayoutSpec& spec) -> std::vector<vk::DescriptorSetLayout> {
	std::lock_guard lock(_mutex);
	return get_entry(spec).set_layouts;
}
auto PipelineLayouts::get_entry(const PipelineLayoutSpec& spec) -> const Entry& {
	auto [beg, end] = _entries.equal_range(spec.hash);
	for (auto it = beg; it != end; it++) {
		if (it->second.spec == spec) return it->second;
	}

	// set 0 is the global bindless set unless a stage put more into it
	Entry entry { .spec = spec };
	uint32_t set_count = std::max(spec.set_count(), 1u);
	for (uint32_t set = 0; set < set_count; set++) {
		auto set_it = spec.sets.find(set);
		if (set == 0 && spec.global_set_compatible()) {
			entry.set_layouts.push_back(_bindless_p->set_layout());
		}
		else if (set_it == spec.sets.end()) {
			entry.set_layouts.push_back(_empty_layout);
		}
		else {
			entry.set_layouts.push_back(create_set_layout(set, set_it->second));
			entry.owned_set_layouts.push_back(entry.set_layouts.back());
		}
	}

	// create pipeline layout
	std::vector<vk::PushConstantRange> push_constants;
	for (auto& range: spec.push_constants) {
		push_constants.push_back({ .stageFlags = range.stages, .offset = range.offset, .size = range.size });
	}
	entry.layout = _device.createPipelineLayout({
		.setLayoutCount = (uint32_t)entry.set_layouts.size(),
		.pSetLayouts = entry.set_layouts.data(),
		.pushConstantRangeCount = (uint32_t)push_constants.size(),
		.pPushConstantRanges = push_constants.data(),
	});
	return _entries.emplace(spec.hash, std::move(entry))->second;
}
auto PipelineLayouts::create_set_layout(uint32_t set, const PipelineLayoutSpec::BindingMap& unique_bindings) -> vk::DescriptorSetLayout {
	std::vector<vk::DescriptorSetLayoutBinding> bindings;
	std::vector<vk::DescriptorBindingFlags> binding_flags;
	std::vector<vk::Sampler> immutable_samplers;
	vk::DescriptorSetLayoutCreateFlags layout_flags;
	bindings.reserve(unique_bindings.size() + 2);
	immutable_samplers.reserve(unique_bindings.size());

	if (set == 0) {
		// keep the reserved arrays identical to the global set, binding the global set still fails here
		std::println("set 0 declares bindings besides the bindless arrays, the global set cannot be bound to this layout");
		for (auto& binding: BindlessTable::reserved_bindings(_bindless_p->limits())) bindings.push_back(binding);
		for (auto& flags: BindlessTable::reserved_binding_flags()) binding_flags.push_back(flags);
		layout_flags = vk::DescriptorSetLayoutCreateFlagBits::eUpdateAfterBindPool;
	}
	for (auto& [_, reflected]: unique_bindings) {
		if (reflected.bindless) continue;
		vk::DescriptorSetLayoutBinding binding {
			.binding = reflected.binding,
			.descriptorType = to_descriptor_type(reflected.kind),
			.descriptorCount = reflected.unbounded() ? _max_descriptor_count : reflected.count,
			.stageFlags = reflected.stages,
		};
		// assign immutable sampler
		if (reflected.immutable_sampler) {
			immutable_samplers.push_back(_samplers_p->get(*reflected.immutable_sampler));
			binding.descriptorCount = 1;
			binding.pImmutableSamplers = &immutable_samplers.back();
		}
		bindings.push_back(binding);
		binding_flags.push_back(vk::DescriptorBindingFlagBits::ePartiallyBound);
	}

	vk::StructureChain<vk::DescriptorSetLayoutCreateInfo, vk::DescriptorSetLayoutBindingFlagsCreateInfo> chain_layout {
		{
			.flags = layout_flags,
			.bindingCount = (uint32_t)bindings.size(),
			.pBindings = bindings.data(),
		},
		{
			.bindingCount = (uint32_t)binding_flags.size(),
			.pBindingFlags = binding_flags.data(),
		}
	};
	return _device.createDescriptorSetLayout(chain_layout.get());
}
} // namespace bindery
