#include <print>
#include <format>
#include <utility>
#include "bindery/core/error.hpp"
#include "bindery/device/bindless.hpp"

namespace bindery {
void BindlessTable::init(const CreateInfo& info) {
	_timeline_p = info.timeline_p;
	_limits = info.limits;
	_fallback_view = info.fallback_view;
	_fallback_sampler = info.fallback_sampler;
	_textures.init(_limits.textures);
	_samplers.init(_limits.samplers);
	_updates.clear();
	if (!info.device) return;

	// create global set layout
	auto bindings = reserved_bindings(_limits);
	auto binding_flags = reserved_binding_flags();
	vk::StructureChain<vk::DescriptorSetLayoutCreateInfo, vk::DescriptorSetLayoutBindingFlagsCreateInfo> chain_layout {
		{
			.flags = vk::DescriptorSetLayoutCreateFlagBits::eUpdateAfterBindPool,
			.bindingCount = (uint32_t)bindings.size(),
			.pBindings = bindings.data(),
		},
		{
			.bindingCount = (uint32_t)binding_flags.size(),
			.pBindingFlags = binding_flags.data(),
		}
	};
	_layout = info.device.createDescriptorSetLayout(chain_layout.get());

	// create descriptor pool and allocate the single global set from it
	std::array<vk::DescriptorPoolSize, 2> pool_sizes {{
		{ .type = vk::DescriptorType::eSampledImage, .descriptorCount = _limits.textures },
		{ .type = vk::DescriptorType::eSampler, .descriptorCount = _limits.samplers },
	}};
	_pool = info.device.createDescriptorPool({
		.flags = vk::DescriptorPoolCreateFlagBits::eUpdateAfterBind,
		.maxSets = 1,
		.poolSizeCount = (uint32_t)pool_sizes.size(),
		.pPoolSizes = pool_sizes.data(),
	});
	_set = info.device.allocateDescriptorSets({
		.descriptorPool = _pool,
		.descriptorSetCount = 1,
		.pSetLayouts = &_layout,
	}).front();
}
void BindlessTable::destroy(vk::Device device) {
	std::lock_guard lock(_mutex);
	if (device) {
		device.destroyDescriptorPool(_pool);
		device.destroyDescriptorSetLayout(_layout);
	}
	_pool = nullptr;
	_layout = nullptr;
	_set = nullptr;
	_garbage.drain();
	_updates.clear();
}

auto BindlessTable::register_texture(vk::ImageView view) -> BindlessSlot {
	return register_slot(SlotKind::eTexture, view, nullptr);
}
auto BindlessTable::register_sampler(vk::Sampler sampler) -> BindlessSlot {
	return register_slot(SlotKind::eSampler, nullptr, sampler);
}
auto BindlessTable::register_slot(SlotKind kind, vk::ImageView view, vk::Sampler sampler) -> BindlessSlot {
	std::lock_guard lock(_mutex);
	collect_locked();
	auto slot = slots(kind).allocate();
	if (!slot) {
		auto capacity = slots(kind).capacity();
		std::println("bindless table: {} capacity of {} reached", kind == SlotKind::eTexture ? "texture" : "sampler", capacity);
		throw Error(Errc::eCapacityExceeded, std::format("bindless table holds at most {} {}", capacity,
			kind == SlotKind::eTexture ? "textures" : "samplers"));
	}
	_updates.push_back({ .kind = kind, .index = slot->index, .view = view, .sampler = sampler });
	return { slot->index, kind, slot->generation };
}
void BindlessTable::release(const BindlessSlot& slot) {
	std::lock_guard lock(_mutex);
	if (!slots(slot.kind).retire(slot.index, slot.generation)) {
		throw Error(Errc::eStaleHandle, std::format("bindless slot {} (gen {}) is not live", slot.index, slot.generation));
	}
	// frames up to the one being recorded may still read the descriptor
	_garbage.push(_timeline_p->current(), { slot.kind, slot.index });
}
auto BindlessTable::is_live(const BindlessSlot& slot) const -> bool {
	std::lock_guard lock(_mutex);
	return slots(slot.kind).is_live(slot.index, slot.generation);
}
auto BindlessTable::descriptor_set() const -> vk::DescriptorSet {
	return _set;
}
auto BindlessTable::set_layout() const -> vk::DescriptorSetLayout {
	return _layout;
}

void BindlessTable::collect_garbage() {
	std::lock_guard lock(_mutex);
	collect_locked();
}
void BindlessTable::collect_locked() {
	for (auto [kind, index]: _garbage.collect(_timeline_p->retired())) {
		slots(kind).recycle(index);
		if (kind == SlotKind::eTexture && _fallback_view) {
			_updates.push_back({ .kind = kind, .index = index, .view = _fallback_view });
		}
		else if (kind == SlotKind::eSampler && _fallback_sampler) {
			_updates.push_back({ .kind = kind, .index = index, .sampler = _fallback_sampler });
		}
	}
}
auto BindlessTable::take_updates() -> std::vector<DescriptorWrite> {
	std::lock_guard lock(_mutex);
	return std::exchange(_updates, {});
}
void BindlessTable::flush(vk::Device device) {
	auto updates = take_updates();
	// headless tables only drain the queue
	if (updates.empty() || !device || !_set) return;

	// image infos must stay put while the writes point at them
	std::vector<vk::DescriptorImageInfo> infos;
	std::vector<vk::WriteDescriptorSet> writes;
	infos.reserve(updates.size());
	writes.reserve(updates.size());
	for (auto& update: updates) {
		bool texture = update.kind == SlotKind::eTexture;
		infos.push_back({
			.sampler = update.sampler,
			.imageView = update.view,
			.imageLayout = texture ? vk::ImageLayout::eShaderReadOnlyOptimal : vk::ImageLayout::eUndefined,
		});
		writes.push_back({
			.dstSet = _set,
			.dstBinding = texture ? texture_binding : sampler_binding,
			.dstArrayElement = update.index,
			.descriptorCount = 1,
			.descriptorType = texture ? vk::DescriptorType::eSampledImage : vk::DescriptorType::eSampler,
			.pImageInfo = &infos.back(),
		});
	}
	device.updateDescriptorSets(writes, {});
}
auto BindlessTable::live_count(SlotKind kind) const -> uint32_t {
	std::lock_guard lock(_mutex);
	return slots(kind).live_count();
}

auto BindlessTable::reserved_bindings(const Limits& limits) -> std::array<vk::DescriptorSetLayoutBinding, 2> {
	return {{
		{
			.binding = texture_binding,
			.descriptorType = vk::DescriptorType::eSampledImage,
			.descriptorCount = limits.textures,
			.stageFlags = vk::ShaderStageFlagBits::eAll,
		},
		{
			.binding = sampler_binding,
			.descriptorType = vk::DescriptorType::eSampler,
			.descriptorCount = limits.samplers,
			.stageFlags = vk::ShaderStageFlagBits::eAll,
		},
	}};
}
auto BindlessTable::reserved_binding_flags() -> std::array<vk::DescriptorBindingFlags, 2> {
	vk::DescriptorBindingFlags flags =
		vk::DescriptorBindingFlagBits::ePartiallyBound |
		vk::DescriptorBindingFlagBits::eUpdateAfterBind |
		vk::DescriptorBindingFlagBits::eUpdateUnusedWhilePending;
	return { flags, flags };
}
} // namespace bindery
