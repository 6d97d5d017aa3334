#pragma once
#include <array>
#include <mutex>
#include <vector>
#include <cstdint>
#include <vulkan/vulkan.hpp>
#include "bindery/core/slots.hpp"
#include "bindery/core/timeline.hpp"

namespace bindery {
enum class SlotKind: uint32_t { eTexture, eSampler };

struct BindlessSlot {
	uint32_t index;
	SlotKind kind;
	uint32_t generation;
	auto operator==(const BindlessSlot&) const -> bool = default;
};

// pending write of a single array element of the global set
struct DescriptorWrite {
	SlotKind kind;
	uint32_t index;
	vk::ImageView view = nullptr;
	vk::Sampler sampler = nullptr;
};

// Global descriptor set addressed by plain integers.
// Set 0 binding 0 holds the texture array, binding 1 the sampler array,
// call sites must not assume anything else about the slot layout.
struct BindlessRegistry {
	static constexpr uint32_t texture_binding = 0;
	static constexpr uint32_t sampler_binding = 1;

	virtual ~BindlessRegistry() = default;
	virtual auto register_texture(vk::ImageView view) -> BindlessSlot = 0;
	virtual auto register_sampler(vk::Sampler sampler) -> BindlessSlot = 0;
	virtual void release(const BindlessSlot& slot) = 0;
	virtual auto is_live(const BindlessSlot& slot) const -> bool = 0;
	virtual auto descriptor_set() const -> vk::DescriptorSet = 0;
	virtual auto set_layout() const -> vk::DescriptorSetLayout = 0;
};

struct BindlessTable: public BindlessRegistry {
	struct Limits {
		uint32_t textures = 1024;
		uint32_t samplers = 16;
	};
	struct CreateInfo {
		vk::Device device = nullptr; // null keeps the table headless, writes only queue up
		FrameTimeline* timeline_p;
		Limits limits = {};
		// written into slots once their release retired
		vk::ImageView fallback_view = nullptr;
		vk::Sampler fallback_sampler = nullptr;
	};
	void init(const CreateInfo& info);
	void destroy(vk::Device device);

	// the descriptor is written at the next flush, so the index is usable from the next recorded frame
	auto register_texture(vk::ImageView view) -> BindlessSlot override;
	auto register_sampler(vk::Sampler sampler) -> BindlessSlot override;
	void release(const BindlessSlot& slot) override;
	auto is_live(const BindlessSlot& slot) const -> bool override;
	auto descriptor_set() const -> vk::DescriptorSet override;
	auto set_layout() const -> vk::DescriptorSetLayout override;

	// recycle slots whose release epoch retired
	void collect_garbage();
	// hand out queued writes in the order they were issued
	auto take_updates() -> std::vector<DescriptorWrite>;
	// apply queued writes, called from the submission thread before recording
	void flush(vk::Device device);

	auto live_count(SlotKind kind) const -> uint32_t;
	auto limits() const -> const Limits& {
		return _limits;
	}
	// layout bindings of the reserved slots, shared by every pipeline layout using set 0
	auto static reserved_bindings(const Limits& limits) -> std::array<vk::DescriptorSetLayoutBinding, 2>;
	auto static reserved_binding_flags() -> std::array<vk::DescriptorBindingFlags, 2>;

private:
	auto register_slot(SlotKind kind, vk::ImageView view, vk::Sampler sampler) -> BindlessSlot;
	void collect_locked();
	auto slots(SlotKind kind) -> SlotAllocator& {
		return kind == SlotKind::eTexture ? _textures : _samplers;
	}
	auto slots(SlotKind kind) const -> const SlotAllocator& {
		return kind == SlotKind::eTexture ? _textures : _samplers;
	}

	mutable std::mutex _mutex;
	FrameTimeline* _timeline_p = nullptr;
	Limits _limits;
	SlotAllocator _textures;
	SlotAllocator _samplers;
	DeferredQueue<std::pair<SlotKind, uint32_t>> _garbage;
	std::vector<DescriptorWrite> _updates;
	vk::ImageView _fallback_view = nullptr;
	vk::Sampler _fallback_sampler = nullptr;
	// global set
	vk::DescriptorSetLayout _layout = nullptr;
	vk::DescriptorPool _pool = nullptr;
	vk::DescriptorSet _set = nullptr;
};
} // namespace bindery
