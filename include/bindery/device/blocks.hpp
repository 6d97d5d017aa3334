#pragma once
#include <mutex>
#include <format>
#include <vector>
#include <algorithm>
#include <type_traits>
#include <vulkan/vulkan.hpp>
#include <vk_mem_alloc.hpp>
#include "bindery/core/error.hpp"
#include "bindery/core/slots.hpp"
#include "bindery/core/timeline.hpp"
#include "bindery/device/region.hpp"

namespace bindery {
// Typed record living in a DeviceBufferRegion that shaders reach through its device address.
// Holds a non-owning reference into the region, freeing the region makes the block stale.
template<typename T>
struct ResourceBlock {
	RegionHandle region;
	vk::DeviceSize offset = 0;
	uint32_t index = std::numeric_limits<uint32_t>::max();
	uint32_t generation = 0;
};

struct ResourceBlockAllocator {
	struct CreateInfo {
		RegionAllocator* regions_p;
		FrameTimeline* timeline_p;
		vk::DeviceSize min_alignment = 16;
	};
	void init(const CreateInfo& info) {
		_regions_p = info.regions_p;
		_timeline_p = info.timeline_p;
		_min_alignment = info.min_alignment;
		_slots.init();
		_records.clear();
	}

	// allocate and write the initial value, the region must be host visible
	template<typename T> auto allocate(RegionHandle region, const T& value) -> ResourceBlock<T> {
		static_assert(std::is_trivially_copyable_v<T>);
		return typed<T>(allocate_raw(region, sizeof(T), alignof(T), &value));
	}
	// allocate without writing, for regions filled through a staged upload
	template<typename T> auto reserve(RegionHandle region) -> ResourceBlock<T> {
		static_assert(std::is_trivially_copyable_v<T>);
		return typed<T>(allocate_raw(region, sizeof(T), alignof(T), nullptr));
	}
	template<typename T> void update(const ResourceBlock<T>& block, const T& value) {
		static_assert(std::is_trivially_copyable_v<T>);
		write_raw(block.index, block.generation, &value, sizeof(T));
	}
	template<typename T> auto address_of(const ResourceBlock<T>& block) const -> vk::DeviceAddress {
		return address_raw(block.index, block.generation);
	}
	template<typename T> auto is_live(const ResourceBlock<T>& block) const -> bool {
		return is_live_raw(block.index, block.generation);
	}
	// stale immediately, the range is reused once the current epoch retired
	template<typename T> void release(const ResourceBlock<T>& block) {
		release_raw(block.index, block.generation);
	}
	// swap in a new record (e.g. reloaded material), the old one is released deferred
	// so frames already recorded keep reading the previous address
	template<typename T> void replace(ResourceBlock<T>& block, const T& value) {
		if (!is_live(block)) {
			throw Error(Errc::eStaleHandle, std::format("resource block {} (gen {}) is not live", block.index, block.generation));
		}
		auto fresh = allocate(block.region, value);
		try {
			release(block);
		}
		catch (...) {
			// released concurrently, the fresh record has no owner
			release(fresh);
			throw;
		}
		block = fresh;
	}

	void collect_garbage();
	auto live_count() const -> uint32_t;

private:
	struct Record {
		RegionHandle region;
		vma::VirtualAllocation range;
		vk::DeviceSize offset;
	};
	template<typename T> auto typed(const ResourceBlock<void>& block) -> ResourceBlock<T> {
		return ResourceBlock<T> {
			.region = block.region,
			.offset = block.offset,
			.index = block.index,
			.generation = block.generation,
		};
	}
	auto allocate_raw(RegionHandle region, vk::DeviceSize size, vk::DeviceSize alignment, const void* data_p) -> ResourceBlock<void>;
	void write_raw(uint32_t index, uint32_t generation, const void* data_p, vk::DeviceSize size);
	auto address_raw(uint32_t index, uint32_t generation) const -> vk::DeviceAddress;
	auto is_live_raw(uint32_t index, uint32_t generation) const -> bool;
	void release_raw(uint32_t index, uint32_t generation);
	auto get_locked(uint32_t index, uint32_t generation) const -> const Record&;

	mutable std::mutex _mutex;
	RegionAllocator* _regions_p = nullptr;
	FrameTimeline* _timeline_p = nullptr;
	vk::DeviceSize _min_alignment = 16;
	SlotAllocator _slots;
	std::vector<Record> _records;
	DeferredQueue<uint32_t> _garbage;
};
} // namespace bindery
