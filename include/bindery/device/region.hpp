#pragma once
#include <mutex>
#include <limits>
#include <vector>
#include <cstddef>
#include <optional>
#include <vulkan/vulkan.hpp>
#include <vk_mem_alloc.hpp>
#include "bindery/core/slots.hpp"
#include "bindery/core/timeline.hpp"

namespace bindery {
struct RegionHandle {
	uint32_t index = std::numeric_limits<uint32_t>::max();
	uint32_t generation = 0;
	auto operator==(const RegionHandle&) const -> bool = default;
};

// address-stable range of gpu memory, the address is never a host pointer
struct DeviceBufferRegion {
	auto mappable() const -> bool {
		return _host_p != nullptr;
	}

	vk::Buffer _buffer = nullptr;
	vma::Allocation _allocation = nullptr;
	vma::VirtualBlock _ranges = nullptr; // sub-allocations handed out to resource blocks
	vk::DeviceAddress _address = 0;
	vk::DeviceSize _size = 0;
	std::byte* _host_p = nullptr;
	uint32_t _generation = 0;
	bool _require_flushing = false;
	bool _owning = false;
};

struct RegionAllocator {
	struct CreateInfo {
		vk::Device device = nullptr;
		vma::Allocator vmalloc = nullptr;
		FrameTimeline* timeline_p;
	};
	struct RegionInfo {
		vk::DeviceSize size;
		vk::BufferUsageFlags usage = vk::BufferUsageFlagBits::eStorageBuffer;
		bool host_accessible = true;
	};
	// externally owned memory, e.g. a buffer the application manages itself
	struct WrapInfo {
		vk::DeviceAddress address;
		vk::DeviceSize size;
		void* host_p = nullptr;
	};
	struct Range {
		vma::VirtualAllocation allocation;
		vk::DeviceSize offset;
	};

	void init(const CreateInfo& info);
	void destroy();

	auto create(const RegionInfo& info) -> RegionHandle;
	auto wrap(const WrapInfo& info) -> RegionHandle;
	// the handle goes stale immediately, memory is destroyed once the current epoch retired
	void free(RegionHandle handle);
	auto is_live(RegionHandle handle) const -> bool;
	auto get(RegionHandle handle) const -> DeviceBufferRegion;

	// sub-range management for resource blocks
	auto suballocate(RegionHandle handle, vk::DeviceSize size, vk::DeviceSize alignment) -> std::optional<Range>;
	void release_range(RegionHandle handle, vma::VirtualAllocation allocation);
	void write(RegionHandle handle, vk::DeviceSize offset, const void* data_p, vk::DeviceSize byte_count);

	void collect_garbage();
	auto live_count() const -> uint32_t;

private:
	auto insert(DeviceBufferRegion&& region) -> RegionHandle;
	auto get_locked(RegionHandle handle) const -> const DeviceBufferRegion&;
	void release(DeviceBufferRegion& region);

	mutable std::mutex _mutex;
	vk::Device _device = nullptr;
	vma::Allocator _vmalloc = nullptr;
	FrameTimeline* _timeline_p = nullptr;
	SlotAllocator _slots;
	std::vector<DeviceBufferRegion> _regions;
	DeferredQueue<uint32_t> _garbage;
};
} // namespace bindery
