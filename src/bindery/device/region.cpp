#include <print>
#include <cstring>
#include <format>
#include "bindery/core/error.hpp"
#include "bindery/device/region.hpp"

namespace bindery {
namespace {
auto create_ranges(vk::DeviceSize size) -> vma::VirtualBlock {
	vma::VirtualBlockCreateInfo info_block {
		.size = size,
	};
	return vma::createVirtualBlock(info_block);
}
} // namespace

void RegionAllocator::init(const CreateInfo& info) {
	_device = info.device;
	_vmalloc = info.vmalloc;
	_timeline_p = info.timeline_p;
	_slots.init();
	_regions.clear();
}
void RegionAllocator::destroy() {
	std::lock_guard lock(_mutex);
	for (uint32_t i = 0; i < _regions.size(); i++) {
		if (_slots.state(i) == SlotAllocator::State::eFree) continue;
		release(_regions[i]);
	}
	_garbage.drain();
	_regions.clear();
	_slots.init();
}

auto RegionAllocator::create(const RegionInfo& info) -> RegionHandle {
	vk::BufferCreateInfo info_buffer {
		.size = info.size,
		.usage = info.usage | vk::BufferUsageFlagBits::eShaderDeviceAddress,
		.sharingMode = vk::SharingMode::eExclusive,
	};
	// add flags to allow host access if requested (ReBAR if available)
	vma::AllocationCreateInfo info_allocation {
		.flags = !info.host_accessible ? vma::AllocationCreateFlags{} :
			vma::AllocationCreateFlagBits::eHostAccessSequentialWrite |
			vma::AllocationCreateFlagBits::eHostAccessAllowTransferInstead |
			vma::AllocationCreateFlagBits::eMapped,
		.usage = vma::MemoryUsage::eAutoPreferDevice,
		.requiredFlags = vk::MemoryPropertyFlagBits::eDeviceLocal,
		.preferredFlags = !info.host_accessible ? vk::MemoryPropertyFlags{} :
			vk::MemoryPropertyFlagBits::eHostCached |
			vk::MemoryPropertyFlagBits::eHostVisible |
			vk::MemoryPropertyFlagBits::eHostCoherent,
	};
	DeviceBufferRegion region;
	std::tie(region._buffer, region._allocation) = _vmalloc.createBuffer(info_buffer, info_allocation);
	region._address = _device.getBufferAddress({ .buffer = region._buffer });
	region._size = info.size;
	region._owning = true;

	// check for host coherency and visibility
	if (info.host_accessible) {
		vk::MemoryPropertyFlags props = _vmalloc.getAllocationMemoryProperties(region._allocation);
		if (props & vk::MemoryPropertyFlagBits::eHostVisible) {
			region._host_p = static_cast<std::byte*>(_vmalloc.getAllocationInfo(region._allocation).pMappedData);
		}
		else std::println("region of {} bytes is not host visible, writes require staging", info.size);
		region._require_flushing = !(props & vk::MemoryPropertyFlagBits::eHostCoherent);
	}
	region._ranges = create_ranges(info.size);

	std::lock_guard lock(_mutex);
	return insert(std::move(region));
}
auto RegionAllocator::wrap(const WrapInfo& info) -> RegionHandle {
	DeviceBufferRegion region {
		._ranges = create_ranges(info.size),
		._address = info.address,
		._size = info.size,
		._host_p = static_cast<std::byte*>(info.host_p),
		._owning = false,
	};
	std::lock_guard lock(_mutex);
	return insert(std::move(region));
}
auto RegionAllocator::insert(DeviceBufferRegion&& region) -> RegionHandle {
	auto slot = _slots.allocate();
	if (!slot) {
		release(region);
		throw Error(Errc::eCapacityExceeded, "region allocator is out of handles");
	}
	if (slot->index >= _regions.size()) _regions.resize(slot->index + 1);
	region._generation = slot->generation;
	_regions[slot->index] = std::move(region);
	return { slot->index, slot->generation };
}

void RegionAllocator::free(RegionHandle handle) {
	std::lock_guard lock(_mutex);
	if (!_slots.retire(handle.index, handle.generation)) {
		throw Error(Errc::eStaleHandle, std::format("region {} (gen {}) is not live", handle.index, handle.generation));
	}
	_garbage.push(_timeline_p->current(), handle.index);
}
auto RegionAllocator::is_live(RegionHandle handle) const -> bool {
	std::lock_guard lock(_mutex);
	return _slots.is_live(handle.index, handle.generation);
}
auto RegionAllocator::get(RegionHandle handle) const -> DeviceBufferRegion {
	std::lock_guard lock(_mutex);
	return get_locked(handle);
}
auto RegionAllocator::get_locked(RegionHandle handle) const -> const DeviceBufferRegion& {
	if (!_slots.is_live(handle.index, handle.generation)) {
		throw Error(Errc::eStaleHandle, std::format("region {} (gen {}) is not live", handle.index, handle.generation));
	}
	return _regions[handle.index];
}

auto RegionAllocator::suballocate(RegionHandle handle, vk::DeviceSize size, vk::DeviceSize alignment) -> std::optional<Range> {
	std::lock_guard lock(_mutex);
	auto& region = get_locked(handle);
	vma::VirtualAllocationCreateInfo info_range {
		.size = size,
		.alignment = alignment,
	};
	Range range;
	vk::Result result = region._ranges.virtualAllocate(&info_range, &range.allocation, &range.offset);
	if (result != vk::Result::eSuccess) return std::nullopt;
	return range;
}
void RegionAllocator::release_range(RegionHandle handle, vma::VirtualAllocation allocation) {
	std::lock_guard lock(_mutex);
	// ranges of a freed region go away with the region itself
	if (!_slots.is_live(handle.index, handle.generation)) return;
	_regions[handle.index]._ranges.virtualFree(allocation);
}
void RegionAllocator::write(RegionHandle handle, vk::DeviceSize offset, const void* data_p, vk::DeviceSize byte_count) {
	std::lock_guard lock(_mutex);
	auto& region = get_locked(handle);
	if (!region.mappable()) {
		throw Error(Errc::eRegionNotMappable, std::format("region {} is not host visible", handle.index));
	}
	if (offset + byte_count > region._size) {
		throw Error(Errc::eOutOfRegionSpace, std::format("write of {} bytes at {} exceeds region size {}", byte_count, offset, region._size));
	}
	std::memcpy(region._host_p + offset, data_p, byte_count);
	if (region._require_flushing) _vmalloc.flushAllocation(region._allocation, offset, byte_count);
}

void RegionAllocator::collect_garbage() {
	std::lock_guard lock(_mutex);
	for (uint32_t index: _garbage.collect(_timeline_p->retired())) {
		release(_regions[index]);
		_slots.recycle(index);
	}
}
auto RegionAllocator::live_count() const -> uint32_t {
	std::lock_guard lock(_mutex);
	return _slots.live_count();
}
void RegionAllocator::release(DeviceBufferRegion& region) {
	if (region._ranges) {
		region._ranges.clearVirtualBlock();
		region._ranges.destroy();
	}
	if (region._owning) _vmalloc.destroyBuffer(region._buffer, region._allocation);
	region = {};
}
} // namespace bindery
