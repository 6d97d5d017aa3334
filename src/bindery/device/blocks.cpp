#include <format>
#include "bindery/core/error.hpp"
#include "bindery/device/blocks.hpp"

namespace bindery {
auto ResourceBlockAllocator::allocate_raw(RegionHandle region, vk::DeviceSize size, vk::DeviceSize alignment, const void* data_p) -> ResourceBlock<void> {
	if (data_p != nullptr && !_regions_p->get(region).mappable()) {
		throw Error(Errc::eRegionNotMappable, std::format("region {} is not host visible, reserve and upload instead", region.index));
	}
	// sub-allocate without growth so addresses stay stable
	alignment = std::max(alignment, _min_alignment);
	auto range = _regions_p->suballocate(region, size, alignment);
	if (!range) {
		throw Error(Errc::eOutOfRegionSpace, std::format("region {} has no room for a {} byte block", region.index, size));
	}
	if (data_p != nullptr) _regions_p->write(region, range->offset, data_p, size);

	std::lock_guard lock(_mutex);
	auto slot = _slots.allocate();
	if (!slot) {
		_regions_p->release_range(region, range->allocation);
		throw Error(Errc::eCapacityExceeded, "resource block allocator is out of handles");
	}
	if (slot->index >= _records.size()) _records.resize(slot->index + 1);
	_records[slot->index] = {
		.region = region,
		.range = range->allocation,
		.offset = range->offset,
	};
	return ResourceBlock<void> {
		.region = region,
		.offset = range->offset,
		.index = slot->index,
		.generation = slot->generation,
	};
}
void ResourceBlockAllocator::write_raw(uint32_t index, uint32_t generation, const void* data_p, vk::DeviceSize size) {
	Record record;
	{
		std::lock_guard lock(_mutex);
		record = get_locked(index, generation);
	}
	_regions_p->write(record.region, record.offset, data_p, size);
}
auto ResourceBlockAllocator::address_raw(uint32_t index, uint32_t generation) const -> vk::DeviceAddress {
	Record record;
	{
		std::lock_guard lock(_mutex);
		record = get_locked(index, generation);
	}
	return _regions_p->get(record.region)._address + record.offset;
}
auto ResourceBlockAllocator::is_live_raw(uint32_t index, uint32_t generation) const -> bool {
	RegionHandle region;
	{
		std::lock_guard lock(_mutex);
		if (!_slots.is_live(index, generation)) return false;
		region = _records[index].region;
	}
	return _regions_p->is_live(region);
}
void ResourceBlockAllocator::release_raw(uint32_t index, uint32_t generation) {
	std::lock_guard lock(_mutex);
	if (!_slots.retire(index, generation)) {
		throw Error(Errc::eStaleHandle, std::format("resource block {} (gen {}) is not live", index, generation));
	}
	_garbage.push(_timeline_p->current(), index);
}
auto ResourceBlockAllocator::get_locked(uint32_t index, uint32_t generation) const -> const Record& {
	if (!_slots.is_live(index, generation)) {
		throw Error(Errc::eStaleHandle, std::format("resource block {} (gen {}) is not live", index, generation));
	}
	return _records[index];
}

void ResourceBlockAllocator::collect_garbage() {
	std::lock_guard lock(_mutex);
	for (uint32_t index: _garbage.collect(_timeline_p->retired())) {
		_regions_p->release_range(_records[index].region, _records[index].range);
		_slots.recycle(index);
	}
}
auto ResourceBlockAllocator::live_count() const -> uint32_t {
	std::lock_guard lock(_mutex);
	return _slots.live_count();
}
} // namespace bindery
