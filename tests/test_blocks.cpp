#include <vector>
#include <cstring>
#include <gtest/gtest.h>
#include "bindery/core/error.hpp"
#include "bindery/device/blocks.hpp"
#include "bindery/entities/camera.hpp"
#include "bindery/entities/material.hpp"

using namespace bindery;

namespace {
struct Record {
	float values[4];
	uint32_t id;
};

struct ResourceBlockTest: public ::testing::Test {
	void SetUp() override {
		_timeline.init({});
		_timeline.advance();
		_regions.init({ .timeline_p = &_timeline });
		_blocks.init({ .regions_p = &_regions, .timeline_p = &_timeline });
		_memory.resize(1024);
		_region = _regions.wrap({ .address = _base, .size = _memory.size(), .host_p = _memory.data() });
	}
	void TearDown() override {
		_regions.destroy();
	}
	template<typename T> auto read(vk::DeviceSize offset) -> T {
		T value;
		std::memcpy(&value, _memory.data() + offset, sizeof(T));
		return value;
	}
	void expect_errc(Errc errc, auto&& fn) {
		try {
			fn();
			ADD_FAILURE() << "expected " << to_string(errc);
		}
		catch (const Error& error) {
			EXPECT_EQ(error.errc(), errc);
		}
	}

	static constexpr vk::DeviceAddress _base = 0x10000;
	FrameTimeline _timeline;
	RegionAllocator _regions;
	ResourceBlockAllocator _blocks;
	std::vector<std::byte> _memory;
	RegionHandle _region;
};
} // namespace

TEST_F(ResourceBlockTest, AllocateWritesInitialValue) {
	auto block = _blocks.allocate(_region, Record { { 1, 2, 3, 4 }, 42 });
	auto stored = read<Record>(block.offset);
	EXPECT_EQ(stored.values[2], 3.0f);
	EXPECT_EQ(stored.id, 42u);
	EXPECT_EQ(_blocks.address_of(block), _base + block.offset);
	EXPECT_EQ(block.offset % 16, 0u);
}

TEST_F(ResourceBlockTest, UpdateKeepsTheAddress) {
	auto block = _blocks.allocate(_region, Record { {}, 1 });
	auto address = _blocks.address_of(block);
	_blocks.update(block, Record { {}, 2 });
	EXPECT_EQ(_blocks.address_of(block), address);
	EXPECT_EQ(read<Record>(block.offset).id, 2u);
}

TEST_F(ResourceBlockTest, RegionDoesNotGrow) {
	auto camera = CameraBlock::from_view(glm::mat4(1), glm::mat4(1), glm::vec3(0));
	_blocks.allocate(_region, camera);
	_blocks.allocate(_region, camera);
	expect_errc(Errc::eOutOfRegionSpace, [&] { _blocks.allocate(_region, camera); });
	EXPECT_EQ(_blocks.live_count(), 2u);
}

TEST_F(ResourceBlockTest, UnmappableRegionRejectsWrites) {
	auto region = _regions.wrap({ .address = 0x20000, .size = 256 });
	expect_errc(Errc::eRegionNotMappable, [&] { _blocks.allocate(region, Record {}); });

	// the staged path only reserves the range
	auto block = _blocks.reserve<Record>(region);
	EXPECT_EQ(_blocks.address_of(block), 0x20000 + block.offset);
	expect_errc(Errc::eRegionNotMappable, [&] { _blocks.update(block, Record {}); });
}

TEST_F(ResourceBlockTest, FreeingTheRegionInvalidatesItsBlocks) {
	auto block = _blocks.allocate(_region, Record {});
	EXPECT_TRUE(_blocks.is_live(block));
	_regions.free(_region);
	EXPECT_FALSE(_regions.is_live(_region));
	EXPECT_FALSE(_blocks.is_live(block));
	expect_errc(Errc::eStaleHandle, [&] { _blocks.address_of(block); });
	expect_errc(Errc::eStaleHandle, [&] { _regions.free(_region); });
}

TEST_F(ResourceBlockTest, ReleasedRangeIsReusedAfterRetirement) {
	auto camera = CameraBlock::from_view(glm::mat4(1), glm::mat4(1), glm::vec3(0));
	auto a = _blocks.allocate(_region, camera);
	_blocks.allocate(_region, camera);
	_blocks.release(a);
	EXPECT_FALSE(_blocks.is_live(a));
	expect_errc(Errc::eStaleHandle, [&] { _blocks.update(a, camera); });

	// the range is still owned by epoch 1
	_blocks.collect_garbage();
	expect_errc(Errc::eOutOfRegionSpace, [&] { _blocks.allocate(_region, camera); });

	_timeline.retire(1);
	_blocks.collect_garbage();
	auto c = _blocks.allocate(_region, camera);
	EXPECT_EQ(c.offset, a.offset);
}

TEST_F(ResourceBlockTest, ReplaceDefersTheOldRecord) {
	MaterialBlock material;
	auto block = _blocks.allocate(_region, material);
	auto old_block = block;
	auto old_address = _blocks.address_of(block);

	material.metallic = 1.0f;
	_blocks.replace(block, material);
	EXPECT_NE(_blocks.address_of(block), old_address);
	EXPECT_FALSE(_blocks.is_live(old_block));
	// frames recorded before the reload still read the previous contents
	EXPECT_EQ(read<MaterialBlock>(old_block.offset).metallic, 0.0f);
	EXPECT_EQ(read<MaterialBlock>(block.offset).metallic, 1.0f);
	EXPECT_EQ(_blocks.live_count(), 1u);
}

TEST_F(ResourceBlockTest, ReplacingAReleasedBlockAllocatesNothing) {
	auto camera = CameraBlock::from_view(glm::mat4(1), glm::mat4(1), glm::vec3(0));
	auto block = _blocks.allocate(_region, camera);
	auto other = _blocks.allocate(_region, camera);
	_blocks.release(block);

	expect_errc(Errc::eStaleHandle, [&] { _blocks.replace(block, camera); });
	EXPECT_EQ(_blocks.live_count(), 1u);
	EXPECT_FALSE(_blocks.is_live(block));

	// the released range comes back once, nothing else holds region space
	_timeline.retire(1);
	_blocks.collect_garbage();
	_blocks.allocate(_region, camera);
	expect_errc(Errc::eOutOfRegionSpace, [&] { _blocks.allocate(_region, camera); });
	EXPECT_TRUE(_blocks.is_live(other));
}

TEST(HostRecords, ShapesMatchTheirLayout) {
	auto camera = CameraBlock::shape();
	EXPECT_EQ(camera.name, "CameraBuffer");
	EXPECT_EQ(camera.size(), sizeof(CameraBlock));
	EXPECT_EQ(camera.members.back().offset, 384u);

	auto material = MaterialBlock::shape();
	EXPECT_EQ(material.name, "MaterialBuffer");
	EXPECT_EQ(material.size(), sizeof(MaterialBlock));
	EXPECT_EQ(material.members[2].offset, 32u);
}
