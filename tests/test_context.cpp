#include <vector>
#include <cstring>
#include <format>
#include <filesystem>
#include <unistd.h>
#include <gtest/gtest.h>
#include "fake_handles.hpp"
#include "bindery/core/error.hpp"
#include "bindery/core/context.hpp"

using namespace bindery;

namespace {
struct ContextTest: public ::testing::Test {
	void SetUp() override {
		_camera_memory.resize(1024);
		_material_memory.resize(128);
	}
	void TearDown() override {
		if (_initialized) _context.destroy();
	}
	void init(std::filesystem::path cache_path = {}) {
		_context.init({
			.device = nullptr,
			.physical_device = nullptr,
			.vmalloc = nullptr,
			.frames_in_flight = 2,
			.cache_path = cache_path,
			.camera_memory = RegionAllocator::WrapInfo {
				.address = _camera_base,
				.size = _camera_memory.size(),
				.host_p = _camera_memory.data(),
			},
			// room for a single material
			.material_memory = RegionAllocator::WrapInfo {
				.address = _material_base,
				.size = _material_memory.size(),
				.host_p = _material_memory.data(),
			},
		});
		_initialized = true;
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

	static constexpr vk::DeviceAddress _camera_base = 0x20000;
	static constexpr vk::DeviceAddress _material_base = 0x40000;
	Context _context;
	bool _initialized = false;
	std::vector<std::byte> _camera_memory;
	std::vector<std::byte> _material_memory;
};
} // namespace

TEST_F(ContextTest, CameraSlicesRotateWithTheFrame) {
	init();
	ASSERT_EQ(_context.begin_frame(), 1u);
	auto first = _context.camera_address();
	ASSERT_EQ(_context.begin_frame(), 2u);
	auto second = _context.camera_address();
	EXPECT_NE(first, second);

	_context._timeline.retire(1);
	ASSERT_EQ(_context.begin_frame(), 3u);
	EXPECT_EQ(_context.camera_address(), first);

	auto camera = CameraBlock::from_view(glm::mat4(1), glm::mat4(1), glm::vec3(1, 2, 3));
	_context.update_camera(camera);
	CameraBlock stored;
	std::memcpy(&stored, _camera_memory.data() + (first - _camera_base), sizeof(stored));
	EXPECT_EQ(stored.world_position, glm::vec4(1, 2, 3, 1));
}

TEST_F(ContextTest, BeginFrameWaitsForTheSliceOwner) {
	init();
	ASSERT_EQ(_context.begin_frame(), 1u);
	ASSERT_EQ(_context.begin_frame(), 2u);

	// epoch 3 reuses the slice of epoch 1
	EXPECT_FALSE(_context.begin_frame(0).has_value());
	EXPECT_EQ(_context._timeline.current(), 2u);
	_context._timeline.retire(1);
	EXPECT_EQ(_context.begin_frame(0), 3u);
	EXPECT_EQ(_context.frame_index(), 1u);
}

TEST_F(ContextTest, ReleasedMaterialRangeWaitsForItsEpoch) {
	init();
	ASSERT_EQ(_context.begin_frame(), 1u);
	auto material = _context.create_material(MaterialBlock {});
	EXPECT_EQ(_context.material_address(material), _material_base + material.offset);
	expect_errc(Errc::eOutOfRegionSpace, [&] { _context.create_material(MaterialBlock {}); });

	_context.release_material(material);
	expect_errc(Errc::eStaleHandle, [&] { _context.material_address(material); });
	ASSERT_EQ(_context.begin_frame(), 2u);
	expect_errc(Errc::eOutOfRegionSpace, [&] { _context.create_material(MaterialBlock {}); });

	_context._timeline.retire(1);
	ASSERT_EQ(_context.begin_frame(), 3u);
	auto reused = _context.create_material(MaterialBlock {});
	EXPECT_EQ(reused.offset, material.offset);
}

TEST_F(ContextTest, ReloadedMaterialMovesToAFreshRecord) {
	_material_memory.resize(256);
	init();
	ASSERT_EQ(_context.begin_frame(), 1u);
	auto material = _context.create_material(MaterialBlock {});
	auto before = _context.material_address(material);

	MaterialBlock reloaded {};
	reloaded.metallic = 0.5f;
	_context.reload_material(material, reloaded);
	auto after = _context.material_address(material);
	EXPECT_NE(before, after);

	MaterialBlock stored;
	std::memcpy(&stored, _material_memory.data() + (after - _material_base), sizeof(stored));
	EXPECT_EQ(stored.metallic, 0.5f);
}

TEST_F(ContextTest, BeginFrameAppliesQueuedDescriptorWrites) {
	init();
	auto slot = _context.bindless().register_texture(fake_handle<vk::ImageView>(7));
	ASSERT_EQ(_context.begin_frame(), 1u);
	EXPECT_TRUE(_context.bindless().is_live(slot));
	EXPECT_TRUE(_context.bindless().take_updates().empty());
}

TEST_F(ContextTest, UnwritableCacheStillTearsDown) {
	auto dir = std::filesystem::temp_directory_path() / std::format("bindery_missing_{}", ::getpid());
	init(dir / "pipelines.bin");
	ASSERT_EQ(_context.begin_frame(), 1u);
	_context.create_material(MaterialBlock {});

	EXPECT_NO_THROW(_context.destroy());
	_initialized = false;
	EXPECT_EQ(_context._regions.live_count(), 0u);
}
