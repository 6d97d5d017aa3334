#pragma once
#include <list>
#include <span>
#include <array>
#include <mutex>
#include <vector>
#include <future>
#include <cstdint>
#include <functional>
#include <filesystem>
#include <unordered_map>
#include <vulkan/vulkan.hpp>
#include "bindery/core/timeline.hpp"
#include "bindery/pipeline/layout.hpp"

namespace bindery {
// content hash of the bytecode plus its stage
struct ShaderIdentity {
	uint64_t hash;
	vk::ShaderStageFlagBits stage;
	auto operator<=>(const ShaderIdentity&) const = default;
};

struct FixedFunctionState {
	vk::PrimitiveTopology topology = vk::PrimitiveTopology::eTriangleList;
	vk::PolygonMode polygon_mode = vk::PolygonMode::eFill;
	vk::CullModeFlags cull_mode = vk::CullModeFlagBits::eBack;
	vk::FrontFace front_face = vk::FrontFace::eClockwise;
	vk::SampleCountFlagBits samples = vk::SampleCountFlagBits::e1;
	struct Color {
		std::vector<vk::Format> formats;
		vk::Bool32 blend = false;
		auto operator==(const Color&) const -> bool = default;
	} color = {};
	struct Depth {
		vk::Format format = vk::Format::eUndefined;
		vk::Bool32 write = false;
		vk::Bool32 test = false;
		vk::CompareOp compare = vk::CompareOp::eLessOrEqual;
		auto operator==(const Depth&) const -> bool = default;
	} depth = {};
	struct Stencil {
		vk::Format format = vk::Format::eUndefined;
		vk::Bool32 test = false;
		auto operator==(const Stencil&) const -> bool = default;
	} stencil = {};
	auto operator==(const FixedFunctionState&) const -> bool = default;
	auto hash() const -> uint64_t;
};

struct PipelineKey {
	auto hash() const -> uint64_t;
	auto operator==(const PipelineKey&) const -> bool = default;
	struct Hasher {
		auto operator()(const PipelineKey& key) const -> size_t {
			return (size_t)key.hash();
		}
	};

	std::vector<ShaderIdentity> shaders; // in stage order
	PipelineLayoutSpec layout;
	FixedFunctionState state;
};

// Pipelines memoized by key, at most one build per key in flight.
// Evicted pipelines are destroyed only after the last epoch that used them retired.
struct PipelineCache {
	struct Built {
		vk::Pipeline pipeline;
		std::vector<uint8_t> blob; // opaque backend data kept for persistence
	};
	using BuildFn = std::function<Built()>;
	using RestoreFn = std::function<vk::Pipeline(const PipelineKey&, std::span<const uint8_t>)>;
	using DestroyFn = std::function<void(vk::Pipeline)>;

	// identifies the backend a persisted blob was produced by
	struct FormatTag {
		uint32_t vendor_id = 0;
		uint32_t device_id = 0;
		uint32_t driver_version = 0;
		std::array<uint8_t, VK_UUID_SIZE> uuid = {};
		auto operator==(const FormatTag&) const -> bool = default;
		auto static from(const vk::PhysicalDeviceProperties& props) -> FormatTag;
	};
	struct CreateInfo {
		FrameTimeline* timeline_p;
		size_t capacity = 256;
		FormatTag tag = {};
		DestroyFn destroy; // called for evicted and remaining pipelines
		RestoreFn restore = {}; // rebuilds a pipeline from a persisted blob
	};
	void init(const CreateInfo& info);
	void destroy();

	auto get_or_build(const PipelineKey& key, const BuildFn& build) -> vk::Pipeline;
	void collect_garbage();

	// format: magic, version, format tag, record count, then (key hash, size, blob) records
	void save(const std::filesystem::path& path) const;
	// returns false and keeps nothing when the file is missing, malformed or from another backend
	auto load(const std::filesystem::path& path) -> bool;

	auto size() const -> size_t;
	auto pending_garbage() const -> size_t;

private:
	struct Entry {
		PipelineKey key;
		uint64_t key_hash;
		std::shared_future<vk::Pipeline> future;
		vk::Pipeline pipeline = nullptr;
		std::vector<uint8_t> blob;
		uint64_t last_used = 0;
		bool ready = false;
	};
	using Lru = std::list<Entry>;
	void evict_locked();

	mutable std::mutex _mutex;
	FrameTimeline* _timeline_p = nullptr;
	size_t _capacity = 256;
	FormatTag _tag;
	DestroyFn _destroy;
	RestoreFn _restore;
	Lru _lru; // most recently used first
	std::unordered_map<PipelineKey, Lru::iterator, PipelineKey::Hasher> _entries;
	std::unordered_map<uint64_t, std::vector<uint8_t>> _persisted; // loaded or evicted, not yet requested
	DeferredQueue<vk::Pipeline> _garbage;
};
} // namespace bindery
