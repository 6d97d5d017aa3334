#include <print>
#include <format>
#include <fstream>
#include <algorithm>
#include <system_error>
#include "bindery/core/hash.hpp"
#include "bindery/core/error.hpp"
#include "bindery/pipeline/cache.hpp"

namespace bindery {
namespace {
constexpr uint32_t cache_magic = 0x43504442; // "BDPC"
constexpr uint32_t cache_version = 1;
constexpr uint64_t max_blob_size = 1ull << 30;
} // namespace

auto FixedFunctionState::hash() const -> uint64_t {
	Hasher hasher;
	hasher.add(topology);
	hasher.add(polygon_mode);
	hasher.add((VkCullModeFlags)cull_mode);
	hasher.add(front_face);
	hasher.add(samples);
	hasher.add_range(std::span<const vk::Format>(color.formats));
	hasher.add(color.blend);
	hasher.add(depth.format);
	hasher.add(depth.write);
	hasher.add(depth.test);
	hasher.add(depth.compare);
	hasher.add(stencil.format);
	hasher.add(stencil.test);
	return hasher.value();
}
auto PipelineKey::hash() const -> uint64_t {
	Hasher hasher;
	hasher.add((uint64_t)shaders.size());
	for (auto& shader: shaders) {
		hasher.add(shader.hash);
		hasher.add(shader.stage);
	}
	hasher.add(layout.hash);
	hasher.add(state.hash());
	return hasher.value();
}
auto PipelineCache::FormatTag::from(const vk::PhysicalDeviceProperties& props) -> FormatTag {
	FormatTag tag {
		.vendor_id = props.vendorID,
		.device_id = props.deviceID,
		.driver_version = props.driverVersion,
	};
	std::copy(props.pipelineCacheUUID.begin(), props.pipelineCacheUUID.end(), tag.uuid.begin());
	return tag;
}

void PipelineCache::init(const CreateInfo& info) {
	_timeline_p = info.timeline_p;
	_capacity = std::max<size_t>(info.capacity, 1);
	_tag = info.tag;
	_destroy = info.destroy;
	_restore = info.restore;
}
void PipelineCache::destroy() {
	std::lock_guard lock(_mutex);
	for (auto& entry: _lru) {
		if (entry.ready && _destroy) _destroy(entry.pipeline);
	}
	for (auto pipeline: _garbage.drain()) {
		if (_destroy) _destroy(pipeline);
	}
	_entries.clear();
	_lru.clear();
	_persisted.clear();
}

auto PipelineCache::get_or_build(const PipelineKey& key, const BuildFn& build) -> vk::Pipeline {
	std::promise<vk::Pipeline> promise;
	Lru::iterator entry_it;
	std::vector<uint8_t> persisted;
	{
		std::unique_lock lock(_mutex);
		auto found_it = _entries.find(key);
		if (found_it != _entries.end()) {
			entry_it = found_it->second;
			_lru.splice(_lru.begin(), _lru, entry_it);
			entry_it->last_used = _timeline_p->current();
			if (entry_it->ready) return entry_it->pipeline;
			// another caller is building this key
			auto future = entry_it->future;
			lock.unlock();
			return future.get();
		}
		uint64_t key_hash = key.hash();
		_lru.push_front(Entry {
			.key = key,
			.key_hash = key_hash,
			.future = promise.get_future().share(),
			.last_used = _timeline_p->current(),
		});
		entry_it = _lru.begin();
		_entries.emplace(key, entry_it);
		auto persisted_it = _persisted.find(key_hash);
		if (persisted_it != _persisted.end()) {
			persisted = std::move(persisted_it->second);
			_persisted.erase(persisted_it);
		}
	}

	Built built;
	try {
		// a persisted blob skips the build unless the backend rejects it
		if (!persisted.empty() && _restore) {
			built.pipeline = _restore(key, persisted);
			built.blob = persisted;
		}
		if (!built.pipeline) built = build();
		if (!built.pipeline) throw Error(Errc::eBuildFailed, "pipeline build produced no pipeline");
	}
	catch (...) {
		// leave no entry behind, every waiter receives the same error
		{
			std::lock_guard lock(_mutex);
			_entries.erase(key);
			_lru.erase(entry_it);
		}
		promise.set_exception(std::current_exception());
		throw;
	}

	{
		std::lock_guard lock(_mutex);
		entry_it->pipeline = built.pipeline;
		entry_it->blob = std::move(built.blob);
		entry_it->ready = true;
		evict_locked();
	}
	promise.set_value(built.pipeline);
	return built.pipeline;
}
void PipelineCache::evict_locked() {
	while (_entries.size() > _capacity) {
		// least recently used entry that finished building
		auto victim_it = std::find_if(_lru.rbegin(), _lru.rend(), [](const Entry& entry) { return entry.ready; });
		if (victim_it == _lru.rend()) return;
		_garbage.push(victim_it->last_used, victim_it->pipeline);
		// the blob outlives the pipeline, a later lookup or run restores from it
		if (!victim_it->blob.empty()) _persisted[victim_it->key_hash] = std::move(victim_it->blob);
		_entries.erase(victim_it->key);
		_lru.erase(std::next(victim_it).base());
	}
}
void PipelineCache::collect_garbage() {
	std::vector<vk::Pipeline> pipelines;
	{
		std::lock_guard lock(_mutex);
		pipelines = _garbage.collect(_timeline_p->retired());
	}
	for (auto pipeline: pipelines) {
		if (_destroy) _destroy(pipeline);
	}
}
auto PipelineCache::size() const -> size_t {
	std::lock_guard lock(_mutex);
	return _entries.size();
}
auto PipelineCache::pending_garbage() const -> size_t {
	std::lock_guard lock(_mutex);
	return _garbage.size();
}

void PipelineCache::save(const std::filesystem::path& path) const {
	std::ofstream file(path, std::ios::binary | std::ios::trunc);
	if (!file) {
		throw std::system_error(std::make_error_code(std::errc::io_error), std::format("cannot open {} for writing", path.string()));
	}
	auto write = [&](const auto& value) {
		file.write(reinterpret_cast<const char*>(&value), sizeof(value));
	};

	std::lock_guard lock(_mutex);
	// gather records of finished builds, evicted ones and loaded blobs nobody asked for yet
	std::vector<std::pair<uint64_t, const std::vector<uint8_t>*>> records;
	for (auto& entry: _lru) {
		if (entry.ready && !entry.blob.empty()) records.emplace_back(entry.key_hash, &entry.blob);
	}
	for (auto& [key_hash, blob]: _persisted) records.emplace_back(key_hash, &blob);

	write(cache_magic);
	write(cache_version);
	write(_tag.vendor_id);
	write(_tag.device_id);
	write(_tag.driver_version);
	write(_tag.uuid);
	write((uint64_t)records.size());
	for (auto& [key_hash, blob_p]: records) {
		write(key_hash);
		write((uint64_t)blob_p->size());
		file.write(reinterpret_cast<const char*>(blob_p->data()), blob_p->size());
	}
	if (!file) {
		throw std::system_error(std::make_error_code(std::errc::io_error), std::format("failed writing {}", path.string()));
	}
}
auto PipelineCache::load(const std::filesystem::path& path) -> bool {
	std::ifstream file(path, std::ios::binary);
	if (!file) return false;
	auto read = [&](auto& value) -> bool {
		file.read(reinterpret_cast<char*>(&value), sizeof(value));
		return (bool)file;
	};

	uint32_t magic = 0;
	uint32_t version = 0;
	FormatTag tag;
	if (!read(magic) || !read(version) || magic != cache_magic || version != cache_version) {
		std::println("pipeline cache {}: unrecognized format, discarded", path.string());
		return false;
	}
	if (!read(tag.vendor_id) || !read(tag.device_id) || !read(tag.driver_version) || !read(tag.uuid)) {
		std::println("pipeline cache {}: truncated header, discarded", path.string());
		return false;
	}
	if (tag != _tag) {
		std::println("pipeline cache {}: written by another device or driver, discarded", path.string());
		return false;
	}

	uint64_t records_n = 0;
	if (!read(records_n)) return false;
	std::unordered_map<uint64_t, std::vector<uint8_t>> records;
	for (uint64_t i = 0; i < records_n; i++) {
		uint64_t key_hash = 0;
		uint64_t blob_size = 0;
		if (!read(key_hash) || !read(blob_size) || blob_size > max_blob_size) {
			std::println("pipeline cache {}: malformed record {}, discarded", path.string(), i);
			return false;
		}
		std::vector<uint8_t> blob(blob_size);
		file.read(reinterpret_cast<char*>(blob.data()), blob_size);
		if (!file) {
			std::println("pipeline cache {}: truncated record {}, discarded", path.string(), i);
			return false;
		}
		records[key_hash] = std::move(blob);
	}

	std::lock_guard lock(_mutex);
	for (auto& [key_hash, blob]: records) _persisted[key_hash] = std::move(blob);
	return true;
}
} // namespace bindery
