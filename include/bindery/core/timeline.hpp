#pragma once
#include <deque>
#include <atomic>
#include <vector>
#include <cstdint>
#include <utility>
#include <vulkan/vulkan.hpp>

namespace bindery {
// Frame epochs backed by a timeline semaphore.
// Each submitted frame signals its epoch, resources released while an epoch is
// being recorded may only be reused once the semaphore has reached that epoch.
struct FrameTimeline {
	struct CreateInfo {
		vk::Device device = nullptr; // null keeps the timeline host-driven
		uint64_t initial_value = 0;
	};
	void init(const CreateInfo& info) {
		_current = info.initial_value;
		_retired = info.initial_value;
		if (!info.device) return;
		vk::StructureChain<vk::SemaphoreCreateInfo, vk::SemaphoreTypeCreateInfo> chain_timeline {
			{}, { .semaphoreType = vk::SemaphoreType::eTimeline, .initialValue = info.initial_value }
		};
		_semaphore = info.device.createSemaphore(chain_timeline.get());
	}
	void destroy(vk::Device device) {
		if (_semaphore) device.destroySemaphore(_semaphore);
		_semaphore = nullptr;
	}

	// start recording the next epoch, returns the value its submission must signal
	auto advance() -> uint64_t {
		return ++_current;
	}
	// epoch currently being recorded
	auto current() const -> uint64_t {
		return _current.load();
	}
	// highest epoch known to be finished on the gpu
	auto retired() const -> uint64_t {
		return _retired.load();
	}
	// host-side completion notice
	void retire(uint64_t value) {
		uint64_t prev = _retired.load();
		while (prev < value && !_retired.compare_exchange_weak(prev, value)) {}
	}
	// non-blocking query of the semaphore counter
	auto poll(vk::Device device) -> uint64_t {
		if (_semaphore) retire(device.getSemaphoreCounterValue(_semaphore));
		return retired();
	}
	// wait until the given epoch retired or the timeout (ns) elapsed
	auto wait(vk::Device device, uint64_t epoch, uint64_t timeout) -> bool {
		if (retired() >= epoch) return true;
		if (!_semaphore) return false;
		vk::SemaphoreWaitInfo info_wait {
			.semaphoreCount = 1,
			.pSemaphores = &_semaphore,
			.pValues = &epoch,
		};
		if (device.waitSemaphores(info_wait, timeout) == vk::Result::eTimeout) return false;
		retire(epoch);
		return true;
	}
	// submit info for signaling the epoch currently being recorded
	auto signal_info(vk::PipelineStageFlags2 stages = vk::PipelineStageFlagBits2::eAllCommands) const -> vk::SemaphoreSubmitInfo {
		return vk::SemaphoreSubmitInfo {
			.semaphore = _semaphore,
			.value = current(),
			.stageMask = stages,
		};
	}

	vk::Semaphore _semaphore = nullptr;
	std::atomic<uint64_t> _current = 0;
	std::atomic<uint64_t> _retired = 0;
};

// values tagged with the epoch in which they were released
// collected front to back, an entry with a later epoch holds back the ones behind it
template<typename T>
struct DeferredQueue {
	void push(uint64_t epoch, T value) {
		_entries.emplace_back(epoch, std::move(value));
	}
	auto collect(uint64_t retired) -> std::vector<T> {
		std::vector<T> ready;
		while (!_entries.empty() && _entries.front().first <= retired) {
			ready.push_back(std::move(_entries.front().second));
			_entries.pop_front();
		}
		return ready;
	}
	// everything regardless of epoch, for teardown
	auto drain() -> std::vector<T> {
		std::vector<T> ready;
		ready.reserve(_entries.size());
		for (auto& [_, value]: _entries) ready.push_back(std::move(value));
		_entries.clear();
		return ready;
	}
	auto size() const -> size_t {
		return _entries.size();
	}
	auto empty() const -> bool {
		return _entries.empty();
	}

	std::deque<std::pair<uint64_t, T>> _entries;
};
} // namespace bindery
