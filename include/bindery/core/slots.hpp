#pragma once
#include <vector>
#include <limits>
#include <cstdint>
#include <optional>

namespace bindery {
// Index + generation allocator with LIFO reuse.
// A released index stays pending until recycled, recycling bumps its generation.
struct SlotAllocator {
	struct Slot {
		uint32_t index;
		uint32_t generation;
	};
	enum class State: uint8_t { eFree, eLive, ePending };

	void init(uint32_t capacity = std::numeric_limits<uint32_t>::max()) {
		_capacity = capacity;
		_generations.clear();
		_states.clear();
		_free.clear();
		_live_n = 0;
	}
	auto allocate() -> std::optional<Slot> {
		uint32_t index;
		if (!_free.empty()) {
			index = _free.back();
			_free.pop_back();
		}
		else if (_generations.size() < _capacity) {
			index = (uint32_t)_generations.size();
			_generations.push_back(0);
			_states.push_back(State::eFree);
		}
		else return std::nullopt;
		_states[index] = State::eLive;
		_live_n++;
		return Slot { index, _generations[index] };
	}
	auto is_live(uint32_t index, uint32_t generation) const -> bool {
		if (index >= _generations.size()) return false;
		return _states[index] == State::eLive && _generations[index] == generation;
	}
	// live -> pending
	auto retire(uint32_t index, uint32_t generation) -> bool {
		if (!is_live(index, generation)) return false;
		_states[index] = State::ePending;
		_live_n--;
		return true;
	}
	// pending -> free
	void recycle(uint32_t index) {
		if (_states[index] != State::ePending) return;
		_states[index] = State::eFree;
		_generations[index]++;
		_free.push_back(index);
	}

	auto live_count() const -> uint32_t {
		return _live_n;
	}
	auto high_water() const -> uint32_t {
		return (uint32_t)_generations.size();
	}
	auto capacity() const -> uint32_t {
		return _capacity;
	}
	auto state(uint32_t index) const -> State {
		return index < _states.size() ? _states[index] : State::eFree;
	}

	std::vector<uint32_t> _generations;
	std::vector<State> _states;
	std::vector<uint32_t> _free;
	uint32_t _capacity = std::numeric_limits<uint32_t>::max();
	uint32_t _live_n = 0;
};
} // namespace bindery
