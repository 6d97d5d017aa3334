#pragma once
#include <span>
#include <cstdint>
#include <cstddef>
#include <string_view>
#include <type_traits>

namespace bindery {
// 64-bit FNV-1a, stable across processes so it can key persisted data
struct Hasher {
	void add(const void* data_p, size_t byte_count) {
		auto* bytes_p = static_cast<const uint8_t*>(data_p);
		for (size_t i = 0; i < byte_count; i++) {
			_value ^= bytes_p[i];
			_value *= 1099511628211ull;
		}
	}
	void add(std::string_view str) {
		add((uint64_t)str.size());
		add(str.data(), str.size());
	}
	template<typename T> requires std::is_trivially_copyable_v<T>
	void add(const T& value) {
		add(&value, sizeof(T));
	}
	template<typename T> requires std::is_trivially_copyable_v<T>
	void add_range(std::span<const T> values) {
		add((uint64_t)values.size());
		add(values.data(), values.size_bytes());
	}
	auto value() const -> uint64_t {
		return _value;
	}

	uint64_t _value = 14695981039346656037ull;
};
} // namespace bindery
