#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace MODLINK {
	using u8 = std::uint8_t;
	using u16 = std::uint16_t;
	using u32 = std::uint32_t;
	using u64 = std::uint64_t;

	using i32 = std::int32_t;
	using i64 = std::int64_t;

	using sizeType = std::size_t;

	// Quotes a name for messages, empty names are shown as ""
	inline std::string quoted(std::string_view name) {
		std::string result;
		result.reserve(name.size() + 2);
		result += '\'';
		result += name;
		result += '\'';
		return result;
	}
}
