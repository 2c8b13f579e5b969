#pragma once

#include <compare>

#include "util.h"

namespace MODLINK {
	template<typename T, int Idx>
	struct TypedIndex {
		TypedIndex() = delete;
		constexpr TypedIndex(const TypedIndex& x) = default;
		explicit constexpr TypedIndex(T x) : value{ x } {}

		TypedIndex& operator=(const TypedIndex& x) = default;

		constexpr auto operator<=>(const TypedIndex&) const = default;
		constexpr auto operator<=>(T x) const { return value <=> x; }
		constexpr bool operator==(T x) const { return value == x; }

		using TStorage = T;
		T value;
	};

	// Indices into the per kind index spaces of a single module scope
	using ModuleTypeIndex = TypedIndex<u32, 0>;
	using ModuleInstanceIndex = TypedIndex<u32, 1>;
	using NestedModuleIndex = TypedIndex<u32, 2>;

	// Allow for stream printing eg. std::cout
	template<typename TStream, typename T, int Idx>
	TStream& operator<<(TStream& stream, const TypedIndex<T, Idx>& typedIdx) {
		stream << typedIdx.value;
		return stream;
	}
}
