#pragma once

#include <unordered_map>

#include "nullable.h"
#include "util.h"

namespace MODLINK {
	// Read-only map that is filled once on construction
	template<typename K, typename V>
	class SealedUnorderedMap {
	public:
		SealedUnorderedMap(std::unordered_map<K, V> m) : map{ std::move(m) } {}
		SealedUnorderedMap() = default;
		SealedUnorderedMap(SealedUnorderedMap&&) = default;
		SealedUnorderedMap(const SealedUnorderedMap&) = delete;

		auto find(const K& key) const { return map.find(key); }
		bool contains(const K& key) const { return map.find(key) != map.end(); }

		Nullable<const V> lookup(const K& key) const {
			auto it = map.find(key);
			if (it == map.end()) {
				return {};
			}
			return it->second;
		}

		sizeType size() const { return map.size(); }
		bool empty() const { return map.empty(); }
		auto begin() const { return map.begin(); }
		auto end() const { return map.end(); }

	private:
		std::unordered_map<K, V> map;
	};
}
