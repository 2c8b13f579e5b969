#pragma once

#include <memory>

namespace MODLINK {
	// Optional non-owning reference
	template<typename T>
	class Nullable {
	public:
		Nullable() = default;
		Nullable(const Nullable&) = default;

		Nullable(T& x) : ptr{ &x } {};

		template<typename U>
		Nullable(const Nullable<U>& x) : ptr{ x.pointer() } {};

		template<typename U>
		static Nullable<T> fromPointer(const std::unique_ptr<U>& p) {
			return { p.get() };
		}

		template<typename U>
		static Nullable<T> fromPointer(const std::shared_ptr<U>& p) {
			return { p.get() };
		}

		bool has_value() const { return ptr != nullptr; }
		T& value() const { return *ptr; }

		T& operator*() const { return value(); }
		T* operator->() const { return ptr; }
		T* pointer() const { return ptr; }

		Nullable& operator=(const Nullable&) = default;

		template<typename U>
		bool operator==(const Nullable<U>& x) const { return ptr == x.pointer(); }

		void clear() { ptr = nullptr; }

	private:
		Nullable(T* p) : ptr{ p } {}

		T* ptr{ nullptr };
	};

	template<typename T>
	class NonNull {
	public:
		NonNull() = delete;
		NonNull(const NonNull&) = default;

		NonNull(T& x) : ptr{ &x } {};

		template<typename U>
		NonNull(const NonNull<U>& x) : ptr{ x.pointer() } {};

		T& value() const { return *ptr; }

		T& operator*() const { return value(); }
		T* operator->() const { return ptr; }
		T* pointer() const { return ptr; }

		NonNull& operator=(const NonNull&) = default;

		template<typename U>
		bool operator==(const NonNull<U>& x) const { return ptr == x.pointer(); }

	private:
		T* ptr;
	};
}
