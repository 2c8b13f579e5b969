#pragma once

#include <array>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "error.h"
#include "indices.h"
#include "nullable.h"
#include "types.h"

namespace MODLINK {

	// Append-only sequence of validated items. Indices are handed out in
	// declaration order and stay valid forever, entries are never removed
	// or reordered.
	template<typename T>
	class IndexSpace {
	public:
		u32 declare(T item) {
			mItems.emplace_back(std::move(item));
			return (u32)(mItems.size() - 1);
		}

		Nullable<const T> lookup(u32 idx) const {
			return lookup(idx, size());
		}

		// Only the first 'visibleLength' entries are considered
		Nullable<const T> lookup(u32 idx, u32 visibleLength) const {
			if (idx >= visibleLength || idx >= mItems.size()) {
				return {};
			}
			return mItems[idx];
		}

		u32 size() const { return (u32)mItems.size(); }

	private:
		std::vector<T> mItems;
	};

	// Validation state of a single module. Each scope owns one index space per
	// item kind and the import and export names declared so far.
	class Scope {
	public:
		using Lengths = std::array<u32, ItemKind::NumberOfItems>;

		// Enclosing scope as it was when this scope was declared
		struct ParentLink {
			NonNull<const Scope> scope;
			Lengths visibleLengths;
		};

		explicit Scope(std::string);
		Scope(std::string, const Scope&);

		Scope(const Scope&) = delete;
		Scope& operator=(const Scope&) = delete;

		const std::string& name() const { return mName; }
		ScopeState state() const { return mState; }
		const std::optional<ParentLink>& parentLink() const { return mParentLink; }

		// Number of lexically enclosing scopes
		u32 depth() const { return mDepth; }

		void beginValidation();
		ModuleTypeRef freeze();
		void fail();

		u32 declare(ItemKind, DefType);
		const DefType& resolve(ItemKind, u32) const;
		const DefType& resolveVisible(ItemKind, u32, u32) const;

		u32 declareImport(const std::string&, DefType);
		void declareExport(const std::string&, DefType);

		u32 length(ItemKind) const;
		Lengths lengths() const;

		const InstanceType& instanceByIndex(ModuleInstanceIndex) const;
		const ModuleTypeRef& moduleByIndex(NestedModuleIndex) const;
		const DefType& typeByIndex(ModuleTypeIndex) const;

		const IndexSpace<DefType>& space(ItemKind kind) const { return mSpaces[kind]; }

		[[noreturn]] void throwValidationError(ValidationErrorType, const std::string&) const;

	private:
		void ensureAccumulating() const;

		std::string mName;
		std::optional<ParentLink> mParentLink;
		u32 mDepth{ 0 };
		ScopeState mState{ ScopeState::Empty };

		std::array<IndexSpace<DefType>, ItemKind::NumberOfItems> mSpaces;

		InstanceType::ExportMap mImports;
		InstanceType::ExportMap mExports;
	};
}
