#pragma once

#include <memory>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "enum.h"
#include "forward.h"
#include "sealed.h"

namespace MODLINK {
	// Instance and module types are immutable values shared by reference
	using InstanceTypeRef = std::shared_ptr<const InstanceType>;
	using ModuleTypeRef = std::shared_ptr<const ModuleType>;

	class Limits {
	public:
		Limits(u32 i) : mMin{ i }, mMax{} {}
		Limits(u32 i, u32 a) : mMin{ i }, mMax{ a } {}
		Limits(u32 i, std::optional<u32> a) : mMin{ i }, mMax{ a } {}

		auto min() const { return mMin; }
		auto& max() const { return mMax; }

		void print(std::ostream&) const;
		bool isValid(u32 range) const;

		bool operator==(const Limits&) const = default;

	private:
		u32 mMin;
		std::optional<u32> mMax;
	};

	class FunctionType {
	public:
		FunctionType() = default;
		FunctionType(std::vector<ValType> p, std::vector<ValType> r)
			: mParameters{ std::move(p) }, mResults{ std::move(r) } {}

		std::span<const ValType> parameters() const { return mParameters; }
		std::span<const ValType> results() const { return mResults; }

		void print(std::ostream&) const;

		bool operator==(const FunctionType&) const;

	private:
		std::vector<ValType> mParameters;
		std::vector<ValType> mResults;
	};

	class TableType {
	public:
		static constexpr u32 Range = 0xFFFFFFFF;

		TableType(ValType et, Limits l) : mElementReferenceType{ et }, mLimits{ l } {}

		ValType valType() const { return mElementReferenceType; }
		const Limits& limits() const { return mLimits; }

		bool isValid() const;
		void print(std::ostream&) const;

		bool operator==(const TableType&) const;

	private:
		ValType mElementReferenceType;
		Limits mLimits;
	};

	class MemoryType {
	public:
		// Counted in 64KiB pages
		static constexpr u32 Range = 0x10000;

		MemoryType(Limits l) : mLimits{ l } {}

		const Limits& limits() const { return mLimits; }

		bool isValid() const { return mLimits.isValid(Range); }
		void print(std::ostream&) const;

		bool operator==(const MemoryType& other) const { return mLimits == other.mLimits; }

	private:
		Limits mLimits;
	};

	class GlobalType {
	public:
		GlobalType(ValType t, bool m)
			: mType{ t }, mIsMutable{ m } {}

		bool isMutable() const { return mIsMutable; }
		ValType valType() const { return mType; }

		void print(std::ostream&) const;

		bool operator==(const GlobalType&) const;

	private:
		ValType mType;
		bool mIsMutable;
	};

	// The type of anything that can be imported, exported, aliased or passed
	// as an instantiation argument. The order of alternatives follows ItemKind.
	class DefType {
	public:
		using Storage = std::variant<FunctionType, TableType, MemoryType, GlobalType, InstanceTypeRef, ModuleTypeRef>;

		DefType(FunctionType t) : storage{ std::move(t) } {}
		DefType(TableType t) : storage{ std::move(t) } {}
		DefType(MemoryType t) : storage{ std::move(t) } {}
		DefType(GlobalType t) : storage{ std::move(t) } {}
		DefType(InstanceTypeRef t);
		DefType(ModuleTypeRef t);

		ItemKind kind() const { return ItemKind::fromInt(storage.index()); }

		const FunctionType& asFunction() const { return std::get<FunctionType>(storage); }
		const TableType& asTable() const { return std::get<TableType>(storage); }
		const MemoryType& asMemory() const { return std::get<MemoryType>(storage); }
		const GlobalType& asGlobal() const { return std::get<GlobalType>(storage); }
		const InstanceType& asInstance() const { return *instanceRef(); }
		const ModuleType& asModule() const { return *moduleRef(); }
		const InstanceTypeRef& instanceRef() const { return std::get<InstanceTypeRef>(storage); }
		const ModuleTypeRef& moduleRef() const { return std::get<ModuleTypeRef>(storage); }

		void print(std::ostream&) const;
		std::string toString() const;

	private:
		Storage storage;
	};

	class InstanceType {
	public:
		using ExportMap = std::unordered_map<std::string, DefType>;

		InstanceType() = default;
		explicit InstanceType(ExportMap e) : mExports{ std::move(e) } {}

		static InstanceTypeRef make(ExportMap e= {});

		const SealedUnorderedMap<std::string, DefType>& exports() const { return mExports; }
		Nullable<const DefType> exportByName(const std::string& name) const { return mExports.lookup(name); }

		sizeType size() const { return mExports.size(); }
		bool empty() const { return mExports.empty(); }

		// Names in lexicographic order, which makes printing and error reporting deterministic
		std::vector<std::string> sortedNames() const;

		void print(std::ostream&) const;
		void printEntries(std::ostream&, const char*) const;

	private:
		SealedUnorderedMap<std::string, DefType> mExports;
	};

	// Both the imports and the exports of a module are instance shaped maps.
	// Instantiating a module yields exactly its exports instance.
	class ModuleType {
	public:
		ModuleType(InstanceTypeRef i, InstanceTypeRef e);

		static ModuleTypeRef make(InstanceType::ExportMap imports= {}, InstanceType::ExportMap exports= {});

		const InstanceType& imports() const { return *mImports; }
		const InstanceType& exports() const { return *mExports; }
		const InstanceTypeRef& importsRef() const { return mImports; }
		const InstanceTypeRef& exportsRef() const { return mExports; }

		void print(std::ostream&) const;

	private:
		InstanceTypeRef mImports;
		InstanceTypeRef mExports;
	};

	std::ostream& operator<<(std::ostream&, const DefType&);
	std::ostream& operator<<(std::ostream&, const InstanceType&);
	std::ostream& operator<<(std::ostream&, const ModuleType&);
}
