#pragma once

#include <initializer_list>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include "indices.h"
#include "types.h"

namespace MODLINK {

	// A type as it is spelled by a definition. It is resolved into a DefType
	// against the index spaces of the scope it appears in.
	class TypeExpression {
	public:
		// References an entry of the type index space, which has to be of the expected kind
		struct Indexed {
			ItemKind expectedKind;
			ModuleTypeIndex index;
		};

		struct InstanceShape {
			std::vector<NamedTypeExpression> exports;
		};

		struct ModuleShape {
			std::vector<NamedTypeExpression> imports;
			std::vector<NamedTypeExpression> exports;
		};

		using Storage = std::variant<DefType, Indexed, InstanceShape, ModuleShape>;

		TypeExpression(DefType);
		TypeExpression(Indexed);
		TypeExpression(InstanceShape);
		TypeExpression(ModuleShape);

		static TypeExpression of(DefType t) { return TypeExpression{ std::move(t) }; }
		static TypeExpression function(std::vector<ValType> params= {}, std::vector<ValType> results= {});
		static TypeExpression table(ValType, u32, std::optional<u32> = {});
		static TypeExpression memory(u32, std::optional<u32> = {});
		static TypeExpression global(ValType, bool = false);
		static TypeExpression indexed(ItemKind, u32);
		static TypeExpression instance(std::vector<NamedTypeExpression> = {});
		static TypeExpression module(std::vector<NamedTypeExpression> = {}, std::vector<NamedTypeExpression> = {});

		const Storage& variant() const { return storage; }

		void print(std::ostream&) const;

	private:
		Storage storage;
	};

	struct NamedTypeExpression {
		std::string name;
		TypeExpression type;
	};

	// Points into one of the index spaces of the current scope
	struct ItemReference {
		ItemKind kind;
		u32 index;

		static ItemReference function(u32 i) { return { ItemKind::Function, i }; }
		static ItemReference table(u32 i) { return { ItemKind::Table, i }; }
		static ItemReference memory(u32 i) { return { ItemKind::Memory, i }; }
		static ItemReference global(u32 i) { return { ItemKind::Global, i }; }
		static ItemReference instance(u32 i) { return { ItemKind::Instance, i }; }
		static ItemReference module(u32 i) { return { ItemKind::Module, i }; }
		static ItemReference type(u32 i) { return { ItemKind::Type, i }; }

		void print(std::ostream&) const;
	};

	struct NamedReference {
		std::string name;
		ItemReference item;
	};

	struct TypeDefinition {
		TypeExpression type;
	};

	struct ImportDefinition {
		std::string name;
		TypeExpression type;
	};

	struct NestedModuleDefinition {
		std::shared_ptr<const ModuleDefinition> module;
	};

	struct InstantiateDefinition {
		NestedModuleIndex module;
		std::vector<NamedReference> arguments;
	};

	struct TupleInstanceDefinition {
		std::vector<NamedReference> exports;
	};

	struct InstanceExportAlias {
		ModuleInstanceIndex instance;
		std::string exportName;
		ItemKind kind;
	};

	// Depth 0 refers to the immediately enclosing module
	struct OuterAlias {
		u32 depth;
		u32 index;
		ItemKind kind;
	};

	struct ExportDefinition {
		std::string name;
		ItemReference item;
	};

	class Definition {
	public:
		using Storage = std::variant<
			TypeDefinition,
			ImportDefinition,
			NestedModuleDefinition,
			InstantiateDefinition,
			TupleInstanceDefinition,
			InstanceExportAlias,
			OuterAlias,
			ExportDefinition
		>;

		Definition(TypeDefinition d) : storage{ std::move(d) } {}
		Definition(ImportDefinition d) : storage{ std::move(d) } {}
		Definition(NestedModuleDefinition d) : storage{ std::move(d) } {}
		Definition(InstantiateDefinition d) : storage{ std::move(d) } {}
		Definition(TupleInstanceDefinition d) : storage{ std::move(d) } {}
		Definition(InstanceExportAlias d) : storage{ std::move(d) } {}
		Definition(OuterAlias d) : storage{ d } {}
		Definition(ExportDefinition d) : storage{ std::move(d) } {}

		const Storage& variant() const { return storage; }

		const char* name() const;
		void print(std::ostream&) const;

	private:
		Storage storage;
	};

	class ModuleDefinition {
	public:
		ModuleDefinition(std::string n, std::vector<Definition> d)
			: mName{ std::move(n) }, mDefinitions{ std::move(d) } {}

		const std::string& name() const { return mName; }
		const std::vector<Definition>& definitions() const { return mDefinitions; }

		sizeType size() const { return mDefinitions.size(); }
		auto begin() const { return mDefinitions.cbegin(); }
		auto end() const { return mDefinitions.cend(); }

		void print(std::ostream&, u32 indent= 0) const;

	private:
		std::string mName;
		std::vector<Definition> mDefinitions;
	};

	std::ostream& operator<<(std::ostream&, const TypeExpression&);
	std::ostream& operator<<(std::ostream&, const ItemReference&);
	std::ostream& operator<<(std::ostream&, const Definition&);
}
