#include <string>

#include "definitions.h"

using namespace MODLINK;

namespace {
	// Overload set helper for std::visit
	template<typename... Ts>
	struct Overloaded : Ts... { using Ts::operator()...; };

	template<typename... Ts>
	Overloaded(Ts...) -> Overloaded<Ts...>;

	void printNamedEntries(std::ostream& out, const std::vector<NamedTypeExpression>& entries, const char* keyword)
	{
		for (auto& entry : entries) {
			out << " (" << keyword << " \"" << entry.name << "\" ";
			entry.type.print(out);
			out << ')';
		}
	}

	void printNamedReferences(std::ostream& out, const std::vector<NamedReference>& references, const char* keyword)
	{
		for (auto& ref : references) {
			out << " (" << keyword << " \"" << ref.name << "\" ";
			ref.item.print(out);
			out << ')';
		}
	}
}

TypeExpression::TypeExpression(DefType t) : storage{ std::move(t) } {}
TypeExpression::TypeExpression(Indexed i) : storage{ i } {}
TypeExpression::TypeExpression(InstanceShape s) : storage{ std::move(s) } {}
TypeExpression::TypeExpression(ModuleShape s) : storage{ std::move(s) } {}

TypeExpression TypeExpression::function(std::vector<ValType> params, std::vector<ValType> results)
{
	return DefType{ FunctionType{ std::move(params), std::move(results) } };
}

TypeExpression TypeExpression::table(ValType elementType, u32 min, std::optional<u32> max)
{
	return DefType{ TableType{ elementType, Limits{ min, max } } };
}

TypeExpression TypeExpression::memory(u32 min, std::optional<u32> max)
{
	return DefType{ MemoryType{ Limits{ min, max } } };
}

TypeExpression TypeExpression::global(ValType type, bool isMutable)
{
	return DefType{ GlobalType{ type, isMutable } };
}

TypeExpression TypeExpression::indexed(ItemKind kind, u32 index)
{
	return Indexed{ kind, ModuleTypeIndex{ index } };
}

TypeExpression TypeExpression::instance(std::vector<NamedTypeExpression> exports)
{
	return InstanceShape{ std::move(exports) };
}

TypeExpression TypeExpression::module(std::vector<NamedTypeExpression> imports, std::vector<NamedTypeExpression> exports)
{
	return ModuleShape{ std::move(imports), std::move(exports) };
}

void TypeExpression::print(std::ostream& out) const
{
	std::visit(Overloaded{
		[&](const DefType& type) { type.print(out); },
		[&](const Indexed& indexed) { out << '(' << indexed.expectedKind.name() << " (type " << indexed.index << "))"; },
		[&](const InstanceShape& shape) {
			out << "(instance";
			printNamedEntries(out, shape.exports, "export");
			out << ')';
		},
		[&](const ModuleShape& shape) {
			out << "(module";
			printNamedEntries(out, shape.imports, "import");
			printNamedEntries(out, shape.exports, "export");
			out << ')';
		}
	}, storage);
}

void ItemReference::print(std::ostream& out) const
{
	out << '(' << kind.name() << ' ' << index << ')';
}

const char* Definition::name() const
{
	switch (storage.index()) {
	case 0: return "type";
	case 1: return "import";
	case 2: return "module";
	case 3:
	case 4: return "instance";
	case 5:
	case 6: return "alias";
	case 7: return "export";
	default: return "<unknown definition>";
	}
}

void Definition::print(std::ostream& out) const
{
	std::visit(Overloaded{
		[&](const TypeDefinition& def) {
			out << "(type ";
			def.type.print(out);
			out << ')';
		},
		[&](const ImportDefinition& def) {
			out << "(import \"" << def.name << "\" ";
			def.type.print(out);
			out << ')';
		},
		[&](const NestedModuleDefinition& def) {
			out << "(module \"" << def.module->name() << "\" with " << def.module->size() << " definitions)";
		},
		[&](const InstantiateDefinition& def) {
			out << "(instance (instantiate " << def.module;
			printNamedReferences(out, def.arguments, "import");
			out << "))";
		},
		[&](const TupleInstanceDefinition& def) {
			out << "(instance";
			printNamedReferences(out, def.exports, "export");
			out << ')';
		},
		[&](const InstanceExportAlias& def) {
			out << "(alias " << def.instance << " \"" << def.exportName << "\" (" << def.kind.name() << "))";
		},
		[&](const OuterAlias& def) {
			out << "(alias outer " << def.depth << ' ' << def.index << " (" << def.kind.name() << "))";
		},
		[&](const ExportDefinition& def) {
			out << "(export \"" << def.name << "\" ";
			def.item.print(out);
			out << ')';
		}
	}, storage);
}

void ModuleDefinition::print(std::ostream& out, u32 indent) const
{
	std::string padding(indent, ' ');
	out << padding << "(module";
	if (!mName.empty()) {
		out << " \"" << mName << '"';
	}

	for (auto& definition : mDefinitions) {
		out << '\n';

		// Nested modules are printed as a whole
		auto nested = std::get_if<NestedModuleDefinition>(&definition.variant());
		if (nested) {
			nested->module->print(out, indent + 2);
			continue;
		}

		out << padding << "  ";
		definition.print(out);
	}

	out << ')';
}

std::ostream& MODLINK::operator<<(std::ostream& out, const TypeExpression& type)
{
	type.print(out);
	return out;
}

std::ostream& MODLINK::operator<<(std::ostream& out, const ItemReference& ref)
{
	ref.print(out);
	return out;
}

std::ostream& MODLINK::operator<<(std::ostream& out, const Definition& def)
{
	def.print(out);
	return out;
}
