#include "module_builder.h"

using namespace MODLINK;

ModuleBuilder& ModuleBuilder::defineType(TypeExpression type)
{
	mDefinitions.emplace_back(TypeDefinition{ std::move(type) });
	return *this;
}

ModuleBuilder& ModuleBuilder::importItem(std::string name, TypeExpression type)
{
	mDefinitions.emplace_back(ImportDefinition{ std::move(name), std::move(type) });
	return *this;
}

ModuleBuilder& ModuleBuilder::defineModule(std::shared_ptr<const ModuleDefinition> module)
{
	mDefinitions.emplace_back(NestedModuleDefinition{ std::move(module) });
	return *this;
}

ModuleBuilder& ModuleBuilder::defineModule(const ModuleBuilder& builder)
{
	return defineModule(builder.toDefinition());
}

ModuleBuilder& ModuleBuilder::instantiate(u32 moduleIdx, std::vector<NamedReference> arguments)
{
	mDefinitions.emplace_back(InstantiateDefinition{ NestedModuleIndex{ moduleIdx }, std::move(arguments) });
	return *this;
}

ModuleBuilder& ModuleBuilder::defineInstance(std::vector<NamedReference> exports)
{
	mDefinitions.emplace_back(TupleInstanceDefinition{ std::move(exports) });
	return *this;
}

ModuleBuilder& ModuleBuilder::aliasExport(u32 instanceIdx, std::string exportName, ItemKind kind)
{
	mDefinitions.emplace_back(InstanceExportAlias{ ModuleInstanceIndex{ instanceIdx }, std::move(exportName), kind });
	return *this;
}

ModuleBuilder& ModuleBuilder::aliasOuter(u32 depth, u32 index, ItemKind kind)
{
	mDefinitions.emplace_back(OuterAlias{ depth, index, kind });
	return *this;
}

ModuleBuilder& ModuleBuilder::exportItem(std::string name, ItemReference item)
{
	mDefinitions.emplace_back(ExportDefinition{ std::move(name), item });
	return *this;
}

std::shared_ptr<const ModuleDefinition> ModuleBuilder::toDefinition() const
{
	return std::make_shared<const ModuleDefinition>(mName, mDefinitions);
}
