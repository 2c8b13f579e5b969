#pragma once

#include <memory>
#include <string>
#include <vector>

#include "definitions.h"

namespace MODLINK {

	// Assembles a module definition in declaration order. Nothing is checked
	// until the definition is validated.
	class ModuleBuilder {
	public:
		ModuleBuilder(std::string n= {}) : mName{ std::move(n) } {}

		ModuleBuilder& defineType(TypeExpression);
		ModuleBuilder& importItem(std::string name, TypeExpression);
		ModuleBuilder& defineModule(std::shared_ptr<const ModuleDefinition>);
		ModuleBuilder& defineModule(const ModuleBuilder&);
		ModuleBuilder& instantiate(u32 moduleIdx, std::vector<NamedReference> arguments= {});
		ModuleBuilder& defineInstance(std::vector<NamedReference> exports);
		ModuleBuilder& aliasExport(u32 instanceIdx, std::string exportName, ItemKind);
		ModuleBuilder& aliasOuter(u32 depth, u32 index, ItemKind);
		ModuleBuilder& exportItem(std::string name, ItemReference);

		const std::string& name() const { return mName; }
		sizeType size() const { return mDefinitions.size(); }

		std::shared_ptr<const ModuleDefinition> toDefinition() const;

	private:
		std::string mName;
		std::vector<Definition> mDefinitions;
	};
}
