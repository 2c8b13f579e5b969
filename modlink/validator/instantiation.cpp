#include <unordered_map>

#include "instantiation.h"
#include "introspection.h"
#include "subtyping.h"

using namespace MODLINK;

InstanceTypeRef InstantiationValidator::instantiate(const ModuleType& moduleType, std::span<const NamedArgument> arguments)
{
	if (introspector.has_value()) {
		introspector->onInstantiationStart(context, moduleType);
	}

	checkUniqueArgumentNames(arguments, context);

	std::unordered_map<std::string_view, const NamedArgument*> argumentsByName;
	for (auto& arg : arguments) {
		argumentsByName.emplace(arg.name, &arg);
	}

	// Visit the imports in name order, so that the first reported error does
	// not depend on the hash map layout
	auto& imports = moduleType.imports();
	SubtypeChecker checker;
	for (auto& importName : imports.sortedNames()) {
		auto& importType = *imports.exportByName(importName);

		auto find = argumentsByName.find(importName);
		if (find == argumentsByName.end()) {
			throw ValidationError{ context, ValidationErrorType::MissingImport,
				"Missing argument for import " + quoted(importName) + " of type " + importType.toString() };
		}

		auto& argument = *find->second;
		if (!checker.isSubtype(argument.type, importType)) {
			throw ValidationError{ context, ValidationErrorType::SubtypeError,
				"Argument " + quoted(importName) + " does not match its import: " + checker.mismatch() };
		}

		if (introspector.has_value()) {
			introspector->onInstantiationArgumentMatched(context, importName, argument.type, importType);
		}
	}

	if (introspector.has_value()) {
		for (auto& arg : arguments) {
			if (!imports.exports().contains(arg.name)) {
				introspector->onIgnoringSuperfluousArgument(context, arg.name);
			}
		}

		introspector->onInstantiationFinished(context, moduleType.exports());
	}

	return moduleType.exportsRef();
}

InstanceTypeRef InstantiationValidator::makeTuple(std::span<const NamedArgument> arguments)
{
	checkUniqueArgumentNames(arguments, context);

	InstanceType::ExportMap exports;
	for (auto& arg : arguments) {
		exports.emplace(arg.name, arg.type);
	}

	return InstanceType::make(std::move(exports));
}

InstanceTypeRef MODLINK::instantiate(const ModuleType& moduleType, std::span<const NamedArgument> arguments, Nullable<Introspector> introspector)
{
	InstantiationValidator validator{ "<host>", introspector };
	return validator.instantiate(moduleType, arguments);
}
