#include <stdexcept>

#include "linker.h"
#include "introspection.h"

using namespace MODLINK;

Linker::Linker(LinkerOptions o) : options{ o } {}
Linker::~Linker() = default;

void Linker::registerModule(std::shared_ptr<const ModuleDefinition> definition)
{
	if (!definition) {
		throw std::invalid_argument{ "Cannot register an empty module definition" };
	}

	if (definition->name().empty()) {
		throw LookupError{ definition->name(), "Registered modules need a name" };
	}

	registerName(definition->name());
	moduleNameMap.emplace(definition->name(), modules.size());
	modules.push_back({ definition, {}, {} });

	if (attachedIntrospector) {
		attachedIntrospector->onRegisteredModule(*definition);
	}
}

InstanceTypeRef Linker::registerHostInstance(const HostInstanceBuilder& builder)
{
	registerName(builder.name());

	auto type = builder.toInstanceType();
	hostInstances.emplace(builder.name(), type);

	if (attachedIntrospector) {
		attachedIntrospector->onRegisteredHostInstance(builder.name(), *type);
	}

	return type;
}

void Linker::validateModules()
{
	std::vector<RegisteredModule*> pending;
	for (auto& module : modules) {
		if (module.isPending()) {
			pending.push_back(&module);
		}
	}

	if (options.parallelValidation && pending.size() > 1) {
		validateInParallel(pending);
	}
	else {
		for (auto module : pending) {
			validateSequentially(*module);
		}
	}

	// Modules that failed during an earlier call are reported again
	std::vector<ValidationError> errors;
	for (auto& module : modules) {
		if (module.error.has_value()) {
			errors.push_back(*module.error);
		}
	}

	if (attachedIntrospector) {
		attachedIntrospector->onLinkerValidationFinished(pending.size(), errors.size());
	}

	if (!errors.empty()) {
		throw AggregateValidationError{ std::move(errors) };
	}
}

ModuleTypeRef Linker::moduleTypeByName(const std::string& name)
{
	auto& module = findModule(name);
	if (module.isPending()) {
		validateSequentially(module);
	}

	if (module.error.has_value()) {
		throw *module.error;
	}

	return module.type;
}

InstanceTypeRef Linker::hostInstanceByName(const std::string& name) const
{
	auto find = hostInstances.find(name);
	if (find == hostInstances.end()) {
		throw LookupError{ name, "No host instance with this name was registered" };
	}

	return find->second;
}

InstanceTypeRef Linker::instantiate(const std::string& moduleName, const ImportObject& imports)
{
	auto type = moduleTypeByName(moduleName);

	auto introspector = Nullable<Introspector>::fromPointer(attachedIntrospector);
	InstantiationValidator validator{ moduleName, introspector };
	return validator.instantiate(*type, imports.arguments());
}

void Linker::attachIntrospector(std::unique_ptr<Introspector> introspector)
{
	attachedIntrospector = std::move(introspector);
}

void Linker::registerName(const std::string& name)
{
	// Modules and host instances share a single namespace
	if (moduleNameMap.contains(name) || hostInstances.contains(name)) {
		throw LookupError{ name, "Module name collision" };
	}
}

Linker::RegisteredModule& Linker::findModule(const std::string& name)
{
	auto find = moduleNameMap.find(name);
	if (find == moduleNameMap.end()) {
		throw LookupError{ name, "No module with this name was registered" };
	}

	return modules[find->second];
}

void Linker::validateSequentially(RegisteredModule& module)
{
	auto introspector = Nullable<Introspector>::fromPointer(attachedIntrospector);
	ModuleValidator validator{ introspector, options.validator };

	try {
		module.type = validator.validate(*module.definition);
	}
	catch (const ValidationError& e) {
		module.error.emplace(e);
		if (attachedIntrospector) {
			attachedIntrospector->onRegisteredModuleFailed(module.definition->name(), e);
		}
		return;
	}

	if (attachedIntrospector) {
		attachedIntrospector->onValidatedRegisteredModule(module.definition->name(), *module.type);
	}
}

void Linker::validateInParallel(const std::vector<RegisteredModule*>& pending)
{
	std::vector<const ModuleDefinition*> definitions;
	definitions.reserve(pending.size());
	for (auto module : pending) {
		definitions.push_back(module->definition.get());
	}

	// Top level modules are independent of each other, so they are validated as siblings
	ModuleValidator validator{ {}, options.validator };
	auto results = validator.validateSiblings(definitions);

	for (sizeType i = 0; i != results.size(); i++) {
		auto& module = *pending[i];
		auto& result = results[i];
		if (!result.succeeded()) {
			module.error = std::move(result.error);
			if (attachedIntrospector) {
				attachedIntrospector->onRegisteredModuleFailed(module.definition->name(), *module.error);
			}
			continue;
		}

		module.type = std::move(result.type);
		if (attachedIntrospector) {
			attachedIntrospector->onValidatedRegisteredModule(module.definition->name(), *module.type);
		}
	}
}
