#include <future>
#include <stdexcept>
#include <string>

#include "validator.h"
#include "alias.h"
#include "introspection.h"
#include "scope.h"

using namespace MODLINK;

namespace {
	template<typename... Ts>
	struct Overloaded : Ts... { using Ts::operator()...; };

	template<typename... Ts>
	Overloaded(Ts...) -> Overloaded<Ts...>;

	std::string nestedScopeName(const Scope& parent, const ModuleDefinition& definition)
	{
		if (!definition.name().empty()) {
			return parent.name() + '/' + definition.name();
		}

		return parent.name() + "/module[" + std::to_string(parent.length(ItemKind::Module)) + ']';
	}
}

ModuleTypeRef ModuleValidator::validate(const ModuleDefinition& definition)
{
	Scope scope{ definition.name().empty() ? std::string{ "<module>" } : definition.name() };
	return validateScope(scope, definition);
}

ModuleTypeRef ModuleValidator::validate(const ModuleDefinition& definition, const Scope& parent)
{
	Scope scope{ nestedScopeName(parent, definition), parent };
	return validateScope(scope, definition);
}

std::vector<SiblingValidationResult> ModuleValidator::validateSiblings(std::span<const ModuleDefinition* const> modules, Nullable<const Scope> parent) const
{
	std::vector<std::future<SiblingValidationResult>> futures;
	futures.reserve(modules.size());

	for (auto module : modules) {
		futures.emplace_back(std::async(std::launch::async, [module, parent, opts = options]() {
			SiblingValidationResult result;
			ModuleValidator worker{ {}, opts };
			try {
				result.type = parent.has_value() ? worker.validate(*module, *parent) : worker.validate(*module);
			}
			catch (const ValidationError& e) {
				result.error.emplace(e);
			}
			return result;
		}));
	}

	// Results keep the order of the input, no matter which worker finished first
	std::vector<SiblingValidationResult> results;
	results.reserve(futures.size());
	for (auto& future : futures) {
		results.emplace_back(future.get());
	}

	return results;
}

ModuleTypeRef ModuleValidator::validateScope(Scope& scope, const ModuleDefinition& definition)
{
	scope.beginValidation();

	if (introspector.has_value()) {
		introspector->onModuleValidationStart(scope);
	}

	try {
		if (scope.depth() > options.maxNestingDepth) {
			scope.throwValidationError(ValidationErrorType::NestingTooDeep,
				"Module is nested " + std::to_string(scope.depth()) + " levels deep, at most "
				+ std::to_string(options.maxNestingDepth) + " are allowed");
		}

		for (auto& def : definition) {
			if (introspector.has_value()) {
				introspector->onValidatingDefinition(scope, def);
			}

			validateDefinition(scope, def);
		}

		auto type = scope.freeze();

		if (introspector.has_value()) {
			introspector->onModuleValidationFinished(scope, *type);
		}

		return type;
	}
	catch (const ValidationError& e) {
		scope.fail();

		if (introspector.has_value()) {
			introspector->onModuleValidationFailed(scope, e);
		}

		throw;
	}
}

void ModuleValidator::validateDefinition(Scope& scope, const Definition& definition)
{
	std::visit(Overloaded{
		[&](const TypeDefinition& def) {
			auto type = resolveTypeExpression(scope, def.type);
			auto idx = scope.declare(ItemKind::Type, type);
			if (introspector.has_value()) {
				introspector->onDeclaredType(scope, idx, type);
			}
		},
		[&](const ImportDefinition& def) {
			auto type = resolveTypeExpression(scope, def.type);
			auto idx = scope.declareImport(def.name, type);
			if (introspector.has_value()) {
				introspector->onDeclaredImport(scope, def.name, idx, type);
			}
		},
		[&](const NestedModuleDefinition& def) { validateNestedModule(scope, def); },
		[&](const InstantiateDefinition& def) { validateInstantiation(scope, def); },
		[&](const TupleInstanceDefinition& def) { validateTupleInstance(scope, def); },
		[&](const InstanceExportAlias& def) {
			AliasResolver resolver{ scope, introspector };
			resolver.resolveInstanceExport(def);
		},
		[&](const OuterAlias& def) {
			AliasResolver resolver{ scope, introspector };
			resolver.resolveOuter(def);
		},
		[&](const ExportDefinition& def) { validateExport(scope, def); }
	}, definition.variant());
}

void ModuleValidator::validateNestedModule(Scope& scope, const NestedModuleDefinition& def)
{
	if (!def.module) {
		throw std::invalid_argument{ "Nested module definition in '" + scope.name() + "' has no module" };
	}

	// The child sees the index spaces of this scope as they are right now
	Scope child{ nestedScopeName(scope, *def.module), scope };
	auto type = validateScope(child, *def.module);

	auto idx = scope.declare(ItemKind::Module, type);
	if (introspector.has_value()) {
		introspector->onDeclaredModule(scope, idx, *type);
	}
}

void ModuleValidator::validateInstantiation(Scope& scope, const InstantiateDefinition& def)
{
	// Duplicate names are an error regardless of what the arguments refer to
	checkUniqueArgumentNames<NamedReference>(def.arguments, scope.name());

	auto moduleType = scope.moduleByIndex(def.module);
	auto arguments = resolveArguments(scope, def.arguments, "instantiation argument");

	InstantiationValidator validator{ scope.name(), introspector };
	auto instanceType = validator.instantiate(*moduleType, arguments);

	auto idx = scope.declare(ItemKind::Instance, instanceType);
	if (introspector.has_value()) {
		introspector->onDeclaredInstance(scope, idx, *instanceType);
	}
}

void ModuleValidator::validateTupleInstance(Scope& scope, const TupleInstanceDefinition& def)
{
	checkUniqueArgumentNames<NamedReference>(def.exports, scope.name());

	auto arguments = resolveArguments(scope, def.exports, "instance export");

	InstantiationValidator validator{ scope.name(), introspector };
	auto instanceType = validator.makeTuple(arguments);

	auto idx = scope.declare(ItemKind::Instance, instanceType);
	if (introspector.has_value()) {
		introspector->onDeclaredInstance(scope, idx, *instanceType);
	}
}

void ModuleValidator::validateExport(Scope& scope, const ExportDefinition& def)
{
	DefType type = resolveReference(scope, def.item, "export");
	scope.declareExport(def.name, type);

	if (introspector.has_value()) {
		introspector->onDeclaredExport(scope, def.name, type);
	}
}

std::vector<NamedArgument> ModuleValidator::resolveArguments(Scope& scope, std::span<const NamedReference> references, const char* what)
{
	std::vector<NamedArgument> arguments;
	arguments.reserve(references.size());
	for (auto& ref : references) {
		arguments.push_back({ ref.name, resolveReference(scope, ref.item, what) });
	}

	return arguments;
}

const DefType& ModuleValidator::resolveReference(Scope& scope, const ItemReference& ref, const char* what)
{
	if (!ref.kind.isDefinitionKind()) {
		scope.throwValidationError(ValidationErrorType::KindMismatch,
			std::string{ "Type " } + std::to_string(ref.index) + " cannot be used as " + what);
	}

	return scope.resolve(ref.kind, ref.index);
}

DefType ModuleValidator::resolveTypeExpression(Scope& scope, const TypeExpression& expression)
{
	return std::visit(Overloaded{
		[&](const DefType& type) -> DefType {
			checkDefType(scope, type);
			return type;
		},
		[&](const TypeExpression::Indexed& indexed) -> DefType {
			auto& type = scope.typeByIndex(indexed.index);
			if (type.kind() != indexed.expectedKind) {
				scope.throwValidationError(ValidationErrorType::KindMismatch,
					"Type " + std::to_string(indexed.index.value) + " is a " + type.kind().name()
					+ " type, expected a " + indexed.expectedKind.name() + " type");
			}
			return type;
		},
		[&](const TypeExpression::InstanceShape& shape) -> DefType {
			return InstanceType::make(resolveShapeEntries(scope, shape.exports, "export"));
		},
		[&](const TypeExpression::ModuleShape& shape) -> DefType {
			auto imports = resolveShapeEntries(scope, shape.imports, "import");
			auto exports = resolveShapeEntries(scope, shape.exports, "export");
			return ModuleType::make(std::move(imports), std::move(exports));
		}
	}, expression.variant());
}

InstanceType::ExportMap ModuleValidator::resolveShapeEntries(Scope& scope, const std::vector<NamedTypeExpression>& entries, const char* what)
{
	InstanceType::ExportMap map;
	for (auto& entry : entries) {
		auto type = resolveTypeExpression(scope, entry.type);
		if (!map.emplace(entry.name, std::move(type)).second) {
			scope.throwValidationError(ValidationErrorType::DuplicateName,
				std::string{ "Duplicate " } + what + " name " + quoted(entry.name) + " in type");
		}
	}

	return map;
}

void ModuleValidator::checkDefType(Scope& scope, const DefType& type)
{
	auto checkValType = [&](ValType valType) {
		if (!valType.isValid()) {
			scope.throwValidationError(ValidationErrorType::InvalidType,
				"Invalid value type " + std::to_string((int)valType) + " in " + type.toString());
		}
	};

	switch (type.kind()) {
	case ItemKind::Function:
		for (auto param : type.asFunction().parameters()) {
			checkValType(param);
		}
		for (auto result : type.asFunction().results()) {
			checkValType(result);
		}
		break;

	case ItemKind::Table:
		if (!type.asTable().isValid()) {
			scope.throwValidationError(ValidationErrorType::InvalidType,
				"Table type " + type.toString() + " needs a reference element type and limits within 2^32-1");
		}
		break;

	case ItemKind::Memory:
		if (!type.asMemory().isValid()) {
			scope.throwValidationError(ValidationErrorType::InvalidType,
				"Memory type " + type.toString() + " has limits exceeding 65536 pages");
		}
		break;

	case ItemKind::Global:
		checkValType(type.asGlobal().valType());
		break;

	case ItemKind::Instance:
		for (auto& entry : type.asInstance().exports()) {
			checkDefType(scope, entry.second);
		}
		break;

	case ItemKind::Module:
		for (auto& entry : type.asModule().imports().exports()) {
			checkDefType(scope, entry.second);
		}
		for (auto& entry : type.asModule().exports().exports()) {
			checkDefType(scope, entry.second);
		}
		break;

	default:
		throw std::logic_error{ "Unexpected type kind" };
	}
}
