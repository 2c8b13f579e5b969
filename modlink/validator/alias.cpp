#include <string>

#include "alias.h"
#include "introspection.h"
#include "scope.h"

using namespace MODLINK;

u32 AliasResolver::resolveInstanceExport(const InstanceExportAlias& alias)
{
	auto& instance = scope.instanceByIndex(alias.instance);

	if (!alias.kind.isDefinitionKind()) {
		scope.throwValidationError(ValidationErrorType::KindMismatch,
			"Instances do not export types, cannot alias type " + quoted(alias.exportName));
	}

	auto item = instance.exportByName(alias.exportName);
	if (!item.has_value()) {
		scope.throwValidationError(ValidationErrorType::UnboundExport,
			"Instance " + std::to_string(alias.instance.value) + " has no export named " + quoted(alias.exportName));
	}

	if (item->kind() != alias.kind) {
		scope.throwValidationError(ValidationErrorType::KindMismatch,
			"Export " + quoted(alias.exportName) + " of instance " + std::to_string(alias.instance.value)
			+ " is a " + item->kind().name() + ", expected a " + alias.kind.name());
	}

	DefType type = *item;
	auto idx = scope.declare(alias.kind, type);

	if (introspector.has_value()) {
		introspector->onResolvedInstanceExportAlias(scope, alias, idx, type);
	}

	return idx;
}

u32 AliasResolver::resolveOuter(const OuterAlias& alias)
{
	if (!alias.kind.isOuterAliasable()) {
		scope.throwValidationError(ValidationErrorType::KindMismatch,
			std::string{ "Outer aliases may only refer to modules and types, found " } + alias.kind.name());
	}

	if (alias.depth >= scope.depth()) {
		scope.throwValidationError(ValidationErrorType::AliasDepthError,
			"Outer alias depth " + std::to_string(alias.depth) + " exceeds the "
			+ std::to_string(scope.depth()) + " enclosing module(s)");
	}

	// Walk up to the target ancestor. Its index space is only visible up to
	// the length it had when the next inner scope was declared.
	auto link = &*scope.parentLink();
	for (u32 i = 0; i != alias.depth; i++) {
		link = &*link->scope->parentLink();
	}

	auto& ancestor = *link->scope;
	auto visibleLength = link->visibleLengths[alias.kind];
	auto item = ancestor.space(alias.kind).lookup(alias.index, visibleLength);
	if (!item.has_value()) {
		scope.throwValidationError(ValidationErrorType::UnboundIndex,
			std::string{ "Outer " } + alias.kind.name() + " index " + std::to_string(alias.index) + " of "
			+ quoted(ancestor.name()) + " is out of bounds, only " + std::to_string(visibleLength) + " visible");
	}

	DefType type = *item;
	auto idx = scope.declare(alias.kind, type);

	if (introspector.has_value()) {
		introspector->onResolvedOuterAlias(scope, alias, ancestor, idx, type);
	}

	return idx;
}
