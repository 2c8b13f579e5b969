#pragma once

namespace MODLINK {
	template<typename, int> struct TypedIndex;
	template<typename> class IndexSpace;

	class ValType;
	class ItemKind;
	class ValidationErrorType;
	class ScopeState;

	class Limits;
	class FunctionType;
	class TableType;
	class MemoryType;
	class GlobalType;
	class DefType;
	class InstanceType;
	class ModuleType;

	class TypeExpression;
	struct NamedTypeExpression;
	struct ItemReference;
	struct NamedReference;
	struct InstanceExportAlias;
	struct OuterAlias;
	class Definition;
	class ModuleDefinition;
	class ModuleBuilder;

	class Scope;
	class SubtypeChecker;
	class AliasResolver;
	struct NamedArgument;
	class ModuleValidator;

	class HostInstanceBuilder;
	class ImportObject;
	class Linker;

	class Error;
	class ValidationError;
	class LookupError;
	class AggregateValidationError;

	class Introspector;
	class DebugLogger;
	class ConsoleLogger;

	template<typename> class Nullable;
	template<typename> class NonNull;
	template<typename, typename> class SealedUnorderedMap;
}
