#pragma once

#include <optional>
#include <span>
#include <string>
#include <vector>

#include "definitions.h"
#include "error.h"
#include "instantiation.h"
#include "nullable.h"

namespace MODLINK {

	struct ValidatorOptions {
		// Maximum number of modules enclosing a nested module definition
		u32 maxNestingDepth{ 64 };
	};

	struct SiblingValidationResult {
		ModuleTypeRef type;
		std::optional<ValidationError> error;

		bool succeeded() const { return !error.has_value(); }
	};

	// Validates module definitions in a single forward pass and derives their
	// module types. Failures are reported as ValidationError exceptions.
	class ModuleValidator {
	public:
		ModuleValidator(Nullable<Introspector> i= {}, ValidatorOptions o= {})
			: introspector{ i }, options{ o } {}

		ModuleTypeRef validate(const ModuleDefinition&);
		ModuleTypeRef validate(const ModuleDefinition&, const Scope&);

		// Validates independent modules concurrently. Workers only read the
		// parent scope and run without an introspector.
		std::vector<SiblingValidationResult> validateSiblings(std::span<const ModuleDefinition* const>, Nullable<const Scope> = {}) const;

	private:
		ModuleTypeRef validateScope(Scope&, const ModuleDefinition&);
		void validateDefinition(Scope&, const Definition&);

		void validateNestedModule(Scope&, const NestedModuleDefinition&);
		void validateInstantiation(Scope&, const InstantiateDefinition&);
		void validateTupleInstance(Scope&, const TupleInstanceDefinition&);
		void validateExport(Scope&, const ExportDefinition&);

		std::vector<NamedArgument> resolveArguments(Scope&, std::span<const NamedReference>, const char*);
		const DefType& resolveReference(Scope&, const ItemReference&, const char*);

		DefType resolveTypeExpression(Scope&, const TypeExpression&);
		InstanceType::ExportMap resolveShapeEntries(Scope&, const std::vector<NamedTypeExpression>&, const char*);
		void checkDefType(Scope&, const DefType&);

		Nullable<Introspector> introspector;
		ValidatorOptions options;
	};
}
