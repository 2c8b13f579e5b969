#pragma once

#include <span>
#include <string>
#include <string_view>
#include <unordered_set>

#include "error.h"
#include "nullable.h"
#include "types.h"

namespace MODLINK {

	struct NamedArgument {
		std::string name;
		DefType type;
	};

	// Throws if a name is used for more than one argument
	template<typename T>
	void checkUniqueArgumentNames(std::span<const T> arguments, const std::string& context) {
		std::unordered_set<std::string_view> names;
		for (auto& arg : arguments) {
			if (!names.emplace(arg.name).second) {
				throw ValidationError{ context, ValidationErrorType::DuplicateArgName,
					"Argument name " + quoted(arg.name) + " is used more than once" };
			}
		}
	}

	// Checks a list of named arguments against the imports of a module type
	class InstantiationValidator {
	public:
		InstantiationValidator(std::string c, Nullable<Introspector> i= {})
			: context{ std::move(c) }, introspector{ i } {}

		InstanceTypeRef instantiate(const ModuleType&, std::span<const NamedArgument>);
		InstanceTypeRef makeTuple(std::span<const NamedArgument>);

	private:
		std::string context;
		Nullable<Introspector> introspector;
	};

	InstanceTypeRef instantiate(const ModuleType&, std::span<const NamedArgument>, Nullable<Introspector> = {});
}
