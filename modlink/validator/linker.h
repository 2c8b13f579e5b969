#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "host_instance.h"
#include "validator.h"

namespace MODLINK {

	struct LinkerOptions {
		ValidatorOptions validator{};

		// Parallel validation reports only per module results to the attached
		// introspector, events of single definitions are not logged
		bool parallelValidation{ true };
	};

	// Registry of named top level modules and host instances. Modules are
	// validated on demand or all at once, and can be instantiated with host
	// provided arguments.
	class Linker {
	public:
		Linker(LinkerOptions o= {});
		~Linker();

		void registerModule(std::shared_ptr<const ModuleDefinition>);
		InstanceTypeRef registerHostInstance(const HostInstanceBuilder&);

		void validateModules();

		ModuleTypeRef moduleTypeByName(const std::string&);
		InstanceTypeRef hostInstanceByName(const std::string&) const;

		InstanceTypeRef instantiate(const std::string&, const ImportObject&);

		void attachIntrospector(std::unique_ptr<Introspector>);

	private:
		struct RegisteredModule {
			std::shared_ptr<const ModuleDefinition> definition;
			ModuleTypeRef type;
			std::optional<ValidationError> error;

			bool isPending() const { return !type && !error.has_value(); }
		};

		void registerName(const std::string&);
		RegisteredModule& findModule(const std::string&);
		void validateSequentially(RegisteredModule&);
		void validateInParallel(const std::vector<RegisteredModule*>&);

		LinkerOptions options;
		std::vector<RegisteredModule> modules;
		std::unordered_map<std::string, sizeType> moduleNameMap;
		std::unordered_map<std::string, InstanceTypeRef> hostInstances;

		std::unique_ptr<Introspector> attachedIntrospector;
	};
}
