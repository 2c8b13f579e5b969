#pragma once

#include <optional>
#include <span>
#include <string>
#include <vector>

#include "instantiation.h"
#include "types.h"

namespace MODLINK {

	// Describes the items a host provides under a single instance name
	class HostInstanceBuilder {
	public:
		HostInstanceBuilder(std::string n) : mName{ std::move(n) } {}

		HostInstanceBuilder& defineFunction(std::string name, std::vector<ValType> params= {}, std::vector<ValType> results= {});
		HostInstanceBuilder& defineTable(std::string name, ValType elementType, u32 min, std::optional<u32> max= {});
		HostInstanceBuilder& defineMemory(std::string name, u32 min, std::optional<u32> max= {});
		HostInstanceBuilder& defineGlobal(std::string name, ValType type, bool isMutable= false);
		HostInstanceBuilder& defineInstance(std::string name, InstanceTypeRef type);
		HostInstanceBuilder& defineModule(std::string name, ModuleTypeRef type);

		const std::string& name() const { return mName; }

		InstanceTypeRef toInstanceType() const;

	private:
		HostInstanceBuilder& define(std::string, DefType);

		std::string mName;
		InstanceType::ExportMap mItems;
	};

	// Named arguments supplied by the host when instantiating a module
	class ImportObject {
	public:
		ImportObject& add(std::string name, DefType type);
		ImportObject& addInstance(const HostInstanceBuilder& builder);

		std::span<const NamedArgument> arguments() const { return mArguments; }
		sizeType size() const { return mArguments.size(); }

	private:
		std::vector<NamedArgument> mArguments;
	};
}
