#include <stdexcept>

#include "host_instance.h"

using namespace MODLINK;

HostInstanceBuilder& HostInstanceBuilder::defineFunction(std::string name, std::vector<ValType> params, std::vector<ValType> results)
{
	return define(std::move(name), FunctionType{ std::move(params), std::move(results) });
}

HostInstanceBuilder& HostInstanceBuilder::defineTable(std::string name, ValType elementType, u32 min, std::optional<u32> max)
{
	TableType type{ elementType, Limits{ min, max } };
	if (!type.isValid()) {
		throw std::runtime_error{ "Host table '" + name + "' has an invalid type" };
	}

	return define(std::move(name), type);
}

HostInstanceBuilder& HostInstanceBuilder::defineMemory(std::string name, u32 min, std::optional<u32> max)
{
	MemoryType type{ Limits{ min, max } };
	if (!type.isValid()) {
		throw std::runtime_error{ "Host memory '" + name + "' has invalid limits" };
	}

	return define(std::move(name), type);
}

HostInstanceBuilder& HostInstanceBuilder::defineGlobal(std::string name, ValType type, bool isMutable)
{
	return define(std::move(name), GlobalType{ type, isMutable });
}

HostInstanceBuilder& HostInstanceBuilder::defineInstance(std::string name, InstanceTypeRef type)
{
	if (!type) {
		throw std::runtime_error{ "Host instance '" + name + "' has no type" };
	}

	return define(std::move(name), std::move(type));
}

HostInstanceBuilder& HostInstanceBuilder::defineModule(std::string name, ModuleTypeRef type)
{
	if (!type) {
		throw std::runtime_error{ "Host module '" + name + "' has no type" };
	}

	return define(std::move(name), std::move(type));
}

HostInstanceBuilder& HostInstanceBuilder::define(std::string name, DefType type)
{
	auto [elem, didInsert] = mItems.emplace(name, std::move(type));
	if (!didInsert) {
		throw std::runtime_error{ "A host item named '" + name + "' already exists in '" + mName + "'" };
	}
	return *this;
}

InstanceTypeRef HostInstanceBuilder::toInstanceType() const
{
	return InstanceType::make(mItems);
}

ImportObject& ImportObject::add(std::string name, DefType type)
{
	mArguments.push_back({ std::move(name), std::move(type) });
	return *this;
}

ImportObject& ImportObject::addInstance(const HostInstanceBuilder& builder)
{
	return add(builder.name(), builder.toInstanceType());
}
