#include <cassert>
#include <stdexcept>

#include "scope.h"

using namespace MODLINK;

Scope::Scope(std::string n)
	: mName{ std::move(n) } {}

Scope::Scope(std::string n, const Scope& parent)
	: mName{ std::move(n) }, mParentLink{ ParentLink{ parent, parent.lengths() } }, mDepth{ parent.depth() + 1 } {}

void Scope::beginValidation()
{
	if (mState != ScopeState::Empty) {
		throw std::logic_error{ "Scope '" + mName + "' was already validated" };
	}

	mState = ScopeState::Accumulating;
}

ModuleTypeRef Scope::freeze()
{
	// The accumulated import and export names become the module type. The index
	// spaces stay readable for nested scopes that keep a link to this one.
	ensureAccumulating();
	mState = ScopeState::Frozen;

	return ModuleType::make(std::move(mImports), std::move(mExports));
}

void Scope::fail()
{
	if (mState != ScopeState::Frozen) {
		mState = ScopeState::Failed;
	}
}

u32 Scope::declare(ItemKind kind, DefType item)
{
	ensureAccumulating();

	// The type space holds types of any kind, all other spaces only their own kind
	assert(kind == ItemKind::Type || item.kind() == kind);
	return mSpaces[kind].declare(std::move(item));
}

const DefType& Scope::resolve(ItemKind kind, u32 idx) const
{
	return resolveVisible(kind, idx, length(kind));
}

const DefType& Scope::resolveVisible(ItemKind kind, u32 idx, u32 visibleLength) const
{
	// Only entries declared before the reference are visible. Forward and self
	// references are therefore unbound and cannot form cycles.
	auto item = mSpaces[kind].lookup(idx, visibleLength);
	if (!item.has_value()) {
		throwValidationError(ValidationErrorType::UnboundIndex,
			std::string{ kind.name() } + " index " + std::to_string(idx) + " is out of bounds, only " + std::to_string(visibleLength) + " defined");
	}

	return *item;
}

u32 Scope::declareImport(const std::string& importName, DefType item)
{
	ensureAccumulating();

	auto kind = item.kind();
	auto [it, didInsert] = mImports.emplace(importName, item);
	if (!didInsert) {
		throwValidationError(ValidationErrorType::DuplicateName, "Duplicate import name " + quoted(importName));
	}

	return declare(kind, std::move(item));
}

void Scope::declareExport(const std::string& exportName, DefType item)
{
	ensureAccumulating();

	auto [it, didInsert] = mExports.emplace(exportName, std::move(item));
	if (!didInsert) {
		throwValidationError(ValidationErrorType::DuplicateName, "Duplicate export name " + quoted(exportName));
	}
}

u32 Scope::length(ItemKind kind) const
{
	return mSpaces[kind].size();
}

Scope::Lengths Scope::lengths() const
{
	Lengths result;
	for (u32 i = 0; i != ItemKind::NumberOfItems; i++) {
		result[i] = mSpaces[i].size();
	}
	return result;
}

const InstanceType& Scope::instanceByIndex(ModuleInstanceIndex idx) const
{
	return resolve(ItemKind::Instance, idx.value).asInstance();
}

const ModuleTypeRef& Scope::moduleByIndex(NestedModuleIndex idx) const
{
	return resolve(ItemKind::Module, idx.value).moduleRef();
}

const DefType& Scope::typeByIndex(ModuleTypeIndex idx) const
{
	return resolve(ItemKind::Type, idx.value);
}

void Scope::throwValidationError(ValidationErrorType type, const std::string& message) const
{
	throw ValidationError{ mName, type, message };
}

void Scope::ensureAccumulating() const
{
	if (mState != ScopeState::Accumulating) {
		throw std::logic_error{ "Scope '" + mName + "' does not accept definitions in state " + mState.name() };
	}
}
