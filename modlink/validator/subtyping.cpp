#include <cassert>

#include "subtyping.h"

using namespace MODLINK;

bool SubtypeChecker::isSubtype(const DefType& a, const DefType& b)
{
	reset();
	return matchesType(a, b);
}

bool SubtypeChecker::isInstanceSubtype(const InstanceType& a, const InstanceType& b)
{
	reset();
	return matchesEntries(a, b, false);
}

bool SubtypeChecker::isModuleSubtype(const ModuleType& a, const ModuleType& b)
{
	reset();
	return matchesModule(a, b);
}

void SubtypeChecker::reset()
{
	mPath.clear();
	mMismatch.clear();
}

bool SubtypeChecker::matchesType(const DefType& a, const DefType& b)
{
	if (a.kind() != b.kind()) {
		return fail(std::string{ "expected " } + b.kind().name() + " but found " + a.kind().name());
	}

	switch (a.kind()) {
	case ItemKind::Function:
		if (!(a.asFunction() == b.asFunction())) {
			return fail("function type " + a.toString() + " does not match " + b.toString());
		}
		return true;

	case ItemKind::Table:
		if (!(a.asTable() == b.asTable())) {
			return fail("table type " + a.toString() + " does not match " + b.toString());
		}
		return true;

	case ItemKind::Memory:
		if (!(a.asMemory() == b.asMemory())) {
			return fail("memory type " + a.toString() + " does not match " + b.toString());
		}
		return true;

	case ItemKind::Global:
		if (!(a.asGlobal() == b.asGlobal())) {
			return fail("global type " + a.toString() + " does not match " + b.toString());
		}
		return true;

	case ItemKind::Instance:
		// Shared type values are trivially related
		if (a.instanceRef() == b.instanceRef()) {
			return true;
		}
		return matchesEntries(a.asInstance(), b.asInstance(), false);

	case ItemKind::Module:
		if (a.moduleRef() == b.moduleRef()) {
			return true;
		}
		return matchesModule(a.asModule(), b.asModule());

	default:
		assert(false);
		return false;
	}
}

bool SubtypeChecker::matchesEntries(const InstanceType& sub, const InstanceType& super, bool areImports)
{
	// Every entry required by the super type has to be present in the sub type with
	// a matching type. Entries only present in the sub type are ignored.
	// For imports the arguments are already swapped by the caller, so 'super' holds
	// the imports of the module that is checked to be the subtype.

	for (auto& name : super.sortedNames()) {
		auto& expected = *super.exportByName(name);
		auto found = sub.exportByName(name);
		if (!found.has_value()) {
			if (areImports) {
				return fail("import " + quoted(name) + " is required but not provided by the super type");
			}
			return fail("export " + quoted(name) + " is missing");
		}

		mPath.emplace_back(std::string{ areImports ? "import " : "export " } + quoted(name));
		if (!matchesType(*found, expected)) {
			mPath.pop_back();
			return false;
		}
		mPath.pop_back();
	}

	return true;
}

bool SubtypeChecker::matchesModule(const ModuleType& a, const ModuleType& b)
{
	// (i1, e1) <= (i2, e2) iff e1 <= e2 and i2 <= i1

	if (!matchesEntries(a.exports(), b.exports(), false)) {
		return false;
	}

	return matchesEntries(b.imports(), a.imports(), true);
}

bool SubtypeChecker::fail(const std::string& reason)
{
	mMismatch.clear();
	for (auto& segment : mPath) {
		mMismatch += segment;
		mMismatch += " / ";
	}
	mMismatch += reason;

	return false;
}

bool MODLINK::isSubtype(const DefType& a, const DefType& b)
{
	return SubtypeChecker{}.isSubtype(a, b);
}

bool MODLINK::checkInstanceSubtype(const InstanceType& a, const InstanceType& b)
{
	if (&a == &b) {
		return true;
	}

	return SubtypeChecker{}.isInstanceSubtype(a, b);
}

bool MODLINK::checkModuleSubtype(const ModuleType& a, const ModuleType& b)
{
	if (&a == &b) {
		return true;
	}

	return SubtypeChecker{}.isModuleSubtype(a, b);
}

bool MODLINK::areEquivalent(const DefType& a, const DefType& b)
{
	return isSubtype(a, b) && isSubtype(b, a);
}
