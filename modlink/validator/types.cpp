#include <algorithm>
#include <cassert>
#include <sstream>

#include "types.h"

using namespace MODLINK;

void Limits::print(std::ostream& out) const
{
	out << mMin;
	if (mMax.has_value()) {
		out << ' ' << *mMax;
	}
}

bool Limits::isValid(u32 range) const
{
	// The min value must be smaller or equal to the specified range for a 
	// limit to be valid. Further it must be smaller or equal to the max
	// value if one is present. The max value must also be smaller or equal
	// to the specified range, or be not present.
	// https://webassembly.github.io/spec/core/valid/types.html#valid-limits

	if (mMin > range) {
		return false;
	}

	if (mMax.has_value()) {
		return *mMax <= range && mMin <= *mMax;
	}

	return true;
}

void FunctionType::print(std::ostream& out) const
{
	out << "(func";

	if (!mParameters.empty()) {
		out << " (param";
		for (auto param : mParameters) {
			out << ' ' << param.name();
		}
		out << ')';
	}

	if (!mResults.empty()) {
		out << " (result";
		for (auto result : mResults) {
			out << ' ' << result.name();
		}
		out << ')';
	}

	out << ')';
}

bool FunctionType::operator==(const FunctionType& other) const
{
	if (this == &other) {
		return true;
	}

	if (mParameters.size() != other.mParameters.size() || mResults.size() != other.mResults.size()) {
		return false;
	}

	for (u32 i = 0; i != mParameters.size(); i++) {
		if (mParameters[i] != other.mParameters[i]) {
			return false;
		}
	}

	for (u32 i = 0; i != mResults.size(); i++) {
		if (mResults[i] != other.mResults[i]) {
			return false;
		}
	}

	return true;
}

bool TableType::isValid() const
{
	// Validating a table type checks whether the limit is valid within the range
	// 0...2^32-1 and whether the element type is a reference type
	// https://webassembly.github.io/spec/core/valid/types.html#table-types

	return mElementReferenceType.isReference() && mLimits.isValid(Range);
}

void TableType::print(std::ostream& out) const
{
	out << "(table ";
	mLimits.print(out);
	out << ' ' << mElementReferenceType.name() << ')';
}

bool TableType::operator==(const TableType& other) const
{
	return mElementReferenceType == other.mElementReferenceType && mLimits == other.mLimits;
}

void MemoryType::print(std::ostream& out) const
{
	out << "(memory ";
	mLimits.print(out);
	out << ')';
}

void GlobalType::print(std::ostream& out) const
{
	out << "(global ";
	if (mIsMutable) {
		out << "(mut " << mType.name() << ')';
	}
	else {
		out << mType.name();
	}
	out << ')';
}

bool GlobalType::operator==(const GlobalType& other) const
{
	return mType == other.mType && mIsMutable == other.mIsMutable;
}

DefType::DefType(InstanceTypeRef t)
	: storage{ std::move(t) }
{
	assert(instanceRef() != nullptr);
}

DefType::DefType(ModuleTypeRef t)
	: storage{ std::move(t) }
{
	assert(moduleRef() != nullptr);
}

void DefType::print(std::ostream& out) const
{
	switch (kind()) {
	case ItemKind::Function: asFunction().print(out); break;
	case ItemKind::Table: asTable().print(out); break;
	case ItemKind::Memory: asMemory().print(out); break;
	case ItemKind::Global: asGlobal().print(out); break;
	case ItemKind::Instance: asInstance().print(out); break;
	case ItemKind::Module: asModule().print(out); break;
	default:
		assert(false);
	}
}

std::string DefType::toString() const
{
	std::ostringstream stream;
	print(stream);
	return stream.str();
}

InstanceTypeRef InstanceType::make(ExportMap e)
{
	return std::make_shared<const InstanceType>(std::move(e));
}

std::vector<std::string> InstanceType::sortedNames() const
{
	std::vector<std::string> names;
	names.reserve(mExports.size());
	for (auto& entry : mExports) {
		names.emplace_back(entry.first);
	}

	std::sort(names.begin(), names.end());
	return names;
}

void InstanceType::print(std::ostream& out) const
{
	out << "(instance";
	printEntries(out, "export");
	out << ')';
}

void InstanceType::printEntries(std::ostream& out, const char* keyword) const
{
	for (auto& name : sortedNames()) {
		out << " (" << keyword << " \"" << name << "\" ";
		mExports.lookup(name)->print(out);
		out << ')';
	}
}

ModuleType::ModuleType(InstanceTypeRef i, InstanceTypeRef e)
	: mImports{ std::move(i) }, mExports{ std::move(e) }
{
	assert(mImports && mExports);
}

ModuleTypeRef ModuleType::make(InstanceType::ExportMap imports, InstanceType::ExportMap exports)
{
	return std::make_shared<const ModuleType>(
		InstanceType::make(std::move(imports)),
		InstanceType::make(std::move(exports))
	);
}

void ModuleType::print(std::ostream& out) const
{
	out << "(module";
	mImports->printEntries(out, "import");
	mExports->printEntries(out, "export");
	out << ')';
}

std::ostream& MODLINK::operator<<(std::ostream& out, const DefType& type)
{
	type.print(out);
	return out;
}

std::ostream& MODLINK::operator<<(std::ostream& out, const InstanceType& type)
{
	type.print(out);
	return out;
}

std::ostream& MODLINK::operator<<(std::ostream& out, const ModuleType& type)
{
	type.print(out);
	return out;
}
