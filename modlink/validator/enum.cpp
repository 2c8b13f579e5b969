#include "enum.h"

using namespace MODLINK;

bool ValType::isNumber() const
{
	switch (value) {
	case I32:
	case I64:
	case F32:
	case F64:
		return true;
	default:
		return false;
	}
}

bool ValType::isVector() const
{
	return value == V128;
}

bool ValType::isReference() const
{
	return value == FuncRef || value == ExternRef;
}

bool ValType::isValid() const
{
	return isNumber() || isVector() || isReference();
}

const char* ValType::name() const
{
	switch (value) {
	case I32: return "i32";
	case I64: return "i64";
	case F32: return "f32";
	case F64: return "f64";
	case V128: return "v128";
	case FuncRef: return "funcref";
	case ExternRef: return "externref";
	default: return "<unknown val type>";
	}
}

const char* ItemKind::name() const
{
	switch (value) {
	case Function: return "func";
	case Table: return "table";
	case Memory: return "memory";
	case Global: return "global";
	case Instance: return "instance";
	case Module: return "module";
	case Type: return "type";
	default: return "<unknown item kind>";
	}
}

const char* ValidationErrorType::name() const
{
	switch (value) {
	case DuplicateName: return "DuplicateName";
	case UnboundIndex: return "UnboundIndex";
	case UnboundExport: return "UnboundExport";
	case KindMismatch: return "KindMismatch";
	case SubtypeError: return "SubtypeError";
	case MissingImport: return "MissingImport";
	case DuplicateArgName: return "DuplicateArgName";
	case AliasDepthError: return "AliasDepthError";
	case InvalidType: return "InvalidType";
	case NestingTooDeep: return "NestingTooDeep";
	default: return "<unknown validation error>";
	}
}

const char* ScopeState::name() const
{
	switch (value) {
	case Empty: return "Empty";
	case Accumulating: return "Accumulating";
	case Frozen: return "Frozen";
	case Failed: return "Failed";
	default: return "<unknown scope state>";
	}
}

std::ostream& MODLINK::operator<<(std::ostream& out, ValType type)
{
	return out << type.name();
}

std::ostream& MODLINK::operator<<(std::ostream& out, ItemKind kind)
{
	return out << kind.name();
}

std::ostream& MODLINK::operator<<(std::ostream& out, ValidationErrorType type)
{
	return out << type.name();
}

std::ostream& MODLINK::operator<<(std::ostream& out, ScopeState state)
{
	return out << state.name();
}
