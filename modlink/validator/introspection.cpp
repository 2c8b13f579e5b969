#include <string>

#include "introspection.h"
#include "definitions.h"
#include "scope.h"

using namespace MODLINK;

std::ostream& DebugLogger::indented(const Scope& scope)
{
	auto& stream = outStream();
	for (u32 i = 0; i != scope.depth(); i++) {
		stream << "  ";
	}
	return stream;
}

void DebugLogger::onModuleValidationStart(const Scope& scope)
{
	if (doLoggingWhenValidating()) {
		indented(scope) << "-> Validating module '" << scope.name() << "'" << std::endl;
	}
}

void DebugLogger::onModuleValidationFinished(const Scope& scope, const ModuleType& type)
{
	if (doLoggingWhenValidating()) {
		indented(scope) << "<- Validated module '" << scope.name() << "': " << type << std::endl;
	}
}

void DebugLogger::onModuleValidationFailed(const Scope& scope, const ValidationError& error)
{
	if (doLoggingWhenValidating()) {
		indented(scope) << "<- Failed module '" << scope.name() << "': " << error << std::endl;
	}
}

void DebugLogger::onValidatingDefinition(const Scope& scope, const Definition& definition)
{
	if (doLoggingWhenValidating()) {
		indented(scope) << "  - " << definition << std::endl;
	}
}

void DebugLogger::onDeclaredType(const Scope& scope, u32 idx, const DefType& type)
{
	if (doLoggingWhenValidating()) {
		indented(scope) << "    type " << idx << " = " << type << std::endl;
	}
}

void DebugLogger::onDeclaredImport(const Scope& scope, const std::string& name, u32 idx, const DefType& type)
{
	if (doLoggingWhenValidating()) {
		indented(scope) << "    import '" << name << "' -> " << type.kind() << ' ' << idx << std::endl;
	}
}

void DebugLogger::onDeclaredModule(const Scope& scope, u32 idx, const ModuleType& type)
{
	if (doLoggingWhenValidating()) {
		indented(scope) << "    module " << idx << " = " << type << std::endl;
	}
}

void DebugLogger::onDeclaredInstance(const Scope& scope, u32 idx, const InstanceType& type)
{
	if (doLoggingWhenValidating()) {
		indented(scope) << "    instance " << idx << " = " << type << std::endl;
	}
}

void DebugLogger::onDeclaredExport(const Scope& scope, const std::string& name, const DefType& type)
{
	if (doLoggingWhenValidating()) {
		indented(scope) << "    export '" << name << "' = " << type << std::endl;
	}
}

void DebugLogger::onResolvedInstanceExportAlias(const Scope& scope, const InstanceExportAlias& alias, u32 idx, const DefType& type)
{
	if (doLoggingWhenValidating()) {
		indented(scope) << "    " << alias.kind << ' ' << idx << " aliases export '" << alias.exportName
			<< "' of instance " << alias.instance << ": " << type << std::endl;
	}
}

void DebugLogger::onResolvedOuterAlias(const Scope& scope, const OuterAlias& alias, const Scope& ancestor, u32 idx, const DefType& type)
{
	if (doLoggingWhenValidating()) {
		indented(scope) << "    " << alias.kind << ' ' << idx << " aliases " << alias.kind << ' ' << alias.index
			<< " of '" << ancestor.name() << "': " << type << std::endl;
	}
}

void DebugLogger::onInstantiationStart(std::string_view context, const ModuleType& type)
{
	if (doLoggingWhenLinking()) {
		outStream() << "-> Instantiating in '" << context << "': " << type << std::endl;
	}
}

void DebugLogger::onInstantiationArgumentMatched(std::string_view, const std::string& name, const DefType& argument, const DefType& import)
{
	if (doLoggingWhenLinking()) {
		outStream() << "  - '" << name << "': " << argument << " matches " << import << std::endl;
	}
}

void DebugLogger::onIgnoringSuperfluousArgument(std::string_view, const std::string& name)
{
	if (doLoggingWhenLinking()) {
		outStream() << "  - '" << name << "': not imported, ignoring" << std::endl;
	}
}

void DebugLogger::onInstantiationFinished(std::string_view context, const InstanceType& type)
{
	if (doLoggingWhenLinking()) {
		outStream() << "<- Instantiated in '" << context << "': " << type << std::endl;
	}
}

void DebugLogger::onRegisteredModule(const ModuleDefinition& definition)
{
	if (doLoggingWhenLinking()) {
		outStream() << "-> Registered module '" << definition.name() << "' with " << definition.size() << " definitions" << std::endl;
	}
}

void DebugLogger::onRegisteredHostInstance(const std::string& name, const InstanceType& type)
{
	if (doLoggingWhenLinking()) {
		outStream() << "-> Registered host instance '" << name << "': " << type << std::endl;
	}
}

void DebugLogger::onValidatedRegisteredModule(const std::string& name, const ModuleType& type)
{
	if (doLoggingWhenLinking()) {
		outStream() << "-> Module '" << name << "' has type " << type << std::endl;
	}
}

void DebugLogger::onRegisteredModuleFailed(const std::string& name, const ValidationError& error)
{
	if (doLoggingWhenLinking()) {
		outStream() << "-> Module '" << name << "' failed: " << error << std::endl;
	}
}

void DebugLogger::onLinkerValidationFinished(sizeType numValidated, sizeType numFailed)
{
	if (doLoggingWhenLinking()) {
		outStream() << "-> Validated " << numValidated << " modules, " << numFailed << " failed" << std::endl;
	}
}

std::ostream& ConsoleLogger::outStream()
{
	return stream;
}

bool ConsoleLogger::doLoggingWhenValidating()
{
	return logWhenValidating;
}

bool ConsoleLogger::doLoggingWhenLinking()
{
	return logWhenLinking;
}
