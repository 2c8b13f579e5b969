#pragma once

#include <ostream>
#include <string>
#include <string_view>

#include "forward.h"
#include "util.h"

namespace MODLINK {
	class Introspector {
	public:
		virtual ~Introspector() = default;

		virtual void onModuleValidationStart(const Scope&) = 0;
		virtual void onModuleValidationFinished(const Scope&, const ModuleType&) = 0;
		virtual void onModuleValidationFailed(const Scope&, const ValidationError&) = 0;
		virtual void onValidatingDefinition(const Scope&, const Definition&) = 0;
		virtual void onDeclaredType(const Scope&, u32, const DefType&) = 0;
		virtual void onDeclaredImport(const Scope&, const std::string&, u32, const DefType&) = 0;
		virtual void onDeclaredModule(const Scope&, u32, const ModuleType&) = 0;
		virtual void onDeclaredInstance(const Scope&, u32, const InstanceType&) = 0;
		virtual void onDeclaredExport(const Scope&, const std::string&, const DefType&) = 0;
		virtual void onResolvedInstanceExportAlias(const Scope&, const InstanceExportAlias&, u32, const DefType&) = 0;
		virtual void onResolvedOuterAlias(const Scope&, const OuterAlias&, const Scope&, u32, const DefType&) = 0;

		virtual void onInstantiationStart(std::string_view, const ModuleType&) = 0;
		virtual void onInstantiationArgumentMatched(std::string_view, const std::string&, const DefType&, const DefType&) = 0;
		virtual void onIgnoringSuperfluousArgument(std::string_view, const std::string&) = 0;
		virtual void onInstantiationFinished(std::string_view, const InstanceType&) = 0;

		virtual void onRegisteredModule(const ModuleDefinition&) = 0;
		virtual void onRegisteredHostInstance(const std::string&, const InstanceType&) = 0;
		virtual void onValidatedRegisteredModule(const std::string&, const ModuleType&) = 0;
		virtual void onRegisteredModuleFailed(const std::string&, const ValidationError&) = 0;
		virtual void onLinkerValidationFinished(sizeType, sizeType) = 0;
	};

	class DebugLogger : public Introspector {
	public:
		virtual void onModuleValidationStart(const Scope&) override;
		virtual void onModuleValidationFinished(const Scope&, const ModuleType&) override;
		virtual void onModuleValidationFailed(const Scope&, const ValidationError&) override;
		virtual void onValidatingDefinition(const Scope&, const Definition&) override;
		virtual void onDeclaredType(const Scope&, u32, const DefType&) override;
		virtual void onDeclaredImport(const Scope&, const std::string&, u32, const DefType&) override;
		virtual void onDeclaredModule(const Scope&, u32, const ModuleType&) override;
		virtual void onDeclaredInstance(const Scope&, u32, const InstanceType&) override;
		virtual void onDeclaredExport(const Scope&, const std::string&, const DefType&) override;
		virtual void onResolvedInstanceExportAlias(const Scope&, const InstanceExportAlias&, u32, const DefType&) override;
		virtual void onResolvedOuterAlias(const Scope&, const OuterAlias&, const Scope&, u32, const DefType&) override;

		virtual void onInstantiationStart(std::string_view, const ModuleType&) override;
		virtual void onInstantiationArgumentMatched(std::string_view, const std::string&, const DefType&, const DefType&) override;
		virtual void onIgnoringSuperfluousArgument(std::string_view, const std::string&) override;
		virtual void onInstantiationFinished(std::string_view, const InstanceType&) override;

		virtual void onRegisteredModule(const ModuleDefinition&) override;
		virtual void onRegisteredHostInstance(const std::string&, const InstanceType&) override;
		virtual void onValidatedRegisteredModule(const std::string&, const ModuleType&) override;
		virtual void onRegisteredModuleFailed(const std::string&, const ValidationError&) override;
		virtual void onLinkerValidationFinished(sizeType, sizeType) override;

	protected:
		virtual std::ostream& outStream() = 0;
		virtual bool doLoggingWhenValidating() = 0;
		virtual bool doLoggingWhenLinking() = 0;

	private:
		std::ostream& indented(const Scope&);
	};

	class ConsoleLogger : public DebugLogger {
	public:
		ConsoleLogger(std::ostream& s, bool lv= true, bool ll= true)
			: logWhenValidating{ lv }, logWhenLinking{ ll }, stream{ s } {}

	protected:
		virtual std::ostream& outStream() override;
		virtual bool doLoggingWhenValidating() override;
		virtual bool doLoggingWhenLinking() override;

		bool logWhenValidating;
		bool logWhenLinking;
		std::ostream& stream;
	};
}
