#include <stdexcept>

#include <gtest/gtest.h>

#include "../validator/linker.h"
#include "test_helpers.h"

using namespace MODLINK;
using namespace MODLINK::test;

namespace {
	std::shared_ptr<const ModuleDefinition> application() {
		ModuleBuilder builder{ "app" };
		builder
			.importItem("libc-1.0.0", TypeExpression::instance({
				{ "memory", TypeExpression::memory(1) },
				{ "malloc", TypeExpression::function({ ValType::I32 }, { ValType::I32 }) }
			}))
			.aliasExport(0, "malloc", ItemKind::Function)
			.exportItem("alloc", ItemReference::function(0));
		return builder.toDefinition();
	}

	std::shared_ptr<const ModuleDefinition> brokenModule(std::string name) {
		ModuleBuilder builder{ std::move(name) };
		builder.exportItem("f", ItemReference::function(3));
		return builder.toDefinition();
	}

	HostInstanceBuilder libc(std::string name, bool withMalloc) {
		HostInstanceBuilder builder{ std::move(name) };
		builder
			.defineMemory("memory", 1)
			.defineFunction("free", { ValType::I32 });
		if (withMalloc) {
			builder.defineFunction("malloc", { ValType::I32 }, { ValType::I32 });
		}
		return builder;
	}
}

TEST(LinkerTest, ModuleTypeIsValidatedOnDemand) {
	Linker linker;
	linker.registerModule(application());

	auto type = linker.moduleTypeByName("app");
	ASSERT_NE(type, nullptr);
	EXPECT_TRUE(type->imports().exports().contains("libc-1.0.0"));
	EXPECT_EQ(linker.moduleTypeByName("app"), type);
}

TEST(LinkerTest, UnknownNames) {
	Linker linker;
	EXPECT_THROW(linker.moduleTypeByName("nope"), LookupError);
	EXPECT_THROW(linker.hostInstanceByName("nope"), LookupError);
	EXPECT_THROW(linker.instantiate("nope", ImportObject{}), LookupError);
}

TEST(LinkerTest, NamesMustBeUnique) {
	Linker linker;
	linker.registerModule(application());
	EXPECT_THROW(linker.registerModule(application()), LookupError);

	EXPECT_THROW(linker.registerHostInstance(HostInstanceBuilder{ "app" }), LookupError);

	linker.registerHostInstance(libc("libc", true));
	EXPECT_THROW(linker.registerHostInstance(libc("libc", false)), LookupError);
	EXPECT_THROW(linker.registerModule(brokenModule("libc")), LookupError);
}

TEST(LinkerTest, ModulesNeedAName) {
	Linker linker;
	EXPECT_THROW(linker.registerModule(ModuleBuilder{}.toDefinition()), LookupError);
}

TEST(LinkerTest, HostInstanceType) {
	Linker linker;
	auto registered = linker.registerHostInstance(libc("libc", true));
	auto type = linker.hostInstanceByName("libc");

	EXPECT_EQ(registered, type);
	EXPECT_EQ(type->sortedNames(), (std::vector<std::string>{ "free", "malloc", "memory" }));
	EXPECT_TRUE(areEquivalent(*type->exportByName("malloc"), func({ ValType::I32 }, { ValType::I32 })));
}

TEST(LinkerTest, HostInstanceBuilderMisuse) {
	HostInstanceBuilder builder{ "env" };
	builder.defineFunction("f");

	EXPECT_THROW(builder.defineMemory("f", 1), std::runtime_error);
	EXPECT_THROW(builder.defineMemory("big", 0x10001), std::runtime_error);
	EXPECT_THROW(builder.defineTable("t", ValType::I64, 1), std::runtime_error);
	EXPECT_THROW(builder.defineInstance("i", nullptr), std::runtime_error);
	EXPECT_NO_THROW(builder.defineTable("t", ValType::FuncRef, 1, 2));
	EXPECT_NO_THROW(builder.defineGlobal("g", ValType::I32, true));
	EXPECT_NO_THROW(builder.defineModule("m", ModuleType::make()));
	EXPECT_EQ(builder.toInstanceType()->size(), 4u);
}

TEST(LinkerTest, InstantiateWithNewerLibrary) {
	Linker linker;
	linker.registerModule(application());
	linker.registerHostInstance(libc("libc-1.1.0", true));

	ImportObject imports;
	imports.add("libc-1.0.0", linker.hostInstanceByName("libc-1.1.0"));

	auto instance = linker.instantiate("app", imports);
	EXPECT_TRUE(instance->exports().contains("alloc"));
	EXPECT_EQ(instance, linker.moduleTypeByName("app")->exportsRef());
}

TEST(LinkerTest, InstantiateWithLibraryLackingMalloc) {
	Linker linker;
	linker.registerModule(application());

	ImportObject imports;
	imports.addInstance(libc("libc-1.0.0", false));

	try {
		linker.instantiate("app", imports);
		FAIL() << "Instantiation without malloc should fail";
	}
	catch (const ValidationError& e) {
		EXPECT_EQ(e.type(), ValidationErrorType::SubtypeError);
		EXPECT_EQ(e.module(), "app");
	}
}

TEST(LinkerTest, DuplicateImportObjectEntries) {
	Linker linker;
	linker.registerModule(application());

	ImportObject imports;
	imports
		.addInstance(libc("libc-1.0.0", true))
		.addInstance(libc("libc-1.0.0", true));

	EXPECT_TRUE(failsWith([&]() { linker.instantiate("app", imports); }, ValidationErrorType::DuplicateArgName));
}

namespace {
	void expectAllErrorsCollected(LinkerOptions options) {
		Linker linker{ options };
		linker.registerModule(brokenModule("first"));
		linker.registerModule(application());
		linker.registerModule(brokenModule("second"));

		try {
			linker.validateModules();
			FAIL() << "Validation should fail";
		}
		catch (const AggregateValidationError& e) {
			ASSERT_EQ(e.errors().size(), 2u);
			EXPECT_EQ(e.errors()[0].module(), "first");
			EXPECT_EQ(e.errors()[1].module(), "second");
			EXPECT_EQ(e.errors()[0].type(), ValidationErrorType::UnboundIndex);
		}

		// Valid modules remain usable
		EXPECT_NE(linker.moduleTypeByName("app"), nullptr);
		EXPECT_THROW(linker.moduleTypeByName("first"), ValidationError);

		// Earlier failures are reported again
		EXPECT_THROW(linker.validateModules(), AggregateValidationError);
	}
}

TEST(LinkerTest, ParallelValidationCollectsAllErrors) {
	expectAllErrorsCollected(LinkerOptions{ {}, true });
}

TEST(LinkerTest, SequentialValidationCollectsAllErrors) {
	expectAllErrorsCollected(LinkerOptions{ {}, false });
}

TEST(LinkerTest, ValidModulesPassValidation) {
	Linker linker;
	linker.registerModule(application());
	linker.registerModule(ModuleBuilder{ "empty" }.toDefinition());

	EXPECT_NO_THROW(linker.validateModules());
	EXPECT_TRUE(linker.moduleTypeByName("empty")->exports().empty());
}

TEST(LinkerTest, ValidatorOptionsAreForwarded) {
	ModuleBuilder inner{ "inner" };
	ModuleBuilder outer{ "outer" };
	outer.defineModule(inner);

	Linker linker{ LinkerOptions{ ValidatorOptions{ 0 }, false } };
	linker.registerModule(outer.toDefinition());

	EXPECT_TRUE(failsWith([&]() { linker.moduleTypeByName("outer"); }, ValidationErrorType::NestingTooDeep));
}
