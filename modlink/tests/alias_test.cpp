#include <gtest/gtest.h>

#include "../validator/alias.h"
#include "../validator/module_builder.h"
#include "../validator/scope.h"
#include "test_helpers.h"

using namespace MODLINK;
using namespace MODLINK::test;

namespace {
	ModuleBuilder moduleImportingLib() {
		ModuleBuilder builder{ "m" };
		builder.importItem("lib", TypeExpression::instance({
			{ "f", TypeExpression::function({ ValType::I32 }) },
			{ "mem", TypeExpression::memory(1) }
		}));
		return builder;
	}
}

TEST(InstanceExportAliasTest, AliasedItemIsAppended) {
	auto builder = moduleImportingLib();
	builder
		.importItem("g", TypeExpression::function())
		.aliasExport(0, "f", ItemKind::Function)
		.aliasExport(0, "mem", ItemKind::Memory)
		.exportItem("f", ItemReference::function(1))
		.exportItem("mem", ItemReference::memory(0));

	auto type = validateModule(builder);
	EXPECT_TRUE(isSubtype(*type->exports().exportByName("f"), func({ ValType::I32 })));
	EXPECT_TRUE(isSubtype(*type->exports().exportByName("mem"), memory(1)));
}

TEST(InstanceExportAliasTest, MissingExport) {
	auto builder = moduleImportingLib();
	builder.aliasExport(0, "g", ItemKind::Function);

	EXPECT_TRUE(failsWith(builder, ValidationErrorType::UnboundExport));
}

TEST(InstanceExportAliasTest, KindMustMatchTheExport) {
	auto builder = moduleImportingLib();
	builder.aliasExport(0, "mem", ItemKind::Function);

	EXPECT_TRUE(failsWith(builder, ValidationErrorType::KindMismatch));
}

TEST(InstanceExportAliasTest, TypesCannotBeAliasedFromInstances) {
	auto builder = moduleImportingLib();
	builder.aliasExport(0, "f", ItemKind::Type);

	EXPECT_TRUE(failsWith(builder, ValidationErrorType::KindMismatch));
}

TEST(InstanceExportAliasTest, UnboundInstance) {
	auto builder = moduleImportingLib();
	builder.aliasExport(1, "f", ItemKind::Function);

	EXPECT_TRUE(failsWith(builder, ValidationErrorType::UnboundIndex));
}

TEST(OuterAliasTest, TopLevelModuleHasNoEnclosingScope) {
	ModuleBuilder builder{ "top" };
	builder.aliasOuter(0, 0, ItemKind::Type);

	EXPECT_TRUE(failsWith(builder, ValidationErrorType::AliasDepthError));
}

TEST(OuterAliasTest, DepthEqualToEnclosingScopesIsRejected) {
	ModuleBuilder inner{ "inner" };
	inner.aliasOuter(1, 0, ItemKind::Type);

	ModuleBuilder outer{ "outer" };
	outer
		.defineType(TypeExpression::function())
		.defineModule(inner);

	EXPECT_TRUE(failsWith(outer, ValidationErrorType::AliasDepthError));
}

TEST(OuterAliasTest, ResolvesTypeOfEnclosingModule) {
	ModuleBuilder inner{ "inner" };
	inner
		.aliasOuter(0, 0, ItemKind::Type)
		.importItem("f", TypeExpression::indexed(ItemKind::Function, 0))
		.exportItem("f", ItemReference::function(0));

	ModuleBuilder outer{ "outer" };
	outer
		.defineType(TypeExpression::function({ ValType::F32 }, { ValType::F32 }))
		.defineModule(inner)
		.exportItem("inner", ItemReference::module(0));

	auto type = validateModule(outer);
	auto expected = module({ { "f", func({ ValType::F32 }, { ValType::F32 }) } }, { { "f", func({ ValType::F32 }, { ValType::F32 }) } });
	EXPECT_TRUE(areEquivalent(*type->exports().exportByName("inner"), expected));
}

TEST(OuterAliasTest, ResolvesAcrossTwoLevels) {
	ModuleBuilder innermost{ "innermost" };
	innermost
		.aliasOuter(1, 0, ItemKind::Type)
		.importItem("mem", TypeExpression::indexed(ItemKind::Memory, 0));

	ModuleBuilder middle{ "middle" };
	middle
		.defineType(TypeExpression::function())
		.defineModule(innermost);

	ModuleBuilder outer{ "outer" };
	outer
		.defineType(TypeExpression::memory(2, 4))
		.defineModule(middle);

	EXPECT_NO_THROW(validateModule(outer));
}

TEST(OuterAliasTest, AliasedModuleCanBeInstantiated) {
	ModuleBuilder leaf{ "leaf" };
	leaf
		.importItem("f", TypeExpression::function())
		.exportItem("f", ItemReference::function(0));

	ModuleBuilder user{ "user" };
	user
		.importItem("f", TypeExpression::function())
		.aliasOuter(0, 0, ItemKind::Module)
		.instantiate(0, { { "f", ItemReference::function(0) } })
		.exportItem("leaf", ItemReference::instance(0));

	ModuleBuilder outer{ "outer" };
	outer
		.defineModule(leaf)
		.defineModule(user);

	EXPECT_NO_THROW(validateModule(outer));
}

TEST(OuterAliasTest, OnlyItemsDeclaredBeforeTheNestedModuleAreVisible) {
	ModuleBuilder inner{ "inner" };
	inner.aliasOuter(0, 1, ItemKind::Type);

	ModuleBuilder outer{ "outer" };
	outer
		.defineType(TypeExpression::function())
		.defineModule(inner)
		.defineType(TypeExpression::memory(1));

	try {
		validateModule(outer);
		FAIL() << "Type 1 of the outer module should not be visible";
	}
	catch (const ValidationError& e) {
		EXPECT_EQ(e.type(), ValidationErrorType::UnboundIndex);
		EXPECT_EQ(e.module(), "outer/inner");
	}
}

TEST(OuterAliasTest, ModuleCannotAliasItself) {
	ModuleBuilder inner{ "inner" };
	inner.aliasOuter(0, 0, ItemKind::Module);

	ModuleBuilder outer{ "outer" };
	outer.defineModule(inner);

	EXPECT_TRUE(failsWith(outer, ValidationErrorType::UnboundIndex));
}

TEST(OuterAliasTest, OnlyModulesAndTypes) {
	ModuleBuilder inner{ "inner" };
	inner.aliasOuter(0, 0, ItemKind::Function);

	ModuleBuilder outer{ "outer" };
	outer
		.importItem("f", TypeExpression::function())
		.defineModule(inner);

	EXPECT_TRUE(failsWith(outer, ValidationErrorType::KindMismatch));
}

TEST(OuterAliasTest, ParentItemsDeclaredAfterTheChildAreHidden) {
	Scope parent{ "outer" };
	parent.beginValidation();
	parent.declare(ItemKind::Type, func());
	parent.declare(ItemKind::Module, module());

	Scope child{ "outer/inner", parent };
	child.beginValidation();

	parent.declare(ItemKind::Type, memory(1));
	parent.declare(ItemKind::Module, module({ { "x", func() } }));
	ASSERT_EQ(parent.length(ItemKind::Type), 2u);

	AliasResolver resolver{ child };
	EXPECT_EQ(resolver.resolveOuter(OuterAlias{ 0, 0, ItemKind::Type }), 0u);
	EXPECT_EQ(resolver.resolveOuter(OuterAlias{ 0, 0, ItemKind::Module }), 0u);

	try {
		resolver.resolveOuter(OuterAlias{ 0, 1, ItemKind::Type });
		FAIL() << "Type 1 was declared after the child scope";
	}
	catch (const ValidationError& e) {
		EXPECT_EQ(e.type(), ValidationErrorType::UnboundIndex);
		EXPECT_EQ(e.module(), "outer/inner");
	}

	EXPECT_TRUE(failsWith([&]() { resolver.resolveOuter(OuterAlias{ 0, 1, ItemKind::Module }); }, ValidationErrorType::UnboundIndex));
	EXPECT_EQ(child.length(ItemKind::Type), 1u);
	EXPECT_EQ(child.length(ItemKind::Module), 1u);
}

TEST(OuterAliasTest, SnapshotAppliesWhenValidatingAgainstAParent) {
	Scope parent{ "host" };
	parent.beginValidation();
	parent.declare(ItemKind::Type, func());

	ModuleBuilder builder{ "plugin" };
	builder.aliasOuter(0, 1, ItemKind::Type);
	auto definition = builder.toDefinition();

	ModuleValidator validator;
	EXPECT_TRUE(failsWith([&]() { validator.validate(*definition, parent); }, ValidationErrorType::UnboundIndex));

	parent.declare(ItemKind::Type, memory(1));
	EXPECT_NO_THROW(validator.validate(*definition, parent));
}
