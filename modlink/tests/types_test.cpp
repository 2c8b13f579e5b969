#include <sstream>

#include <gtest/gtest.h>

#include "test_helpers.h"

using namespace MODLINK;
using namespace MODLINK::test;

TEST(LimitsTest, Validity) {
	EXPECT_TRUE(Limits{ 1 }.isValid(10));
	EXPECT_TRUE(Limits(1, 10).isValid(10));
	EXPECT_FALSE(Limits{ 11 }.isValid(10));
	EXPECT_FALSE(Limits(5, 3).isValid(10));
	EXPECT_FALSE(Limits(1, 20).isValid(10));
}

TEST(TypesTest, TableNeedsReferenceElementType) {
	EXPECT_TRUE((TableType{ ValType::FuncRef, Limits{ 1 } }.isValid()));
	EXPECT_TRUE((TableType{ ValType::ExternRef, Limits(0, 0xFFFFFFFF) }.isValid()));
	EXPECT_FALSE((TableType{ ValType::I32, Limits{ 1 } }.isValid()));
}

TEST(TypesTest, MemoryIsLimitedTo64KiPages) {
	EXPECT_TRUE(MemoryType{ Limits(1, 0x10000) }.isValid());
	EXPECT_FALSE(MemoryType{ Limits{ 0x10001 } }.isValid());
}

TEST(TypesTest, LeafTypeEquality) {
	EXPECT_TRUE(FunctionType({ ValType::I32 }, { ValType::I64 }) == FunctionType({ ValType::I32 }, { ValType::I64 }));
	EXPECT_FALSE(FunctionType({ ValType::I32 }, {}) == FunctionType({}, { ValType::I32 }));
	EXPECT_FALSE((GlobalType{ ValType::I32, true } == GlobalType{ ValType::I32, false }));
	EXPECT_FALSE((MemoryType{ Limits{ 1 } } == MemoryType{ Limits(1, 2) }));
}

TEST(TypesTest, DefTypeKinds) {
	EXPECT_EQ(func().kind(), ItemKind::Function);
	EXPECT_EQ(memory(1).kind(), ItemKind::Memory);
	EXPECT_EQ(global(ValType::F32).kind(), ItemKind::Global);
	EXPECT_EQ(instance().kind(), ItemKind::Instance);
	EXPECT_EQ(module().kind(), ItemKind::Module);
	EXPECT_EQ(DefType{ TableType(ValType::FuncRef, Limits{ 0 }) }.kind(), ItemKind::Table);
}

TEST(TypesTest, InstancePrintingIsIndependentOfInsertionOrder) {
	InstanceType::ExportMap first;
	first.emplace("b", memory(1));
	first.emplace("a", func());

	InstanceType::ExportMap second;
	second.emplace("a", func());
	second.emplace("b", memory(1));

	auto a = instance(std::move(first)).toString();
	auto b = instance(std::move(second)).toString();
	EXPECT_EQ(a, b);
	EXPECT_EQ(a, "(instance (export \"a\" (func)) (export \"b\" (memory 1)))");
}

TEST(TypesTest, ModulePrinting) {
	auto type = module({ { "x", global(ValType::I32, true) } }, { { "y", func({ ValType::I32 }, { ValType::I64 }) } });

	std::ostringstream stream;
	stream << type;
	EXPECT_EQ(stream.str(), "(module (import \"x\" (global (mut i32))) (export \"y\" (func (param i32) (result i64))))");
}

TEST(TypesTest, ModuleExportsAreShared) {
	auto type = ModuleType::make({}, { { "f", func() } });
	auto exports = type->exportsRef();
	EXPECT_EQ(exports.get(), &type->exports());
	EXPECT_TRUE(type->imports().empty());
	EXPECT_EQ(type->exports().sortedNames(), std::vector<std::string>{ "f" });
}
