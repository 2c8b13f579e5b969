#pragma once

#include <functional>
#include <vector>

#include <gtest/gtest.h>

#include "../validator/error.h"
#include "../validator/module_builder.h"
#include "../validator/subtyping.h"
#include "../validator/types.h"
#include "../validator/validator.h"

namespace MODLINK::test {

	inline DefType func(std::vector<ValType> params= {}, std::vector<ValType> results= {}) {
		return FunctionType{ std::move(params), std::move(results) };
	}

	inline DefType memory(u32 min, std::optional<u32> max= {}) {
		return MemoryType{ Limits{ min, max } };
	}

	inline DefType global(ValType type, bool isMutable= false) {
		return GlobalType{ type, isMutable };
	}

	inline DefType instance(InstanceType::ExportMap exports= {}) {
		return InstanceType::make(std::move(exports));
	}

	inline DefType module(InstanceType::ExportMap imports= {}, InstanceType::ExportMap exports= {}) {
		return ModuleType::make(std::move(imports), std::move(exports));
	}

	inline ModuleTypeRef validateModule(const ModuleBuilder& builder, ValidatorOptions options= {}) {
		ModuleValidator validator{ {}, options };
		return validator.validate(*builder.toDefinition());
	}

	// Succeeds if the function throws a validation error of the expected type
	inline ::testing::AssertionResult failsWith(const std::function<void()>& fn, ValidationErrorType expected) {
		try {
			fn();
		}
		catch (const ValidationError& e) {
			if (e.type() == expected) {
				return ::testing::AssertionSuccess();
			}
			return ::testing::AssertionFailure() << "expected " << expected << " but caught " << e;
		}

		return ::testing::AssertionFailure() << "expected " << expected << " but nothing was thrown";
	}

	inline ::testing::AssertionResult failsWith(const ModuleBuilder& builder, ValidationErrorType expected) {
		return failsWith([&]() { validateModule(builder); }, expected);
	}
}
