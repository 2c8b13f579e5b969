#pragma once

#include <cassert>
#include <ostream>

#include "util.h"

namespace MODLINK {
	template<typename TSpecial, typename TStorage= u32>
	class Enum {
	public:
		using TEnumStorage = TStorage;

		template<typename T>
		static TSpecial fromInt(T x) {
			static_assert(TSpecial::TEnum::NumberOfItems < ((TStorage)~0));
			assert(x < TSpecial::TEnum::NumberOfItems);
			return TSpecial{ (TStorage)x };
		}

		explicit Enum(TStorage v) : value{ v } {}
		operator int() const { return value; }

	protected:
		TStorage value;
	};

	class ValType : public Enum<ValType, u8> {
	public:
		enum TEnum {
			I32 = 0x7F,
			I64 = 0x7E,
			F32 = 0x7D,
			F64 = 0x7C,
			V128 = 0x7B,
			FuncRef = 0x70,
			ExternRef = 0x6F,
			NumberOfItems = 0x80
		};

		using Enum<ValType, u8>::Enum;
		ValType(TEnum e) : Enum<ValType, u8>{ e } {}

		bool isNumber() const;
		bool isVector() const;
		bool isReference() const;
		bool isValid() const;
		const char* name() const;
	};

	// Kinds of index spaces in a module scope. All kinds except 'Type' are
	// kinds of importable and exportable definitions.
	class ItemKind : public Enum<ItemKind> {
	public:
		enum TEnum {
			Function = 0,
			Table = 1,
			Memory = 2,
			Global = 3,
			Instance = 4,
			Module = 5,
			Type = 6,
			NumberOfItems
		};

		using Enum<ItemKind>::Enum;
		ItemKind(TEnum e) : Enum<ItemKind>{ e } {}

		bool isDefinitionKind() const { return value != Type; }
		bool isOuterAliasable() const { return value == Module || value == Type; }
		const char* name() const;
	};

	class ValidationErrorType : public Enum<ValidationErrorType> {
	public:
		enum TEnum {
			DuplicateName,
			UnboundIndex,
			UnboundExport,
			KindMismatch,
			SubtypeError,
			MissingImport,
			DuplicateArgName,
			AliasDepthError,
			InvalidType,
			NestingTooDeep,
			NumberOfItems
		};

		using Enum<ValidationErrorType>::Enum;
		ValidationErrorType(TEnum e) : Enum<ValidationErrorType>{ e } {}

		const char* name() const;
	};

	class ScopeState : public Enum<ScopeState> {
	public:
		enum TEnum {
			Empty,
			Accumulating,
			Frozen,
			Failed,
			NumberOfItems
		};

		using Enum<ScopeState>::Enum;
		ScopeState(TEnum e) : Enum<ScopeState>{ e } {}

		bool isTerminal() const { return value == Frozen || value == Failed; }
		const char* name() const;
	};

	std::ostream& operator<<(std::ostream&, ValType);
	std::ostream& operator<<(std::ostream&, ItemKind);
	std::ostream& operator<<(std::ostream&, ValidationErrorType);
	std::ostream& operator<<(std::ostream&, ScopeState);
}
