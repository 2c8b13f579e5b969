#pragma once

#include <string>
#include <vector>

#include "types.h"

namespace MODLINK {

	// Structural subtyping between definition types. Instance types are covariant
	// in their exports and ignore superfluous exports of the subtype. Module types
	// are covariant in their exports and contravariant in their imports. All other
	// kinds only match if they are equal.
	class SubtypeChecker {
	public:
		bool isSubtype(const DefType&, const DefType&);
		bool isInstanceSubtype(const InstanceType&, const InstanceType&);
		bool isModuleSubtype(const ModuleType&, const ModuleType&);

		// Describes the first mismatch found by the last failed check
		const std::string& mismatch() const { return mMismatch; }

	private:
		void reset();

		bool matchesType(const DefType&, const DefType&);
		bool matchesEntries(const InstanceType&, const InstanceType&, bool);
		bool matchesModule(const ModuleType&, const ModuleType&);

		bool fail(const std::string&);

		std::vector<std::string> mPath;
		std::string mMismatch;
	};

	bool isSubtype(const DefType&, const DefType&);
	bool checkInstanceSubtype(const InstanceType&, const InstanceType&);
	bool checkModuleSubtype(const ModuleType&, const ModuleType&);

	// Two types are equivalent if each is a subtype of the other, the order of
	// their entries is irrelevant
	bool areEquivalent(const DefType&, const DefType&);
}
