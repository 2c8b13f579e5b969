#pragma once

#include "definitions.h"
#include "nullable.h"

namespace MODLINK {

	// Resolves alias definitions and declares the aliased item into the index
	// space of the current scope
	class AliasResolver {
	public:
		AliasResolver(Scope& s, Nullable<Introspector> i= {})
			: scope{ s }, introspector{ i } {}

		u32 resolveInstanceExport(const InstanceExportAlias&);
		u32 resolveOuter(const OuterAlias&);

	private:
		Scope& scope;
		Nullable<Introspector> introspector;
	};
}
