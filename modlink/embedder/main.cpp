#include <iostream>
#include <string_view>

#include "../validator/linker.h"
#include "../validator/introspection.h"
#include "../validator/module_builder.h"
#include "../validator/error.h"

namespace {
	using MODLINK::TypeExpression, MODLINK::ItemReference, MODLINK::ItemKind, MODLINK::ValType;

	// Shape of the libc instance the application was written against
	TypeExpression libcImportType() {
		return TypeExpression::instance({
			{ "memory", TypeExpression::memory(1) },
			{ "malloc", TypeExpression::function({ ValType::I32 }, { ValType::I32 }) }
		});
	}

	std::shared_ptr<const MODLINK::ModuleDefinition> buildApplication() {
		// Nested adapter that only needs malloc from whatever libc it is given
		MODLINK::ModuleBuilder allocator{ "allocator" };
		allocator
			.importItem("libc", TypeExpression::instance({
				{ "malloc", TypeExpression::function({ ValType::I32 }, { ValType::I32 }) }
			}))
			.aliasExport(0, "malloc", ItemKind::Function)
			.exportItem("alloc", ItemReference::function(0));

		MODLINK::ModuleBuilder app{ "app" };
		app
			.importItem("libc-1.0.0", libcImportType())
			.defineModule(allocator)
			.instantiate(0, { { "libc", ItemReference::instance(0) } })
			.aliasExport(1, "alloc", ItemKind::Function)
			.aliasExport(0, "memory", ItemKind::Memory)
			.exportItem("alloc", ItemReference::function(0))
			.exportItem("memory", ItemReference::memory(0));

		return app.toDefinition();
	}

	std::shared_ptr<const MODLINK::ModuleDefinition> buildBrokenModule() {
		MODLINK::ModuleBuilder broken{ "broken" };
		broken
			.importItem("log", TypeExpression::function({ ValType::I32 }))
			.exportItem("log", ItemReference::function(0))
			.exportItem("missing", ItemReference::function(1));

		return broken.toDefinition();
	}
}

int main(int argc, char** argv) {
	MODLINK::LinkerOptions options;
	bool quiet = false;

	for (int i = 1; i < argc; i++) {
		std::string_view arg{ argv[i] };
		if (arg == "--quiet") {
			quiet = true;
		}
		else if (arg == "--sequential") {
			options.parallelValidation = false;
		}
		else {
			std::cerr << "Unknown argument '" << arg << "'\nUsage: " << argv[0] << " [--quiet] [--sequential]" << std::endl;
			return 1;
		}
	}

	try {
		MODLINK::Linker linker{ options };

		if (!quiet) {
			auto logger = std::make_unique<MODLINK::ConsoleLogger>( std::cout );
			linker.attachIntrospector(std::move(logger));
		}

		MODLINK::HostInstanceBuilder libc110{ "libc-1.1.0" };
		libc110
			.defineMemory("memory", 1)
			.defineFunction("malloc", { ValType::I32 }, { ValType::I32 })
			.defineFunction("free", { ValType::I32 });

		MODLINK::HostInstanceBuilder libc090{ "libc-0.9.0" };
		libc090
			.defineMemory("memory", 1)
			.defineFunction("free", { ValType::I32 });

		auto application = buildApplication();
		if (!quiet) {
			application->print(std::cout);
			std::cout << std::endl;
		}

		linker.registerHostInstance(libc110);
		linker.registerHostInstance(libc090);
		linker.registerModule(application);
		linker.registerModule(buildBrokenModule());

		try {
			linker.validateModules();
		}
		catch (MODLINK::AggregateValidationError& e) {
			std::cerr << "Some modules are invalid: " << e << std::endl;
		}

		// A newer libc with an additional export can stand in for the one imported
		MODLINK::ImportObject newer;
		newer.add("libc-1.0.0", linker.hostInstanceByName("libc-1.1.0"));
		auto instance = linker.instantiate("app", newer);
		std::cout << "Instantiated 'app' with libc-1.1.0: " << *instance << std::endl;

		// An older libc lacks malloc
		try {
			MODLINK::ImportObject older;
			older.add("libc-1.0.0", linker.hostInstanceByName("libc-0.9.0"));
			linker.instantiate("app", older);
		}
		catch (MODLINK::ValidationError& e) {
			std::cerr << "Rejected libc-0.9.0: " << e << std::endl;
		}
	}
	catch (MODLINK::Error& e) {
		std::cerr << "\n\n========================================\n" << std::endl;
		std::cerr << "Caught modlink error: " << e << std::endl;
		return 1;
	}
	catch (std::exception& e) {
		std::cerr << "\n\n========================================\n" << std::endl;
		std::cerr << "Caught generic error: " << e.what() << std::endl;
		return 1;
	}
}
