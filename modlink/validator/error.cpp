#include <ostream>

#include "error.h"

using namespace MODLINK;

std::ostream& MODLINK::operator<<(std::ostream& out, const Error& e)
{
	e.print(out);
	return out;
}

void ValidationError::print(std::ostream& o) const
{
	o << "Validation error (" << errorType.name() << ") in '";
	if (modulePath.size() <= 40) {
		o << modulePath << "'";
	}
	else {
		o << "..." << modulePath.substr(modulePath.size() - 37) << "'";
	}

	o << ": " << message;
}

void LookupError::print(std::ostream& o) const
{
	o << "Lookup error for '" << itemName << "': " << message;
}

AggregateValidationError::AggregateValidationError(std::vector<ValidationError> e)
	: Error{ std::to_string(e.size()) + " module(s) failed validation" }, mErrors{ std::move(e) } {}

void AggregateValidationError::print(std::ostream& o) const
{
	o << message;
	for (auto& error : mErrors) {
		o << "\n  - " << error;
	}
}
