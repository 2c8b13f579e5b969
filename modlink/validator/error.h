#pragma once

#include <exception>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "enum.h"

namespace MODLINK {

	class Error : public std::exception {
	public:
		Error(std::string m) : message{ std::move(m) } {}
		virtual ~Error() = default;

		virtual const char* what() const noexcept final { return message.c_str(); }
		virtual void print(std::ostream&) const = 0;

	protected:
		std::string message;
	};

	class ValidationError : public Error {
	public:
		ValidationError(std::string mod, ValidationErrorType t, std::string m)
			: Error{ std::move(m) }, modulePath{ std::move(mod) }, errorType{ t } {}

		virtual void print(std::ostream& o) const override;

		const std::string& module() const { return modulePath; }
		ValidationErrorType type() const { return errorType; }

	private:
		std::string modulePath;
		ValidationErrorType errorType;
	};

	class LookupError : public Error {
	public:
		LookupError(std::string item, std::string m)
			: Error{ std::move(m) }, itemName{ std::move(item) } {}

		virtual void print(std::ostream& o) const override;

		const std::string& item() const { return itemName; }

	private:
		std::string itemName;
	};

	// Errors of independently validated modules, reported together
	class AggregateValidationError : public Error {
	public:
		AggregateValidationError(std::vector<ValidationError> e);

		virtual void print(std::ostream& o) const override;

		const std::vector<ValidationError>& errors() const { return mErrors; }

	private:
		std::vector<ValidationError> mErrors;
	};

	std::ostream& operator<<(std::ostream&, const Error&);
}
