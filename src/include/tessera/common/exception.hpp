//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/common/exception.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/constants.hpp"
#include "tessera/common/exception_format_value.hpp"

#include <stdexcept>

namespace tessera {

class LogicalType;

//===--------------------------------------------------------------------===//
// Exception Types
//===--------------------------------------------------------------------===//

enum class ExceptionType : uint8_t {
	INVALID = 0,          // invalid type
	OUT_OF_RANGE = 1,     // value out of range error
	CONVERSION = 2,       // conversion/casting error
	UNKNOWN_TYPE = 3,     // unknown type
	SERIALIZATION = 4,    // serialization
	NOT_IMPLEMENTED = 5,  // method not implemented
	RESOLUTION = 6,       // function resolution
	INTERNAL = 7,         // Internal exception: exception that indicates something went wrong internally (i.e. bug)
	INVALID_INPUT = 8,    // Input or arguments error
	INVALID_CONFIGURATION // An invalid configuration was detected (e.g. a setting mismatch)
};

class Exception : public std::runtime_error {
public:
	Exception(ExceptionType exception_type, const string &message);

	ExceptionType type;

public:
	const char *what() const noexcept override;
	const string &RawMessage() const {
		return raw_message;
	}

	static string ExceptionTypeToString(ExceptionType type);
	static ExceptionType StringToExceptionType(const string &type);
	static bool UncaughtException();

	template <typename... ARGS>
	static string ConstructMessage(const string &msg, ARGS... params) {
		std::vector<ExceptionFormatValue> values;
		return ConstructMessageRecursive(msg, values, params...);
	}

	static string ConstructMessageRecursive(const string &msg, std::vector<ExceptionFormatValue> &values);

	template <class T, typename... ARGS>
	static string ConstructMessageRecursive(const string &msg, std::vector<ExceptionFormatValue> &values, T param,
	                                        ARGS... params) {
		values.push_back(ExceptionFormatValue::CreateFormatValue<T>(param));
		return ConstructMessageRecursive(msg, values, params...);
	}

private:
	string exception_message;
	string raw_message;
};

//===--------------------------------------------------------------------===//
// Exception derived classes
//===--------------------------------------------------------------------===//

class ConversionException : public Exception {
public:
	explicit ConversionException(const string &msg);
	ConversionException(const LogicalType &orig_type, const LogicalType &new_type);

	template <typename... ARGS>
	explicit ConversionException(const string &msg, ARGS... params)
	    : ConversionException(ConstructMessage(msg, params...)) {
	}
};

class SerializationException : public Exception {
public:
	explicit SerializationException(const string &msg);

	template <typename... ARGS>
	explicit SerializationException(const string &msg, ARGS... params)
	    : SerializationException(ConstructMessage(msg, params...)) {
	}
};

class ResolutionException : public Exception {
public:
	explicit ResolutionException(const string &msg);

	template <typename... ARGS>
	explicit ResolutionException(const string &msg, ARGS... params)
	    : ResolutionException(ConstructMessage(msg, params...)) {
	}
};

class OutOfRangeException : public Exception {
public:
	explicit OutOfRangeException(const string &msg);

	template <typename... ARGS>
	explicit OutOfRangeException(const string &msg, ARGS... params)
	    : OutOfRangeException(ConstructMessage(msg, params...)) {
	}
};

class NotImplementedException : public Exception {
public:
	explicit NotImplementedException(const string &msg);

	template <typename... ARGS>
	explicit NotImplementedException(const string &msg, ARGS... params)
	    : NotImplementedException(ConstructMessage(msg, params...)) {
	}
};

class InternalException : public Exception {
public:
	explicit InternalException(const string &msg);

	template <typename... ARGS>
	explicit InternalException(const string &msg, ARGS... params)
	    : InternalException(ConstructMessage(msg, params...)) {
	}
};

class InvalidInputException : public Exception {
public:
	explicit InvalidInputException(const string &msg);

	template <typename... ARGS>
	explicit InvalidInputException(const string &msg, ARGS... params)
	    : InvalidInputException(ConstructMessage(msg, params...)) {
	}
};

class InvalidConfigurationException : public Exception {
public:
	explicit InvalidConfigurationException(const string &msg);

	template <typename... ARGS>
	explicit InvalidConfigurationException(const string &msg, ARGS... params)
	    : InvalidConfigurationException(ConstructMessage(msg, params...)) {
	}
};

} // namespace tessera

#ifdef NDEBUG
#define D_ASSERT(condition) ((void)0)
#else
#define D_ASSERT(condition)                                                                                            \
	do {                                                                                                               \
		if (!(condition)) {                                                                                            \
			throw ::tessera::InternalException("Assertion triggered in file \"%s\" on line %d: %s", __FILE__,         \
			                                   __LINE__, #condition);                                                 \
		}                                                                                                              \
	} while (0)
#endif
