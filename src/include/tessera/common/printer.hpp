//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/common/printer.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/constants.hpp"

namespace tessera {

enum class OutputStream : uint8_t { STREAM_STDOUT = 1, STREAM_STDERR = 2 };

//! Printer is a static class that allows printing to logs or stdout/stderr
class Printer {
public:
	//! Print the object to the stream
	static void Print(OutputStream stream, const string &str);
	//! Print the object to stderr
	static void Print(const string &str);
	//! Directly prints the string to stdout without a newline
	static void RawPrint(OutputStream stream, const string &str);
	//! Flush an output stream
	static void Flush(OutputStream stream);
};

} // namespace tessera
