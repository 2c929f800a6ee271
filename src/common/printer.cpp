#include "tessera/common/printer.hpp"

#include <stdio.h>

namespace tessera {

void Printer::RawPrint(OutputStream stream, const string &str) {
	fprintf(stream == OutputStream::STREAM_STDERR ? stderr : stdout, "%s", str.c_str());
}

void Printer::Print(OutputStream stream, const string &str) {
	Printer::RawPrint(stream, str);
	Printer::RawPrint(stream, "\n");
}

void Printer::Flush(OutputStream stream) {
	fflush(stream == OutputStream::STREAM_STDERR ? stderr : stdout);
}

void Printer::Print(const string &str) {
	Printer::Print(OutputStream::STREAM_STDERR, str);
}

} // namespace tessera
