#pragma once
/**
 * Text output of the figi command-line tool
 *
 * Streamed output is flushed line by line so a consumer reading from a pipe
 * sees each symbol or result as soon as it is produced. Every writer throws
 * IOError once the output stream fails.
 */

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "figi/stream.hpp"
#include "figi/types.hpp"

namespace figi {

// "Valid" or "Invalid (Reason: <message>)"
std::string format_outcome(Outcome outcome);

// "<input> is valid" or "<input> is invalid (reason: <message>)"
std::string format_result(const ValidationResult& result);

// One symbol per line, flushed once at the end.
void write_symbols(const std::vector<std::string>& symbols, std::ostream& out);

// One symbol per line, flushed after each. Returns the number written.
std::size_t write_symbols(Stream<std::string>& stream, std::ostream& out);

// One formatted result per line, flushed after each. Returns the number written.
std::size_t write_results(Stream<ValidationResult>& stream, std::ostream& out);

void write_outcome(Outcome outcome, std::ostream& out);

} // namespace figi
