#include "figi/report.hpp"
#include "figi/error.hpp"

#include <string_view>

namespace figi {

namespace {

void check_stream(const std::ostream& out, std::size_t written) {
    if (!out) {
        throw IOError("Failed writing output after " + std::to_string(written) + " line(s)",
                      "report", "Check that the output pipe or file is still writable");
    }
}

} // anonymous namespace

std::string format_outcome(Outcome outcome) {
    if (outcome == Outcome::Valid) {
        return "Valid";
    }
    return "Invalid (Reason: " + std::string(outcome_message(outcome)) + ")";
}

std::string format_result(const ValidationResult& result) {
    if (result.is_valid()) {
        return result.input + " is valid";
    }
    return result.input + " is invalid (reason: " + std::string(result.message()) + ")";
}

void write_symbols(const std::vector<std::string>& symbols, std::ostream& out) {
    std::size_t written = 0;
    for (const auto& symbol : symbols) {
        out << symbol << '\n';
        check_stream(out, written);
        ++written;
    }
    out.flush();
    check_stream(out, written);
}

std::size_t write_symbols(Stream<std::string>& stream, std::ostream& out) {
    std::size_t written = 0;
    for (const auto& symbol : stream) {
        out << symbol << '\n' << std::flush;
        check_stream(out, written);
        ++written;
    }
    return written;
}

std::size_t write_results(Stream<ValidationResult>& stream, std::ostream& out) {
    std::size_t written = 0;
    for (const auto& result : stream) {
        out << format_result(result) << '\n' << std::flush;
        check_stream(out, written);
        ++written;
    }
    return written;
}

void write_outcome(Outcome outcome, std::ostream& out) {
    out << format_outcome(outcome) << '\n' << std::flush;
    check_stream(out, 0);
}

} // namespace figi
