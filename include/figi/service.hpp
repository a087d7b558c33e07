#pragma once
/**
 * OpenFIGI validation and generation service
 *
 * Validation and generation each come in two shapes: a synchronous call that
 * returns everything, and a streaming call that returns a Stream fed by a
 * dedicated producer thread through a bounded channel.
 *
 * Lifetimes: a Stream returned by this service must not outlive the service,
 * and the std::istream handed to validate_stream must outlive the Stream.
 */

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "figi/stream.hpp"
#include "figi/types.hpp"
#include "figi/util/threading.hpp"

namespace figi {

struct ServiceOptions {
    std::size_t buffer_capacity = DEFAULT_BUFFER_CAPACITY;
    // Fixed seed for reproducible generation; random seeding when empty.
    std::optional<uint64_t> seed;
};

class FigiService {
public:
    virtual ~FigiService() = default;

    // Determine whether a string is a valid OpenFIGI symbol. Never throws.
    virtual Outcome validate(std::string_view symbol) const = 0;

    // Validate every line of `input` in the background.
    virtual Stream<ValidationResult> validate_stream(std::istream& input,
                                                     CancellationToken token = {}) = 0;

    // Generate n unique symbols and return them all at once.
    // Prefer generate_stream for large n.
    virtual std::vector<std::string> generate(std::size_t n) = 0;

    // Generate n unique symbols, each delivered as soon as it is accepted.
    virtual Stream<std::string> generate_stream(std::size_t n,
                                                CancellationToken token = {}) = 0;

    static std::unique_ptr<FigiService> create(const ServiceOptions& options = {});
};

} // namespace figi
