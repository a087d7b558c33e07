/**
 * Default FigiService: mutex-guarded random engine, one producer thread per stream.
 */

#include "figi/service.hpp"
#include "figi/checksum.hpp"
#include "figi/error.hpp"
#include "figi/logging.hpp"

#include <chrono>
#include <exception>
#include <ios>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <unordered_set>
#include <utility>

namespace figi {

namespace {

std::mt19937_64 seeded_engine(const std::optional<uint64_t>& seed) {
    if (seed) {
        return std::mt19937_64(*seed);
    }
    // Mix clock + random_device to avoid identical sequences on fast repeats.
    std::random_device rd;
    auto now = static_cast<uint32_t>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    std::seed_seq seq{rd(), rd(), rd(), now, now ^ 0x9e3779b9U};
    return std::mt19937_64(seq);
}

// Strip the line terminator left by CRLF input.
inline void chomp_cr(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

class DefaultFigiService final : public FigiService {
public:
    explicit DefaultFigiService(const ServiceOptions& options)
        : buffer_capacity_(options.buffer_capacity)
        , rng_(seeded_engine(options.seed)) {
        FIGI_CHECK_ARGUMENT(buffer_capacity_ > 0, "buffer_capacity must be at least 1");
    }

    Outcome validate(std::string_view symbol) const override {
        return figi::validate(symbol);
    }

    Stream<ValidationResult> validate_stream(std::istream& input, CancellationToken token) override {
        auto channel = std::make_shared<BoundedChannel<ValidationResult>>(buffer_capacity_);

        std::thread producer([this, channel, token, &input]() {
            auto subscription = token.subscribe([channel] { channel->close(); });
            std::size_t produced = 0;
            std::string line;
            std::string read_error;

            try {
                while (!token.is_cancelled() && std::getline(input, line)) {
                    chomp_cr(line);
                    Outcome outcome = validate(line);
                    if (!channel->push(ValidationResult{std::move(line), outcome})) {
                        break;
                    }
                    ++produced;
                }
                if (input.bad()) {
                    read_error = "stream in bad state";
                }
            } catch (const std::ios_base::failure& e) {
                // Streams with exceptions() enabled throw on failbit at end of input.
                if (input.bad() || !input.eof()) {
                    read_error = e.what();
                }
            } catch (const std::exception& e) {
                read_error = e.what();
            }

            if (!read_error.empty()) {
                LOG_WARNING("validate_stream: input read error after " +
                            std::to_string(produced) + " line(s): " + read_error);
            } else if (token.is_cancelled()) {
                LOG_DEBUG("validate_stream: cancelled after " + std::to_string(produced) + " result(s)");
            } else {
                LOG_DEBUG("validate_stream: finished with " + std::to_string(produced) + " result(s)");
            }
            channel->close();
        });

        return Stream<ValidationResult>(std::move(channel), std::move(producer));
    }

    std::vector<std::string> generate(std::size_t n) override {
        std::unordered_set<std::string> generated;
        generated.reserve(n);
        std::vector<std::string> result;
        result.reserve(n);

        while (result.size() < n) {
            std::string candidate = generate_single();
            if (!generated.insert(candidate).second) {
                continue;
            }
            result.push_back(std::move(candidate));
        }

        LOG_DEBUG("generate: produced " + std::to_string(result.size()) + " symbol(s)");
        return result;
    }

    Stream<std::string> generate_stream(std::size_t n, CancellationToken token) override {
        auto channel = std::make_shared<BoundedChannel<std::string>>(buffer_capacity_);

        std::thread producer([this, channel, token, n]() {
            auto subscription = token.subscribe([channel] { channel->close(); });
            std::unordered_set<std::string> generated;

            try {
                while (generated.size() < n && !token.is_cancelled()) {
                    std::string candidate = generate_single();
                    if (!generated.insert(candidate).second) {
                        continue;
                    }
                    if (!channel->push(std::move(candidate))) {
                        break;
                    }
                }
            } catch (const std::exception& e) {
                LOG_ERROR("generate_stream: stopped after " + std::to_string(generated.size()) +
                          " symbol(s): " + e.what());
            }

            if (token.is_cancelled()) {
                LOG_DEBUG("generate_stream: cancelled after " + std::to_string(generated.size()) +
                          " of " + std::to_string(n) + " symbol(s)");
            } else {
                LOG_DEBUG("generate_stream: finished with " + std::to_string(generated.size()) +
                          " symbol(s)");
            }
            channel->close();
        });

        return Stream<std::string>(std::move(channel), std::move(producer));
    }

private:
    // Draw prefix and body under the lock, then append the checksum digit.
    std::string generate_single() {
        std::string symbol;
        symbol.reserve(SYMBOL_LENGTH);
        {
            std::lock_guard<std::mutex> lock(rng_mutex_);
            symbol.append(coin_(rng_) == 0 ? PREFIX_BBG : PREFIX_KKG);
            for (std::size_t i = 0; i < BODY_LENGTH; ++i) {
                symbol.push_back(FIGI_ALPHABET[alphabet_index_(rng_)]);
            }
        }
        symbol.push_back(check_digit(symbol));
        return symbol;
    }

    const std::size_t buffer_capacity_;

    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
    std::uniform_int_distribution<int> coin_{0, 1};
    std::uniform_int_distribution<std::size_t> alphabet_index_{0, FIGI_ALPHABET.size() - 1};
};

} // anonymous namespace

std::unique_ptr<FigiService> FigiService::create(const ServiceOptions& options) {
    return std::make_unique<DefaultFigiService>(options);
}

} // namespace figi
