// =============================================================================
// Validation Pipeline Tests
// =============================================================================

#include <gtest/gtest.h>
#include "figi/service.hpp"

#include <ios>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <utility>
#include <vector>

using namespace figi;

namespace {

// Serves `data`, then fails the next read like a broken device.
class FailingStreamBuf : public std::streambuf {
public:
    explicit FailingStreamBuf(std::string data) : data_(std::move(data)) {
        setg(data_.data(), data_.data(), data_.data() + data_.size());
    }

protected:
    int_type underflow() override {
        throw std::runtime_error("simulated device error");
    }

private:
    std::string data_;
};

} // anonymous namespace

class ValidationTest : public ::testing::Test {
protected:
    void SetUp() override {
        service_ = FigiService::create();
    }

    static std::string join_lines(const std::vector<std::string>& lines) {
        std::string out;
        for (const auto& line : lines) {
            out += line;
            out += '\n';
        }
        return out;
    }

    std::unique_ptr<FigiService> service_;
};

TEST_F(ValidationTest, ValidSymbols) {
    EXPECT_EQ(service_->validate("BBG00HLH6Y37"), Outcome::Valid);
    EXPECT_EQ(service_->validate("BBG003B5WQD2"), Outcome::Valid);
    EXPECT_EQ(service_->validate("KKG012C5GMZ5"), Outcome::Valid);
}

TEST_F(ValidationTest, PatternMismatch) {
    EXPECT_EQ(service_->validate("BKG00HLH6Y37"), Outcome::PatternMismatch);
    EXPECT_EQ(service_->validate("BBG00HLH6E37"), Outcome::PatternMismatch);
    EXPECT_EQ(service_->validate(""), Outcome::PatternMismatch);
}

TEST_F(ValidationTest, ChecksumMismatch) {
    EXPECT_EQ(service_->validate("BBG0088JSC34"), Outcome::InvalidChecksum);
}

TEST_F(ValidationTest, StreamValidSymbols) {
    std::istringstream input(join_lines({
        "BBG00HLH6Y37", "BBG003B5WQD2", "KKG012C5GMZ5", "KKGZ4DN12VK9",
        "BBGCL1YJ6128", "KKGF272KF1V9", "BBGZ7NNLZ1L9", "KKG171KW49F5",
    }));

    auto stream = service_->validate_stream(input);
    size_t count = 0;
    for (const auto& result : stream) {
        EXPECT_TRUE(result.is_valid()) << result.input << ": " << result.message();
        ++count;
    }
    EXPECT_EQ(count, 8u);
}

TEST_F(ValidationTest, StreamInvalidChecksums) {
    std::istringstream input(join_lines({
        "BBG0088JSC34", "BBG01J952TC0", "KKG019FZ8N78", "KKGZ4DN12VK0", "BBGCL1YJ6129",
    }));

    auto stream = service_->validate_stream(input);
    for (const auto& result : stream) {
        EXPECT_EQ(result.outcome, Outcome::InvalidChecksum) << result.input;
        EXPECT_EQ(result.message(), "invalid checksum");
    }
}

// Results come back in input order, one per line, with malformed lines reported
// rather than aborting the stream
TEST_F(ValidationTest, StreamMixedInputPreservesOrder) {
    const std::vector<std::string> lines = {
        "BBG00HLH6Y37", "not a symbol", "", "BBG0088JSC34", "BBG00HLH6E37", "KKG012C5GMZ5",
    };
    const std::vector<Outcome> expected = {
        Outcome::Valid, Outcome::PatternMismatch, Outcome::PatternMismatch,
        Outcome::InvalidChecksum, Outcome::PatternMismatch, Outcome::Valid,
    };

    std::istringstream input(join_lines(lines));
    auto results = service_->validate_stream(input).collect();

    ASSERT_EQ(results.size(), lines.size());
    for (size_t i = 0; i < lines.size(); ++i) {
        EXPECT_EQ(results[i].input, lines[i]);
        EXPECT_EQ(results[i].outcome, expected[i]) << lines[i];
    }
}

TEST_F(ValidationTest, StreamStripsCarriageReturns) {
    std::istringstream input("BBG00HLH6Y37\r\nKKG012C5GMZ5\r\n");
    auto results = service_->validate_stream(input).collect();

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].input, "BBG00HLH6Y37");
    EXPECT_TRUE(results[0].is_valid());
    EXPECT_TRUE(results[1].is_valid());
}

TEST_F(ValidationTest, StreamLastLineWithoutNewline) {
    std::istringstream input("BBG00HLH6Y37\nKKG012C5GMZ5");
    auto results = service_->validate_stream(input).collect();

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[1].input, "KKG012C5GMZ5");
}

TEST_F(ValidationTest, StreamEmptyInput) {
    std::istringstream input("");
    auto stream = service_->validate_stream(input);
    EXPECT_FALSE(stream.next().has_value());
    // Exhausted streams stay exhausted
    EXPECT_FALSE(stream.next().has_value());
}

// More lines than the buffer holds: the producer must block and resume, not drop
TEST_F(ValidationTest, StreamLargerThanBuffer) {
    ServiceOptions options;
    options.buffer_capacity = 4;
    auto service = FigiService::create(options);

    std::vector<std::string> lines;
    for (int i = 0; i < 500; ++i) {
        lines.push_back(i % 2 == 0 ? "BBG00HLH6Y37" : "BBG0088JSC34");
    }
    std::istringstream input(join_lines(lines));

    auto stream = service->validate_stream(input);
    EXPECT_EQ(stream.capacity(), 4u);

    size_t i = 0;
    while (auto result = stream.next()) {
        EXPECT_EQ(result->outcome, i % 2 == 0 ? Outcome::Valid : Outcome::InvalidChecksum);
        ++i;
    }
    EXPECT_EQ(i, lines.size());
}

// Abandoning a stream half-way must not hang on the blocked producer
TEST_F(ValidationTest, DroppingStreamEarlyJoinsProducer) {
    ServiceOptions options;
    options.buffer_capacity = 2;
    auto service = FigiService::create(options);

    std::string text;
    for (int i = 0; i < 1000; ++i) text += "BBG00HLH6Y37\n";
    std::istringstream input(text);

    {
        auto stream = service->validate_stream(input);
        ASSERT_TRUE(stream.next().has_value());
    }
    SUCCEED();
}

TEST_F(ValidationTest, StreamWithExceptionsEnabledEndsCleanly) {
    std::istringstream input("BBG00HLH6Y37\nKKG012C5GMZ5\n");
    input.exceptions(std::ios_base::failbit | std::ios_base::badbit);

    auto results = service_->validate_stream(input).collect();

    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].is_valid());
    EXPECT_TRUE(results[1].is_valid());
}

// A read error ends the stream; lines read before it are still reported
TEST_F(ValidationTest, StreamReadErrorKeepsEarlierResults) {
    FailingStreamBuf buffer("BBG00HLH6Y37\nBBG0088JSC34\n");
    std::istream input(&buffer);

    auto results = service_->validate_stream(input).collect();

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].outcome, Outcome::Valid);
    EXPECT_EQ(results[1].outcome, Outcome::InvalidChecksum);
    EXPECT_TRUE(input.bad());
}

TEST_F(ValidationTest, StreamReadErrorWithExceptionsEnabled) {
    FailingStreamBuf buffer("KKG012C5GMZ5\n");
    std::istream input(&buffer);
    input.exceptions(std::ios_base::failbit | std::ios_base::badbit);

    auto results = service_->validate_stream(input).collect();

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].input, "KKG012C5GMZ5");
    EXPECT_TRUE(results[0].is_valid());
}
