/**
 * Lazy, pull-based sequence fed by a background producer thread.
 *
 * A Stream owns both ends of the hand-off: the channel it pulls from and the
 * thread that fills it. It is single-pass and not restartable. Dropping a
 * stream before it is exhausted closes the channel, which makes the producer
 * stop at its next push, and then joins the producer.
 */

#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

#include "figi/util/bounded_channel.hpp"

namespace figi {

template<typename T>
class Stream {
public:
    using value_type = T;

    Stream(std::shared_ptr<BoundedChannel<T>> channel, std::thread producer)
        : channel_(std::move(channel)), producer_(std::move(producer)) {}

    Stream(Stream&& other) noexcept = default;
    Stream& operator=(Stream&&) = delete;
    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;

    ~Stream() {
        if (channel_) channel_->close();
        if (producer_.joinable()) producer_.join();
    }

    // Next value, or std::nullopt once the producer is done and the buffer drained.
    std::optional<T> next() {
        if (!channel_) return std::nullopt;
        return channel_->pop();
    }

    // Drain the remaining values.
    std::vector<T> collect() {
        std::vector<T> out;
        while (auto value = next()) {
            out.push_back(std::move(*value));
        }
        return out;
    }

    std::size_t capacity() const noexcept { return channel_ ? channel_->capacity() : 0; }

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = T*;
        using reference = T&;

        iterator() = default;
        explicit iterator(Stream* stream) : stream_(stream) { advance(); }

        reference operator*() { return *current_; }
        pointer operator->() { return &*current_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const iterator& other) const { return stream_ == other.stream_; }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        void advance() {
            current_ = stream_->next();
            if (!current_) stream_ = nullptr;
        }

        Stream* stream_ = nullptr;
        std::optional<T> current_;
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    std::shared_ptr<BoundedChannel<T>> channel_;
    std::thread producer_;
};

} // namespace figi
