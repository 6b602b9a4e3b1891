// include/ran/stream.hpp
// Blocking, lazily pulled sequence of inbound messages.

#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <utility>

namespace ran {

// Produced by a connection's produce(). Each next() blocks until a message
// arrives. It returns std::nullopt once the connection has closed gracefully
// and every buffered message was delivered. It throws RanError if the
// connection ended abnormally.
//
// Example:
//   for (const auto& message : connection.produce()) { ... }
template <typename T>
class MessageStream {
public:
    using NextFn = std::function<std::optional<T>()>;

    explicit MessageStream(NextFn next) : next_(std::move(next)) {}

    std::optional<T> next() { return next_(); }

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        iterator() = default;
        explicit iterator(MessageStream* stream) : stream_(stream) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const iterator& other) const { return at_end() == other.at_end(); }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        void advance() {
            current_ = stream_->next();
            if (!current_) stream_ = nullptr;
        }

        bool at_end() const { return stream_ == nullptr; }

        MessageStream* stream_ = nullptr;
        std::optional<T> current_;
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    NextFn next_;
};

} // namespace ran
