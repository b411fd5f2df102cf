#pragma once

#include <cstddef>
#include <iterator>

#include "backtest/errors.hpp"

/**
 * @brief Read-only trailing window over a contiguous sequence.
 *
 * The view stores only [first, last) of the underlying storage; elements past
 * `last` are not reachable through it. Indexing and iterator dereference are
 * bounds-checked against the view. The engine builds every lookback handed to
 * strategy code this way, ending at the simulation cursor.
 */
template <typename T>
class LookbackView {
   public:
    using value_type = T;

    /**
     * @brief Forward iterator that resolves every dereference through at().
     */
    class const_iterator {
       public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = T;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const T*;
        using reference         = const T&;

        const_iterator() = default;

        const_iterator(const LookbackView* view, std::size_t index)
            : view_(view)
            , index_(index) {}

        reference operator*() const {
            if (view_ == nullptr) {
                throw IndexOutOfRange(index_, 0);
            }
            return view_->at(index_);
        }
        pointer operator->() const { return &**this; }

        const_iterator& operator++() {
            ++index_;
            return *this;
        }
        const_iterator operator++(int) {
            const_iterator prev = *this;
            ++index_;
            return prev;
        }

        bool operator==(const const_iterator& other) const { return view_ == other.view_ && index_ == other.index_; }
        bool operator!=(const const_iterator& other) const { return !(*this == other); }

       private:
        const LookbackView* view_  = nullptr;
        std::size_t         index_ = 0;
    };

    LookbackView() = default;

    LookbackView(const T* first, std::size_t count)
        : data_(first)
        , size_(count) {}

    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] bool        empty() const noexcept { return size_ == 0; }

    [[nodiscard]] const_iterator begin() const noexcept { return const_iterator(this, 0); }
    [[nodiscard]] const_iterator end() const noexcept { return const_iterator(this, size_); }

    /**
     * @throws IndexOutOfRange if `i` is past the most recent element.
     */
    [[nodiscard]] const T& operator[](std::size_t i) const { return at(i); }

    [[nodiscard]] const T& at(std::size_t i) const {
        if (i >= size_) {
            throw IndexOutOfRange(i, size_);
        }
        return data_[i];
    }

    [[nodiscard]] const T& front() const { return at(0); }

    [[nodiscard]] const T& back() const {
        if (size_ == 0) {
            throw IndexOutOfRange(0, 0);
        }
        return data_[size_ - 1];
    }

    /**
     * @brief Element `n` steps before the most recent one (0 = latest).
     */
    [[nodiscard]] const T& ago(std::size_t n) const {
        if (n >= size_) {
            throw IndexOutOfRange(n, size_);
        }
        return data_[size_ - 1 - n];
    }

   private:
    const T*    data_ = nullptr;
    std::size_t size_ = 0;
};
