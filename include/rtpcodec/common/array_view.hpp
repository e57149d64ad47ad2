#ifndef _RTPCODEC_COMMON_ARRAY_VIEW_H_
#define _RTPCODEC_COMMON_ARRAY_VIEW_H_

#include "rtpcodec/base/defines.hpp"

#include <algorithm>
#include <type_traits>

namespace rtpcodec {

// Non-owning view over a contiguous range. The viewed memory MUST
// outlive the view.
template <typename T>
class ArrayView {
public:
    using value_type = T;
    using const_iterator = const T*;

    ArrayView(T* ptr, size_t size) noexcept : ptr_(ptr), size_(size) {}
    ArrayView() noexcept : ArrayView(nullptr, 0) {}

    template <typename U, size_t N>
    ArrayView(U (&buffer)[N]) noexcept : ArrayView(buffer, N) {}

    // Containers with data() and size(), e.g. std::vector or another ArrayView.
    template <
        typename U,
        typename std::enable_if<
            std::is_convertible<decltype(std::declval<const U&>().data()), T*>::value &&
            std::is_convertible<decltype(std::declval<const U&>().size()), std::size_t>::value
        >::type* = nullptr
    >
    ArrayView(const U& u) noexcept : ArrayView(u.data(), u.size()) {}

    const T& operator[](size_t i) const noexcept { return ptr_[i]; }
    T* data() const noexcept { return ptr_; }
    size_t size() const noexcept { return size_; }
    bool empty() const noexcept { return size_ == 0; }

    T* begin() const noexcept { return ptr_; }
    T* end() const noexcept { return ptr_ + size_; }

    ArrayView<T> subview(size_t offset, size_t size) const noexcept {
        return offset < size_ ? ArrayView<T>(ptr_ + offset, std::min(size, size_ - offset))
                              : ArrayView<T>(nullptr, 0);
    }

    ArrayView<T> subview(size_t offset) const noexcept {
        return subview(offset, size_);
    }

private:
    T* ptr_;
    size_t size_;
};

} // namespace rtpcodec

#endif
