#ifndef LANTERN_ANNOTATION_SPAN_HPP
#define LANTERN_ANNOTATION_SPAN_HPP

#include <cstddef>

#include "lantern/fwd.hpp"

namespace lantern {

template <typename T>
struct Annotation_Span {
    std::size_t begin;
    std::size_t length;
    T value;

    [[nodiscard]]
    constexpr std::size_t end() const
    {
        return begin + length;
    }
};

} // namespace lantern

#endif
