#ifndef LANTERN_FUNCTION_REF_HPP
#define LANTERN_FUNCTION_REF_HPP

#include "ulight/function_ref.hpp"

namespace lantern {

template <typename F>
using Function_Ref = ulight::Function_Ref<F>;

} // namespace lantern

#endif
