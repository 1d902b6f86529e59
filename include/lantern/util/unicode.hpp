#ifndef LANTERN_UNICODE_HPP
#define LANTERN_UNICODE_HPP

#include "ulight/impl/unicode.hpp"

namespace lantern::utf8 {

using ulight::utf8::Code_Point_View;
using ulight::utf8::decode_and_length_or_replacement;
using ulight::utf8::is_valid;

} // namespace lantern::utf8

#endif
