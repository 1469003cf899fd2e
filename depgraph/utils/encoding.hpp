#ifndef DEPGRAPH_UTILS_ENCODING_HPP
#define DEPGRAPH_UTILS_ENCODING_HPP

#pragma once

#include <string>
#include <string_view>

namespace depgraph::utils {

// Strict UTF-8 check: rejects overlong forms, surrogates and code points
// above U+10FFFF.
bool is_valid_utf8(std::string_view bytes);

// Every byte maps to the code point of the same value.
std::string latin1_to_utf8(std::string_view bytes);

bool has_utf8_bom(std::string_view bytes);

} // namespace depgraph::utils

#endif // DEPGRAPH_UTILS_ENCODING_HPP
