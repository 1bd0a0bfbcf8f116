#ifndef SIZE_PARSER_HPP
#define SIZE_PARSER_HPP

#include <cstdint>
#include <string>

namespace GzSplit {

// Parses a byte count with an optional K, M or G suffix (powers of 1024).
// Throws std::invalid_argument on malformed input and std::out_of_range
// when the value does not fit in 64 bits.
uint64_t parseSize(const std::string& text);

} // namespace GzSplit

#endif // SIZE_PARSER_HPP
