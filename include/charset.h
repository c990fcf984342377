#pragma once

#include<array>
#include<cstddef>
#include<cstdint>
#include<string_view>

namespace coupongen{

// Symbols a generated code may contain, in lookup order.
inline constexpr std::string_view kCharset="ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
inline constexpr std::size_t kCharsetSize=kCharset.size();

// Maps every byte value to kCharset[byte % kCharsetSize]. Since 256 is not a
// multiple of 36 the first four symbols ('A'..'D') are drawn with
// probability 8/256 and the others with 7/256.
const std::array<char,256>&byte_symbol_table() noexcept;

inline char symbol_for_byte(std::uint8_t byte) noexcept{
	return byte_symbol_table()[byte];
}

bool is_charset_symbol(char symbol) noexcept;

} // namespace coupongen
