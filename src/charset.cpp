#include "charset.h"

namespace coupongen{
namespace{

std::array<char,256> build_byte_symbol_table(){
	std::array<char,256> table{};
	for(std::size_t byte=0;byte<table.size();++byte){
		table[byte]=kCharset[byte%kCharsetSize];
	}
	return table;
}

} // namespace

const std::array<char,256>&byte_symbol_table() noexcept{
	static const std::array<char,256> table=build_byte_symbol_table();
	return table;
}

bool is_charset_symbol(char symbol) noexcept{
	return kCharset.find(symbol)!=std::string_view::npos;
}

} // namespace coupongen
