#include "charset.h"

#include<gtest/gtest.h>

#include<set>

namespace coupongen{
namespace{

TEST(CharsetTest,HasThirtySixDistinctSymbols){
	EXPECT_EQ(kCharsetSize,36u);
	std::set<char> symbols(kCharset.begin(),kCharset.end());
	EXPECT_EQ(symbols.size(),kCharsetSize);
	EXPECT_EQ(kCharset.front(),'A');
	EXPECT_EQ(kCharset.back(),'9');
}

TEST(CharsetTest,ByteMapsToSymbolModuloCharsetSize){
	EXPECT_EQ(symbol_for_byte(0),'A');
	EXPECT_EQ(symbol_for_byte(25),'Z');
	EXPECT_EQ(symbol_for_byte(26),'0');
	EXPECT_EQ(symbol_for_byte(35),'9');
	EXPECT_EQ(symbol_for_byte(36),'A');
	EXPECT_EQ(symbol_for_byte(255),'D');
}

TEST(CharsetTest,FirstFourSymbolsAreSlightlyOverrepresented){
	std::array<int,256> hits{};
	for(int byte=0;byte<256;++byte){
		++hits[static_cast<unsigned char>(
			symbol_for_byte(static_cast<std::uint8_t>(byte)))];
	}
	for(char symbol : kCharset){
		int expected=(symbol>='A'&&symbol<='D')?8:7;
		EXPECT_EQ(hits[static_cast<unsigned char>(symbol)],expected)
			<<"symbol "<<symbol;
	}
}

TEST(CharsetTest,RecognisesMembers){
	EXPECT_TRUE(is_charset_symbol('Q'));
	EXPECT_TRUE(is_charset_symbol('7'));
	EXPECT_FALSE(is_charset_symbol('a'));
	EXPECT_FALSE(is_charset_symbol(','));
}

} // namespace
} // namespace coupongen
