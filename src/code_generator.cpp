#include "code_generator.h"

#include "charset.h"

#include<array>
#include<chrono>
#include<cstring>

namespace coupongen{

std::uint64_t entropy_seed(){
	std::random_device rd;
	auto now=static_cast<std::uint64_t>(
		std::chrono::high_resolution_clock::now().time_since_epoch().count());
	std::seed_seq seq{rd(),rd(),rd(),static_cast<unsigned>(now),
					  static_cast<unsigned>(now>>32),
					  static_cast<unsigned>(now)^0x9e3779b9U};
	std::array<std::uint32_t,2> words{};
	seq.generate(words.begin(),words.end());
	return (static_cast<std::uint64_t>(words[0])<<32)|words[1];
}

CodeGenerator::CodeGenerator() : engine_(entropy_seed()){}

CodeGenerator::CodeGenerator(std::uint64_t seed) : engine_(seed){}

void CodeGenerator::fill_bytes(std::uint8_t*out,std::size_t count){
	while(count>=sizeof(std::uint64_t)){
		std::uint64_t word=engine_();
		std::memcpy(out,&word,sizeof(word));
		out+=sizeof(word);
		count-=sizeof(word);
	}
	if(count>0){
		std::uint64_t word=engine_();
		for(std::size_t i=0;i<count;++i){
			out[i]=static_cast<std::uint8_t>(word>>(8*i));
		}
	}
}

std::string CodeGenerator::generate(std::string_view prefix,
									std::size_t suffix_length){
	std::string code;
	code.reserve(prefix.size()+suffix_length);
	code.append(prefix);
	code.resize(prefix.size()+suffix_length);
	if(suffix_length==0){
		return code;
	}

	std::uint8_t local[64];
	const auto&table=byte_symbol_table();
	std::size_t pos=prefix.size();
	std::size_t remaining=suffix_length;
	while(remaining>0){
		std::size_t batch=remaining<sizeof(local)?remaining:sizeof(local);
		fill_bytes(local,batch);
		for(std::size_t i=0;i<batch;++i){
			code[pos++]=table[local[i]];
		}
		remaining-=batch;
	}
	return code;
}

} // namespace coupongen
