#include "code_stream.h"

namespace coupongen{

const char*stream_state_name(StreamState state) noexcept{
	switch(state){
	case StreamState::Pending:
		return "pending";
	case StreamState::Emitting:
		return "emitting";
	case StreamState::Exhausted:
		return "exhausted";
	}
	return "pending";
}

CodeStream::CodeStream(const GenerationRequest&request,
					   std::optional<std::uint64_t> seed)
	: validated_(validate(request)),tickets_(request.required_count),
	  registry_(request.required_count),
	  generator_(seed?*seed:entropy_seed()){}

std::optional<std::string> CodeStream::next(){
	if(state_==StreamState::Exhausted){
		return std::nullopt;
	}
	state_=StreamState::Emitting;

	if(!tickets_.claim_next()){
		state_=StreamState::Exhausted;
		return std::nullopt;
	}

	const std::string&prefix=validated_.request.prefix;
	for(;;){
		++attempts_;
		std::string candidate=
			generator_.generate(prefix,validated_.suffix_length);
		if(registry_.try_accept(candidate)){
			++produced_;
			return candidate;
		}
	}
}

CodeStream generate_stream(std::size_t total_length,
						   std::uint64_t required_count,
						   std::string_view prefix,
						   std::optional<std::uint64_t> seed){
	GenerationRequest request;
	request.total_length=total_length;
	request.prefix=std::string(prefix);
	request.required_count=required_count;
	return CodeStream(request,seed);
}

} // namespace coupongen
