#include "capacity.h"

#include "charset.h"
#include "error.h"

#include<limits>

namespace coupongen{

std::uint64_t combinatorial_space(std::size_t suffix_length) noexcept{
	constexpr std::uint64_t max_value=std::numeric_limits<std::uint64_t>::max();
	const std::uint64_t base=static_cast<std::uint64_t>(kCharsetSize);
	std::uint64_t space=1;
	for(std::size_t i=0;i<suffix_length;++i){
		if(space>max_value/base){
			return max_value;
		}
		space*=base;
	}
	return space;
}

ValidatedRequest validate(const GenerationRequest&request){
	if(request.prefix.size()>request.total_length){
		throw GenerationError(
			GenerationErrorKind::InitialsTooLong,
			"Initials length ("+std::to_string(request.prefix.size())+
				") cannot be greater than the total coupon length ("+
				std::to_string(request.total_length)+")");
	}

	ValidatedRequest validated;
	validated.request=request;
	validated.suffix_length=request.total_length-request.prefix.size();
	validated.combinatorial_space=combinatorial_space(validated.suffix_length);

	if(request.required_count>validated.combinatorial_space){
		throw GenerationError(
			GenerationErrorKind::TooManyRequested,
			"Cannot generate "+std::to_string(request.required_count)+
				" unique coupons with the given length and character set. "
				"Maximum possible is "+
				std::to_string(validated.combinatorial_space));
	}
	return validated;
}

} // namespace coupongen
