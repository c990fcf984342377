#pragma once

#include<cstddef>
#include<cstdint>
#include<string>

namespace coupongen{

struct GenerationRequest{
	std::size_t total_length=0;
	std::string prefix;
	std::uint64_t required_count=0;
};

struct ValidatedRequest{
	GenerationRequest request;
	std::size_t suffix_length=0;
	std::uint64_t combinatorial_space=0;
};

// kCharsetSize ^ suffix_length, saturated at UINT64_MAX.
std::uint64_t combinatorial_space(std::size_t suffix_length) noexcept;

// Throws GenerationError (InitialsTooLong, TooManyRequested). Has no side
// effects, so it must be called before any worker is started.
ValidatedRequest validate(const GenerationRequest&request);

} // namespace coupongen
