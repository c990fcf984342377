#pragma once

#include "capacity.h"

#include<cstddef>
#include<cstdint>
#include<functional>
#include<optional>
#include<string>
#include<string_view>
#include<vector>

namespace coupongen{

enum class GenerationStrategy{
	Sampling,
	DenseEnumeration,
};

const char*strategy_name(GenerationStrategy strategy) noexcept;

// Spaces up to this size may be enumerated instead of sampled.
inline constexpr std::uint64_t kDenseSpaceLimit=1ULL<<20;

struct GenerationStats{
	std::uint64_t attempts=0;
	std::uint64_t collisions=0;
	unsigned threads=0;
	GenerationStrategy strategy=GenerationStrategy::Sampling;
};

struct GenerationOptions{
	unsigned threads=0; // 0 selects the detected CPU count
	std::optional<std::uint64_t> seed; // worker i uses seed+i
	std::size_t shard_count=1;
	bool allow_dense=true;
	std::function<void()> on_accept; // called from worker threads
	GenerationStats*stats=nullptr;
};

// Sampling is used unless dense enumeration is allowed, the space is at
// most kDenseSpaceLimit and more than half of it is requested.
GenerationStrategy choose_strategy(const ValidatedRequest&validated,
								   bool allow_dense);

// Renders the index-th code of the space: prefix followed by the base-36
// digits of index, most significant first.
std::string render_code(std::string_view prefix,std::size_t suffix_length,
						std::uint64_t index);

// Generates required_count distinct codes. Result order is unspecified.
// Near the capacity ceiling sampling needs more and more retries per
// accepted code; throughput drops but the call does not fail.
std::vector<std::string> generate_codes(const GenerationRequest&request,
										const GenerationOptions&options={});

std::vector<std::string> generate_codes(std::size_t total_length,
										std::uint64_t required_count,
										std::string_view prefix);

} // namespace coupongen
