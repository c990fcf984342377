#pragma once

#include<cstddef>
#include<cstdint>
#include<random>
#include<string>
#include<string_view>

namespace coupongen{

// Produces candidate codes from a private random engine. Not thread safe;
// every worker owns its own instance.
class CodeGenerator{
  public:
	CodeGenerator();
	explicit CodeGenerator(std::uint64_t seed);

	void fill_bytes(std::uint8_t*out,std::size_t count);

	std::string generate(std::string_view prefix,std::size_t suffix_length);

  private:
	std::mt19937_64 engine_;
};

// Seed mixed from std::random_device and the clock.
std::uint64_t entropy_seed();

} // namespace coupongen
