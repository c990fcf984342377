#pragma once

#include "capacity.h"
#include "code_generator.h"
#include "registry.h"
#include "ticket_queue.h"

#include<cstddef>
#include<cstdint>
#include<optional>
#include<string>
#include<string_view>

namespace coupongen{

enum class StreamState{
	Pending,
	Emitting,
	Exhausted,
};

const char*stream_state_name(StreamState state) noexcept;

// Pull-based code sequence for single-threaded consumption. Every pull
// claims one ticket and retries candidates until the registry accepts one.
// Once the tickets run out the stream is Exhausted for good.
class CodeStream{
  public:
	explicit CodeStream(const GenerationRequest&request,
						std::optional<std::uint64_t> seed={});

	CodeStream(const CodeStream&)=delete;
	CodeStream&operator=(const CodeStream&)=delete;

	std::optional<std::string> next();

	StreamState state() const{ return state_; }
	std::uint64_t produced() const{ return produced_; }
	std::uint64_t attempts() const{ return attempts_; }
	std::uint64_t required_count() const{ return tickets_.total(); }
	const ValidatedRequest&validated() const{ return validated_; }

  private:
	ValidatedRequest validated_;
	TicketQueue tickets_;
	DedupRegistry registry_;
	CodeGenerator generator_;
	StreamState state_=StreamState::Pending;
	std::uint64_t produced_=0;
	std::uint64_t attempts_=0;
};

CodeStream generate_stream(std::size_t total_length,
						   std::uint64_t required_count,
						   std::string_view prefix,
						   std::optional<std::uint64_t> seed={});

} // namespace coupongen
