#pragma once

#include<atomic>
#include<cstdint>
#include<optional>

namespace coupongen{

// Hands out ticket numbers [0, total) to concurrent workers. A ticket is
// the obligation to produce one accepted code; each number is issued once.
class TicketQueue{
  public:
	explicit TicketQueue(std::uint64_t total);

	std::optional<std::uint64_t> claim_next();

	bool next_chunk(std::uint64_t requested_tickets,
					std::uint64_t&ticket_begin,std::uint64_t&ticket_end);

	std::uint64_t issued() const;
	std::uint64_t total() const{ return total_; }
	bool exhausted() const{ return issued()>=total_; }

  private:
	std::atomic<std::uint64_t> next_ticket_;
	std::uint64_t total_;
};

} // namespace coupongen
