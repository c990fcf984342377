#include "ticket_queue.h"

namespace coupongen{

TicketQueue::TicketQueue(std::uint64_t total)
	: next_ticket_(0),total_(total){}

std::optional<std::uint64_t> TicketQueue::claim_next(){
	std::uint64_t begin=0;
	std::uint64_t end=0;
	if(!next_chunk(1,begin,end)){
		return std::nullopt;
	}
	return begin;
}

bool TicketQueue::next_chunk(std::uint64_t requested_tickets,
							 std::uint64_t&ticket_begin,
							 std::uint64_t&ticket_end){
	ticket_begin=0;
	ticket_end=0;
	if(total_==0){
		return false;
	}
	if(requested_tickets==0){
		requested_tickets=1;
	}
	// Skip the increment once everything is issued so repeated pulls on an
	// exhausted queue cannot wrap the counter.
	if(next_ticket_.load(std::memory_order_relaxed)>=total_){
		return false;
	}
	std::uint64_t begin=
		next_ticket_.fetch_add(requested_tickets,std::memory_order_relaxed);
	if(begin>=total_){
		return false;
	}
	std::uint64_t end=begin+requested_tickets;
	if(end<begin||end>total_){
		end=total_;
	}
	ticket_begin=begin;
	ticket_end=end;
	return true;
}

std::uint64_t TicketQueue::issued() const{
	std::uint64_t value=next_ticket_.load(std::memory_order_relaxed);
	return value>total_?total_:value;
}

} // namespace coupongen
