#include "ticket_queue.h"

#include<gtest/gtest.h>

#include<algorithm>
#include<thread>
#include<vector>

namespace coupongen{
namespace{

TEST(TicketQueueTest,IssuesEveryTicketInOrderThenStops){
	TicketQueue queue(3);
	EXPECT_EQ(queue.claim_next(),std::optional<std::uint64_t>(0));
	EXPECT_EQ(queue.claim_next(),std::optional<std::uint64_t>(1));
	EXPECT_EQ(queue.claim_next(),std::optional<std::uint64_t>(2));
	EXPECT_FALSE(queue.claim_next().has_value());
	EXPECT_FALSE(queue.claim_next().has_value());
	EXPECT_EQ(queue.issued(),3u);
	EXPECT_TRUE(queue.exhausted());
}

TEST(TicketQueueTest,EmptyQueueIssuesNothing){
	TicketQueue queue(0);
	EXPECT_FALSE(queue.claim_next().has_value());
	EXPECT_EQ(queue.issued(),0u);
	EXPECT_TRUE(queue.exhausted());
}

TEST(TicketQueueTest,ChunkIsClampedToTotal){
	TicketQueue queue(10);
	std::uint64_t begin=0;
	std::uint64_t end=0;
	ASSERT_TRUE(queue.next_chunk(4,begin,end));
	EXPECT_EQ(begin,0u);
	EXPECT_EQ(end,4u);
	ASSERT_TRUE(queue.next_chunk(8,begin,end));
	EXPECT_EQ(begin,4u);
	EXPECT_EQ(end,10u);
	EXPECT_FALSE(queue.next_chunk(1,begin,end));
	EXPECT_EQ(queue.issued(),10u);
}

TEST(TicketQueueTest,ConcurrentClaimsNeverRepeat){
	constexpr std::uint64_t total=20000;
	constexpr unsigned threads=8;
	TicketQueue queue(total);
	std::vector<std::vector<std::uint64_t>> claimed(threads);
	std::vector<std::thread> workers;
	for(unsigned t=0;t<threads;++t){
		workers.emplace_back([&,t](){
			while(auto ticket=queue.claim_next()){
				claimed[t].push_back(*ticket);
			}
		});
	}
	for(auto&worker : workers){
		worker.join();
	}

	std::vector<std::uint64_t> all;
	for(const auto&part : claimed){
		all.insert(all.end(),part.begin(),part.end());
	}
	std::sort(all.begin(),all.end());
	ASSERT_EQ(all.size(),total);
	for(std::uint64_t i=0;i<total;++i){
		EXPECT_EQ(all[i],i);
	}
}

} // namespace
} // namespace coupongen
