#include "cpu_info.h"

#include<gtest/gtest.h>

namespace coupongen{
namespace{

TEST(CpuInfoTest,DetectsAtLeastOneCpu){
	EXPECT_GE(detect_cpu_info().logical_cpus,1u);
}

TEST(CpuInfoTest,DefaultsToLogicalCpus){
	CpuInfo info;
	info.logical_cpus=6;
	EXPECT_EQ(choose_thread_count(info,0,1000),6u);
}

TEST(CpuInfoTest,RequestedCountWins){
	CpuInfo info;
	info.logical_cpus=6;
	EXPECT_EQ(choose_thread_count(info,3,1000),3u);
}

TEST(CpuInfoTest,NeverMoreThanTickets){
	CpuInfo info;
	info.logical_cpus=6;
	EXPECT_EQ(choose_thread_count(info,0,2),2u);
	EXPECT_EQ(choose_thread_count(info,0,0),1u);
}

TEST(CpuInfoTest,HugeRequestIsCapped){
	CpuInfo info;
	EXPECT_EQ(choose_thread_count(info,100000,1000000),kMaxWorkerThreads);
	EXPECT_EQ(choose_thread_count(info,100000,10),10u);
}

} // namespace
} // namespace coupongen
