#pragma once

#include<cstdint>

namespace coupongen{

struct CpuInfo{
	unsigned logical_cpus=1;
};

CpuInfo detect_cpu_info();

// Upper bound on workers for one run, regardless of what was requested.
inline constexpr unsigned kMaxWorkerThreads=1024;

// Worker count for a run: the requested count if non-zero, otherwise the
// usable logical CPUs. Never more workers than tickets or
// kMaxWorkerThreads, never zero.
unsigned choose_thread_count(const CpuInfo&info,unsigned requested_threads,
							 std::uint64_t ticket_count);

} // namespace coupongen
