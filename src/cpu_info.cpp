#include "cpu_info.h"

#include<algorithm>
#include<thread>

#ifdef _WIN32
#define NOMINMAX
#include<windows.h>
#else
#include<sched.h>
#endif

namespace coupongen{
namespace{

#ifdef _WIN32

unsigned usable_logical_cpus(){
	DWORD count=GetActiveProcessorCount(ALL_PROCESSOR_GROUPS);
	if(count==0){
		count=std::thread::hardware_concurrency();
	}
	return static_cast<unsigned>(count);
}

#else

// CPUs this process may run on, which can be fewer than the machine has
// under taskset or a container cpuset.
unsigned usable_logical_cpus(){
	cpu_set_t set;
	CPU_ZERO(&set);
	if(sched_getaffinity(0,sizeof(set),&set)!=0){
		return std::thread::hardware_concurrency();
	}
	return static_cast<unsigned>(CPU_COUNT(&set));
}

#endif

} // namespace

CpuInfo detect_cpu_info(){
	CpuInfo info;
	unsigned logical=usable_logical_cpus();
	info.logical_cpus=logical?logical:1;
	return info;
}

unsigned choose_thread_count(const CpuInfo&info,unsigned requested_threads,
							 std::uint64_t ticket_count){
	unsigned threads=requested_threads;
	if(threads==0){
		threads=info.logical_cpus?info.logical_cpus:1;
	}
	threads=std::min(threads,kMaxWorkerThreads);
	if(ticket_count<threads){
		threads=static_cast<unsigned>(ticket_count);
	}
	return std::max(1u,threads);
}

} // namespace coupongen
