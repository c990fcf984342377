#include "generator.h"

#include "charset.h"
#include "code_generator.h"
#include "cpu_info.h"
#include "registry.h"
#include "ticket_queue.h"

#include<algorithm>
#include<atomic>
#include<exception>
#include<mutex>
#include<numeric>
#include<random>
#include<system_error>
#include<thread>

namespace coupongen{
namespace{

constexpr std::uint64_t kMaxTicketBatch=64;

std::uint64_t choose_ticket_batch(std::uint64_t total,unsigned threads){
	std::uint64_t per_worker=total/(static_cast<std::uint64_t>(threads)*8ULL);
	return std::clamp<std::uint64_t>(per_worker,1,kMaxTicketBatch);
}

std::vector<std::string> generate_dense(const ValidatedRequest&validated,
										const GenerationOptions&options){
	const GenerationRequest&request=validated.request;
	std::vector<std::uint32_t> indices(
		static_cast<std::size_t>(validated.combinatorial_space));
	std::iota(indices.begin(),indices.end(),0U);

	std::mt19937_64 engine(options.seed?*options.seed:entropy_seed());
	// Partial Fisher-Yates: only the first required_count slots are needed.
	const std::size_t take=static_cast<std::size_t>(request.required_count);
	for(std::size_t i=0;i<take;++i){
		std::uniform_int_distribution<std::size_t> pick(i,indices.size()-1);
		std::swap(indices[i],indices[pick(engine)]);
	}

	std::vector<std::string> out;
	out.reserve(take);
	for(std::size_t i=0;i<take;++i){
		out.push_back(
			render_code(request.prefix,validated.suffix_length,indices[i]));
		if(options.on_accept){
			options.on_accept();
		}
	}
	if(options.stats){
		options.stats->attempts=take;
		options.stats->collisions=0;
		options.stats->threads=1;
		options.stats->strategy=GenerationStrategy::DenseEnumeration;
	}
	return out;
}

std::vector<std::string> generate_sampled(const ValidatedRequest&validated,
										  const GenerationOptions&options){
	const GenerationRequest&request=validated.request;
	const std::uint64_t total=request.required_count;
	const std::size_t suffix_length=validated.suffix_length;

	CpuInfo info=detect_cpu_info();
	unsigned threads=choose_thread_count(info,options.threads,total);
	std::uint64_t batch=choose_ticket_batch(total,threads);

	TicketQueue tickets(total);
	DedupRegistry registry(total,options.shard_count);

	std::atomic<std::uint64_t> attempts{0};
	std::atomic<std::uint64_t> collisions{0};
	std::atomic<bool> failed{false};
	std::mutex error_mutex;
	std::exception_ptr first_error;

	std::vector<std::thread> workers;
	workers.reserve(threads);
	auto join_all=[&workers](){
		for(auto&thread : workers){
			if(thread.joinable()){
				thread.join();
			}
		}
	};
	try{
		for(unsigned t=0;t<threads;++t){
			workers.emplace_back([&,t](){
				std::uint64_t local_attempts=0;
				std::uint64_t local_collisions=0;
				try{
					CodeGenerator generator(options.seed?*options.seed+t
														:entropy_seed());
					while(!failed.load(std::memory_order_relaxed)){
						std::uint64_t ticket_begin=0;
						std::uint64_t ticket_end=0;
						if(!tickets.next_chunk(batch,ticket_begin,ticket_end)){
							break;
						}
						for(std::uint64_t ticket=ticket_begin;ticket<ticket_end;
							++ticket){
							for(;;){
								++local_attempts;
								if(registry.try_accept(
									   generator.generate(request.prefix,
														  suffix_length))){
									break;
								}
								++local_collisions;
							}
							if(options.on_accept){
								options.on_accept();
							}
						}
					}
				}catch(...){
					std::lock_guard<std::mutex> lock(error_mutex);
					if(!first_error){
						first_error=std::current_exception();
					}
					failed.store(true,std::memory_order_relaxed);
				}
				attempts.fetch_add(local_attempts,std::memory_order_relaxed);
				collisions.fetch_add(local_collisions,std::memory_order_relaxed);
			});
		}
	}catch(const std::system_error&){
		// Workers already running stop at their next ticket claim.
		failed.store(true,std::memory_order_relaxed);
		join_all();
		throw;
	}
	join_all();

	if(first_error){
		std::rethrow_exception(first_error);
	}

	if(options.stats){
		options.stats->attempts=attempts.load(std::memory_order_relaxed);
		options.stats->collisions=collisions.load(std::memory_order_relaxed);
		options.stats->threads=threads;
		options.stats->strategy=GenerationStrategy::Sampling;
	}
	return registry.drain(total);
}

} // namespace

const char*strategy_name(GenerationStrategy strategy) noexcept{
	switch(strategy){
	case GenerationStrategy::Sampling:
		return "sampling";
	case GenerationStrategy::DenseEnumeration:
		return "dense";
	}
	return "sampling";
}

GenerationStrategy choose_strategy(const ValidatedRequest&validated,
								   bool allow_dense){
	if(!allow_dense||validated.combinatorial_space>kDenseSpaceLimit){
		return GenerationStrategy::Sampling;
	}
	if(validated.request.required_count>validated.combinatorial_space/2){
		return GenerationStrategy::DenseEnumeration;
	}
	return GenerationStrategy::Sampling;
}

std::string render_code(std::string_view prefix,std::size_t suffix_length,
						std::uint64_t index){
	std::string code(prefix);
	code.resize(prefix.size()+suffix_length,kCharset.front());
	for(std::size_t pos=code.size();pos>prefix.size();--pos){
		code[pos-1]=kCharset[static_cast<std::size_t>(index%kCharsetSize)];
		index/=kCharsetSize;
	}
	return code;
}

std::vector<std::string> generate_codes(const GenerationRequest&request,
										const GenerationOptions&options){
	ValidatedRequest validated=validate(request);
	if(request.required_count==0){
		if(options.stats){
			*options.stats=GenerationStats{};
		}
		return {};
	}
	if(choose_strategy(validated,options.allow_dense)==
	   GenerationStrategy::DenseEnumeration){
		return generate_dense(validated,options);
	}
	return generate_sampled(validated,options);
}

std::vector<std::string> generate_codes(std::size_t total_length,
										std::uint64_t required_count,
										std::string_view prefix){
	GenerationRequest request;
	request.total_length=total_length;
	request.prefix=std::string(prefix);
	request.required_count=required_count;
	return generate_codes(request);
}

} // namespace coupongen
