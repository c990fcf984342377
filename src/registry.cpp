#include "registry.h"

#include "error.h"

#include<algorithm>
#include<functional>
#include<string_view>

namespace coupongen{
namespace{

// Upper bound on the up-front reservation; larger runs grow by rehashing.
constexpr std::uint64_t kMaxReserve=1ULL<<24;

} // namespace

DedupRegistry::DedupRegistry(std::uint64_t expected_size,
							 std::size_t shard_count){
	if(shard_count==0){
		shard_count=1;
	}
	std::uint64_t per_shard=
		std::min(expected_size,kMaxReserve)/shard_count+1;
	shards_.reserve(shard_count);
	for(std::size_t i=0;i<shard_count;++i){
		auto shard=std::make_unique<Shard>();
		shard->codes.reserve(static_cast<std::size_t>(per_shard));
		shards_.push_back(std::move(shard));
	}
}

DedupRegistry::Shard&DedupRegistry::shard_for(const std::string&code){
	if(shards_.size()==1){
		return *shards_.front();
	}
	std::size_t hash=std::hash<std::string>{}(code);
	return *shards_[hash%shards_.size()];
}

const DedupRegistry::Shard&
DedupRegistry::shard_for(const std::string&code) const{
	if(shards_.size()==1){
		return *shards_.front();
	}
	std::size_t hash=std::hash<std::string>{}(code);
	return *shards_[hash%shards_.size()];
}

bool DedupRegistry::try_accept(std::string code){
	Shard&shard=shard_for(code);
	std::lock_guard<std::mutex> lock(shard.mutex);
	return shard.codes.insert(std::move(code)).second;
}

bool DedupRegistry::contains(const std::string&code) const{
	const Shard&shard=shard_for(code);
	std::lock_guard<std::mutex> lock(shard.mutex);
	return shard.codes.find(code)!=shard.codes.end();
}

std::uint64_t DedupRegistry::size() const{
	std::uint64_t total=0;
	for(const auto&shard : shards_){
		std::lock_guard<std::mutex> lock(shard->mutex);
		total+=shard->codes.size();
	}
	return total;
}

std::vector<std::string> DedupRegistry::drain(std::uint64_t expected_count){
	std::vector<std::string> out;
	out.reserve(static_cast<std::size_t>(size()));
	for(auto&shard : shards_){
		std::lock_guard<std::mutex> lock(shard->mutex);
		while(!shard->codes.empty()){
			auto node=shard->codes.extract(shard->codes.begin());
			out.push_back(std::move(node.value()));
		}
	}

	if(out.size()!=expected_count){
		throw GenerationError(
			GenerationErrorKind::SourceExhaustedUnexpectedly,
			"Registry holds "+std::to_string(out.size())+
				" codes but "+std::to_string(expected_count)+
				" were requested");
	}
	if(shards_.size()>1){
		// Shards are disjoint by construction; recount across the merge.
		std::unordered_set<std::string_view> seen;
		seen.reserve(out.size());
		for(const std::string&code : out){
			if(!seen.insert(code).second){
				throw GenerationError(
					GenerationErrorKind::SourceExhaustedUnexpectedly,
					"Code "+code+" was accepted by more than one shard");
			}
		}
	}
	return out;
}

} // namespace coupongen
