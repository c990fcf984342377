#pragma once

#include<cstddef>
#include<cstdint>
#include<memory>
#include<mutex>
#include<string>
#include<unordered_set>
#include<vector>

namespace coupongen{

// Set of accepted codes shared by all workers of one run. Each code is
// routed by hash to exactly one shard, and the check-and-insert on that
// shard happens under the shard mutex.
class DedupRegistry{
  public:
	explicit DedupRegistry(std::uint64_t expected_size,
						   std::size_t shard_count=1);

	DedupRegistry(const DedupRegistry&)=delete;
	DedupRegistry&operator=(const DedupRegistry&)=delete;

	bool try_accept(std::string code);

	bool contains(const std::string&code) const;
	std::uint64_t size() const;
	std::size_t shard_count() const{ return shards_.size(); }

	// Moves all codes out and checks that exactly expected_count distinct
	// codes were accepted. The registry is empty afterwards.
	std::vector<std::string> drain(std::uint64_t expected_count);

  private:
	struct Shard{
		mutable std::mutex mutex;
		std::unordered_set<std::string> codes;
	};

	Shard&shard_for(const std::string&code);
	const Shard&shard_for(const std::string&code) const;

	std::vector<std::unique_ptr<Shard>> shards_;
};

} // namespace coupongen
