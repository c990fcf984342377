#include "capacity.h"
#include "code_stream.h"
#include "error.h"
#include "exporter.h"
#include "generator.h"
#include "writer.h"

#include<algorithm>
#include<atomic>
#include<cctype>
#include<chrono>
#include<cstdint>
#include<cstdio>
#include<exception>
#include<iomanip>
#include<iostream>
#include<limits>
#include<mutex>
#include<optional>
#include<sstream>
#include<stdexcept>
#include<string>
#include<thread>
#include<vector>

namespace coupongen{

constexpr std::uint64_t kMaxCodeLength=4096;

struct Options{
	std::uint64_t length=0;
	bool has_length=false;
	std::uint64_t count=0;
	bool has_count=false;
	std::string prefix;
	unsigned threads=0;
	std::optional<std::uint64_t> seed;
	std::size_t shards=1;
	std::string output_path;
	bool stream=false;
	bool use_zstd=false;
	bool allow_dense=true;
	bool show_progress=false;
	bool show_time=false;
	bool show_stats=false;
	bool help=false;
};

std::uint64_t parse_u64(const std::string&value){
	if(value.empty()){
		throw std::invalid_argument("invalid integer: "+value);
	}

	bool has_hex_prefix=value.size()>=2&&value[0]=='0'&&
						(value[1]=='x'||value[1]=='X');
	auto exp_pos=has_hex_prefix?std::string::npos:value.find_first_of("eE");
	if(exp_pos!=std::string::npos){
		std::string mantissa_str=value.substr(0,exp_pos);
		std::string exponent_str=value.substr(exp_pos+1);
		if(mantissa_str.empty()||exponent_str.empty()){
			throw std::invalid_argument("invalid integer: "+value);
		}
		auto is_digits=[](const std::string&text){
			return std::all_of(text.begin(),text.end(),[](unsigned char ch){
				return std::isdigit(ch)!=0;
			});
		};
		if(!is_digits(mantissa_str)||!is_digits(exponent_str)){
			throw std::invalid_argument("invalid integer: "+value);
		}

		std::uint64_t mantissa=0;
		unsigned long long exponent=0;
		try{
			mantissa=std::stoull(mantissa_str,nullptr,10);
			exponent=std::stoull(exponent_str,nullptr,10);
		}catch(const std::exception&){
			throw std::invalid_argument("invalid integer: "+value);
		}
		if(mantissa==0){
			return 0;
		}
		if(exponent>19){
			throw std::invalid_argument("integer too large: "+value);
		}

		std::uint64_t result=mantissa;
		for(unsigned long long i=0;i<exponent;++i){
			if(result>std::numeric_limits<std::uint64_t>::max()/10ULL){
				throw std::invalid_argument("integer too large: "+value);
			}
			result*=10ULL;
		}
		return result;
	}

	if(value[0]=='-'||value[0]=='+'){
		throw std::invalid_argument("invalid integer: "+value);
	}
	std::size_t idx=0;
	std::uint64_t result=0;
	try{
		result=std::stoull(value,&idx,0);
	}catch(const std::exception&){
		throw std::invalid_argument("invalid integer: "+value);
	}
	if(idx!=value.size()){
		throw std::invalid_argument("invalid integer: "+value);
	}
	return result;
}

Options parse_options(int argc,char**argv){
	Options opts;
	auto require_value=[&](int&i,const std::string&arg){
		if(i+1>=argc){
			throw std::invalid_argument(arg+" requires a value");
		}
		return std::string(argv[++i]);
	};
	for(int i=1;i<argc;++i){
		std::string arg=argv[i];
		if(arg=="--help"||arg=="-h"){
			opts.help=true;
			return opts;
		}else if(arg=="--length"){
			opts.length=parse_u64(require_value(i,arg));
			opts.has_length=true;
		}else if(arg=="--count"){
			opts.count=parse_u64(require_value(i,arg));
			opts.has_count=true;
		}else if(arg=="--prefix"){
			opts.prefix=require_value(i,arg);
		}else if(arg=="--threads"){
			std::uint64_t threads=parse_u64(require_value(i,arg));
			if(threads>std::numeric_limits<unsigned>::max()){
				throw std::invalid_argument("--threads value too large");
			}
			opts.threads=static_cast<unsigned>(threads);
		}else if(arg=="--seed"){
			opts.seed=parse_u64(require_value(i,arg));
		}else if(arg=="--shards"){
			std::uint64_t shards=parse_u64(require_value(i,arg));
			if(shards==0||shards>4096){
				throw std::invalid_argument("--shards must be in [1, 4096]");
			}
			opts.shards=static_cast<std::size_t>(shards);
		}else if(arg=="--out"){
			opts.output_path=require_value(i,arg);
		}else if(arg=="--stream"){
			opts.stream=true;
		}else if(arg=="--zstd"){
			opts.use_zstd=true;
		}else if(arg=="--no-dense"){
			opts.allow_dense=false;
		}else if(arg=="--progress"){
			opts.show_progress=true;
		}else if(arg=="--time"){
			opts.show_time=true;
		}else if(arg=="--stats"){
			opts.show_stats=true;
		}else{
			throw std::invalid_argument("unknown option: "+arg);
		}
	}
	return opts;
}

void print_usage(){
	std::cout
		<<"coupongen --length N --count K [options]\n"
		<<"  --length N      Total code length, prefix included\n"
		<<"  --count K       Number of distinct codes to generate\n"
		<<"  --prefix S      Literal prefix of every code (default empty)\n"
		<<"  --threads N     Override worker count (default: usable CPUs)\n"
		<<"  --seed N        Seed the random sources (reproducible runs)\n"
		<<"  --shards N      Split the dedup registry into N locked shards\n"
		<<"  --out PATH      Write the CSV to PATH (default stdout)\n"
		<<"  --stream        Generate lazily while writing, one code per pull\n"
		<<"  --zstd          Compress the CSV with zstd (if supported)\n"
		<<"  --no-dense      Never switch to dense enumeration near capacity\n"
		<<"  --progress      Show generation progress on stderr\n"
		<<"  --time          Print elapsed time\n"
		<<"  --stats         Print run statistics\n";
}

std::string format_with_commas(std::uint64_t value){
	std::string digits=std::to_string(value);
	std::string out;
	out.reserve(digits.size()+digits.size()/3);
	for(std::size_t i=0;i<digits.size();++i){
		if(i>0&&((digits.size()-i)%3==0)){
			out.push_back(',');
		}
		out.push_back(digits[i]);
	}
	return out;
}

std::string format_seconds(double value){
	std::ostringstream oss;
	oss<<std::fixed<<std::setprecision(6)<<value;
	return oss.str();
}

std::string format_hms(double seconds){
	if(!(seconds>=0.0)){
		return "--:--:--";
	}
	std::uint64_t rounded=static_cast<std::uint64_t>(seconds+0.5);
	std::uint64_t hours=rounded/3600ULL;
	std::uint64_t minutes=(rounded/60ULL)%60ULL;
	std::uint64_t secs=rounded%60ULL;
	std::ostringstream oss;
	oss<<std::setfill('0')<<std::setw(2)<<hours<<':'<<std::setw(2)
	   <<minutes<<':'<<std::setw(2)<<secs;
	return oss.str();
}

bool needs_csv_quoting(const std::string&text){
	return text.find_first_of(",\"\r\n")!=std::string::npos;
}

class ProgressReporter{
  public:
	ProgressReporter(bool enabled,std::uint64_t total_codes)
		: enabled_(enabled&&total_codes>0),total_codes_(total_codes),
		  start_time_(std::chrono::steady_clock::now()){}

	~ProgressReporter(){
		stop();
	}

	void start(){
		if(!enabled_||worker_.joinable()){
			return;
		}
		start_time_=std::chrono::steady_clock::now();
		worker_=std::thread([this](){ run(); });
	}

	void on_code_accepted(){
		codes_accepted_.fetch_add(1,std::memory_order_relaxed);
	}

	void stop(){
		if(!enabled_){
			return;
		}
		stop_requested_.store(true,std::memory_order_release);
		if(worker_.joinable()){
			worker_.join();
		}else{
			render(true);
		}
		enabled_=false;
	}

  private:
	void run(){
		while(!stop_requested_.load(std::memory_order_acquire)){
			render(false);
			std::this_thread::sleep_for(std::chrono::milliseconds(200));
		}
		render(true);
	}

	void render(bool final_line){
		std::uint64_t accepted=codes_accepted_.load(std::memory_order_relaxed);
		if(accepted>total_codes_){
			accepted=total_codes_;
		}

		double progress=static_cast<double>(accepted)/
						static_cast<double>(total_codes_);
		progress=std::clamp(progress,0.0,1.0);

		double elapsed_seconds=std::chrono::duration<double>(
								   std::chrono::steady_clock::now()-start_time_)
								   .count();
		bool has_eta=(progress>0.0&&progress<1.0);
		double eta_seconds=
			has_eta?elapsed_seconds*(1.0-progress)/progress:0.0;

		std::string eta_text=has_eta?format_hms(eta_seconds):"00:00:00";
		std::string elapsed_text=format_hms(elapsed_seconds);

		char buffer[192];
		std::snprintf(
			buffer,sizeof(buffer),
			"[progress] %6.2f%%  %llu/%llu codes  ETA %s  elapsed %s",
			progress*100.0,static_cast<unsigned long long>(accepted),
			static_cast<unsigned long long>(total_codes_),eta_text.c_str(),
			elapsed_text.c_str());
		std::string line(buffer);

		std::lock_guard<std::mutex> lock(output_mutex_);
		std::size_t padding=0;
		if(last_line_width_>line.size()){
			padding=last_line_width_-line.size();
		}
		std::fprintf(stderr,"\r%s",line.c_str());
		if(padding>0){
			std::fprintf(stderr,"%*s",static_cast<int>(padding),"");
		}
		if(final_line){
			std::fprintf(stderr,"\n");
		}
		std::fflush(stderr);
		last_line_width_=line.size();
	}

	bool enabled_=false;
	std::uint64_t total_codes_=0;
	std::atomic<std::uint64_t> codes_accepted_{0};
	std::atomic<bool> stop_requested_{false};
	std::chrono::steady_clock::time_point start_time_{};
	std::thread worker_;
	std::mutex output_mutex_;
	std::size_t last_line_width_=0;
};

double elapsed_seconds_since(std::chrono::steady_clock::time_point start){
	return std::chrono::duration<double>(std::chrono::steady_clock::now()-
										 start)
		.count();
}

const char*output_format_name(const CouponWriter&writer){
	return writer.compressed()?"csv+zstd":"csv";
}

int run_stream(const Options&opts,const ValidatedRequest&validated,
			   std::ostream&report){
	const GenerationRequest&request=validated.request;
	if(opts.show_progress){
		std::fprintf(stderr,"[coupongen] warning: --progress is ignored with "
							"--stream.\n");
	}
	auto start_time=std::chrono::steady_clock::now();
	CodeStream stream(request,opts.seed);
	CouponWriter writer(opts.output_path,opts.use_zstd);
	export_csv(stream,writer);
	double seconds=elapsed_seconds_since(start_time);

	if(opts.show_stats){
		report<<"Mode: stream\n";
		report<<"Output: "<<output_format_name(writer)<<"\n";
		report<<"Codes: "<<format_with_commas(stream.produced())<<"\n";
		report<<"Attempts: "<<format_with_commas(stream.attempts())<<"\n";
		report<<"Space: "<<format_with_commas(validated.combinatorial_space)
			  <<"\n";
	}
	if(opts.show_time){
		report<<"Generated and wrote "<<format_with_commas(stream.produced())
			  <<" codes in "<<format_seconds(seconds)<<" s\n";
	}
	return 0;
}

int run_buffered(const Options&opts,const ValidatedRequest&validated,
				 std::ostream&report){
	const GenerationRequest&request=validated.request;
	ProgressReporter progress(opts.show_progress,request.required_count);
	GenerationStats stats;
	GenerationOptions gen_options;
	gen_options.threads=opts.threads;
	gen_options.seed=opts.seed;
	gen_options.shard_count=opts.shards;
	gen_options.allow_dense=opts.allow_dense;
	gen_options.stats=&stats;
	if(opts.show_progress){
		gen_options.on_accept=[&progress](){ progress.on_code_accepted(); };
	}

	auto start_time=std::chrono::steady_clock::now();
	progress.start();
	std::vector<std::string> codes;
	try{
		codes=generate_codes(request,gen_options);
	}catch(...){
		progress.stop();
		throw;
	}
	progress.stop();
	double generation_seconds=elapsed_seconds_since(start_time);

	auto export_start=std::chrono::steady_clock::now();
	const char*output_format=nullptr;
	{
		CouponWriter writer(opts.output_path,opts.use_zstd);
		export_csv(codes,writer);
		output_format=output_format_name(writer);
	}
	double export_seconds=elapsed_seconds_since(export_start);

	if(opts.show_stats){
		report<<"Mode: buffered\n";
		report<<"Output: "<<output_format<<"\n";
		report<<"Strategy: "<<strategy_name(stats.strategy)<<"\n";
		report<<"Threads: "<<stats.threads<<"\n";
		report<<"Shards: "<<opts.shards<<"\n";
		report<<"Codes: "<<format_with_commas(codes.size())<<"\n";
		report<<"Attempts: "<<format_with_commas(stats.attempts)<<"\n";
		report<<"Collisions: "<<format_with_commas(stats.collisions)<<"\n";
		report<<"Space: "
			  <<format_with_commas(validated.combinatorial_space)<<"\n";
	}
	if(opts.show_time){
		report<<"Generated "<<format_with_commas(codes.size())<<" codes in "
			  <<format_seconds(generation_seconds)<<" s\n";
		report<<"Wrote CSV in "<<format_seconds(export_seconds)<<" s\n";
	}
	return 0;
}

int run_cli(int argc,char**argv){
	try{
		Options opts=parse_options(argc,argv);
		if(opts.help){
			print_usage();
			return 0;
		}
		if(!opts.has_length||!opts.has_count){
			print_usage();
			return 1;
		}
		if(opts.length>kMaxCodeLength){
			throw std::invalid_argument("--length must be at most "+
										std::to_string(kMaxCodeLength));
		}
#if !defined(COUPONGEN_HAS_ZSTD)
		if(opts.use_zstd){
			throw std::invalid_argument("zstd not supported in this build");
		}
#endif
		if(needs_csv_quoting(opts.prefix)){
			std::fprintf(stderr,"[coupongen] warning: prefix contains CSV "
								"separator or quote characters; rows are "
								"written unquoted.\n");
		}

		GenerationRequest request;
		request.total_length=static_cast<std::size_t>(opts.length);
		request.prefix=opts.prefix;
		request.required_count=opts.count;

		// Reject before the output file is created or truncated.
		ValidatedRequest validated=validate(request);

		std::ostream&report=opts.output_path.empty()?std::cerr:std::cout;

		if(opts.stream){
			return run_stream(opts,validated,report);
		}
		return run_buffered(opts,validated,report);
	}catch(const GenerationError&ex){
		std::cerr<<"Error: "<<ex.what()<<" ("<<error_kind_name(ex.kind())
				 <<")\n";
		return 1;
	}catch(const std::exception&ex){
		std::cerr<<"Error: "<<ex.what()<<"\n";
		return 1;
	}
}

} // namespace coupongen

int main(int argc,char**argv){ return coupongen::run_cli(argc,argv); }
