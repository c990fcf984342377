#include "writer.h"

#include "error.h"

#include<cerrno>
#include<cstring>
#include<exception>
#include<stdexcept>

#if defined(COUPONGEN_HAS_ZSTD)
#include<zstd.h>
#endif

namespace coupongen{

namespace{

constexpr std::size_t kDefaultFileBuffer=1u<<20; // 1 MiB
constexpr std::size_t kDefaultQueueCapacity=8;
constexpr std::size_t kDefaultBufferThreshold=4u<<20; // 4 MiB
constexpr std::size_t kDefaultPendingThreshold=64u<<10; // 64 KiB

[[noreturn]] void throw_export_failure(const std::string&message){
	throw GenerationError(GenerationErrorKind::ExportWriteFailure,message);
}

} // namespace

CouponWriter::CouponWriter(const std::string&path,bool use_zstd)
	: file_(nullptr),owns_file_(false),finished_(false),
	  queue_capacity_(kDefaultQueueCapacity),stop_requested_(false),
	  pending_threshold_(kDefaultPendingThreshold),rows_written_(0),
	  buffer_threshold_(kDefaultBufferThreshold),use_zstd_(use_zstd),
	  zstd_cctx_(nullptr),io_error_(false){
	if(path.empty()){
		file_=stdout;
		owns_file_=false;
		std::fprintf(stderr,"[coupongen] warning: writing codes to stdout may "
							"stall large outputs."
							" Consider using --out <path>.\n");
	}else{
		file_=std::fopen(path.c_str(),"wb");
		if(!file_){
			throw_export_failure("Failed to open output file "+path+": "+
								 std::strerror(errno));
		}
		owns_file_=true;
	}
	try{
		start(use_zstd);
	}catch(...){
		if(owns_file_){
			std::fclose(file_);
			file_=nullptr;
		}
		throw;
	}
}

CouponWriter::CouponWriter(std::FILE*sink,bool use_zstd)
	: file_(sink),owns_file_(false),finished_(false),
	  queue_capacity_(kDefaultQueueCapacity),stop_requested_(false),
	  pending_threshold_(kDefaultPendingThreshold),rows_written_(0),
	  buffer_threshold_(kDefaultBufferThreshold),use_zstd_(use_zstd),
	  zstd_cctx_(nullptr),io_error_(false){
	if(!file_){
		throw std::invalid_argument("Invalid output handle");
	}
	start(use_zstd);
}

void CouponWriter::start(bool use_zstd){
	if(owns_file_&&std::setvbuf(file_,nullptr,_IOFBF,kDefaultFileBuffer)!=0){
		throw_export_failure("Failed to set file buffer");
	}

	if(use_zstd){
#if defined(COUPONGEN_HAS_ZSTD)
		ZSTD_CCtx*cctx=ZSTD_createCCtx();
		if(!cctx){
			throw_export_failure("Failed to create zstd context");
		}
		std::size_t configured=ZSTD_CCtx_setParameter(
			cctx,ZSTD_c_compressionLevel,3);
		if(ZSTD_isError(configured)){
			std::string message="Failed to configure zstd context: ";
			message.append(ZSTD_getErrorName(configured));
			ZSTD_freeCCtx(cctx);
			throw_export_failure(message);
		}
		zstd_cctx_=cctx;
		zstd_out_buffer_.resize(ZSTD_CStreamOutSize());
#else
		throw std::invalid_argument("zstd not supported in this build");
#endif
	}

	buffer_.reserve(buffer_threshold_);
	pending_.reserve(pending_threshold_+64);
	pending_.append(kCsvHeader);
	pending_.push_back('\n');

	writer_thread_=std::thread(&CouponWriter::writer_loop,this);
}

CouponWriter::~CouponWriter(){
	try{
		finish();
	}catch(const std::exception&ex){
		std::fprintf(stderr,"[coupongen] warning: export not completed: %s\n",
					 ex.what());
	}
}

void CouponWriter::write_code(std::string_view code){
	if(finished_){
		throw_export_failure("Writer has been finished");
	}
	pending_.append(code);
	pending_.push_back('\n');
	++rows_written_;
	if(pending_.size()>=pending_threshold_){
		submit_pending();
	}
}

void CouponWriter::write_codes(const std::vector<std::string>&codes){
	for(const std::string&code : codes){
		write_code(code);
	}
}

void CouponWriter::flush(){
	submit_pending();
	enqueue_chunk(Chunk{{},true});
}

void CouponWriter::finish(){
	if(finished_){
		return;
	}
	finished_=true;

	std::exception_ptr flush_error;
	bool already_stopped=false;
	{
		std::lock_guard<std::mutex> lock(queue_mutex_);
		already_stopped=stop_requested_;
	}
	if(!already_stopped){
		try{
			flush();
		}catch(...){
			flush_error=std::current_exception();
		}
		{
			std::lock_guard<std::mutex> lock(queue_mutex_);
			stop_requested_=true;
		}
		queue_not_empty_.notify_one();
	}

	if(writer_thread_.joinable()){
		writer_thread_.join();
	}

#if defined(COUPONGEN_HAS_ZSTD)
	if(zstd_cctx_){
		ZSTD_freeCCtx(static_cast<ZSTD_CCtx*>(zstd_cctx_));
		zstd_cctx_=nullptr;
	}
#endif

	if(file_){
		if(owns_file_){
			if(std::fclose(file_)!=0&&!flush_error){
				flush_error=std::make_exception_ptr(GenerationError(
					GenerationErrorKind::ExportWriteFailure,
					"Failed to close output file"));
			}
		}else if(std::fflush(file_)!=0&&!flush_error){
			flush_error=std::make_exception_ptr(GenerationError(
				GenerationErrorKind::ExportWriteFailure,
				"Failed to flush output stream"));
		}
		file_=nullptr;
	}

	if(flush_error){
		std::rethrow_exception(flush_error);
	}

	check_io_error();
}

void CouponWriter::submit_pending(){
	if(pending_.empty()){
		return;
	}
	std::string data;
	data.reserve(pending_threshold_+64);
	data.swap(pending_);
	enqueue_chunk(Chunk{std::move(data),false});
}

void CouponWriter::enqueue_chunk(Chunk&&chunk){
	check_io_error();

	std::unique_lock<std::mutex> lock(queue_mutex_);
	queue_not_full_.wait(
		lock,[&]{ return queue_.size()<queue_capacity_||stop_requested_; });
	if(stop_requested_){
		throw_export_failure("Writer has been stopped");
	}
	queue_.push_back(std::move(chunk));
	lock.unlock();
	queue_not_empty_.notify_one();
}

void CouponWriter::writer_loop(){
	for(;;){
		Chunk chunk;
		{
			std::unique_lock<std::mutex> lock(queue_mutex_);
			queue_not_empty_.wait(
				lock,[&]{ return stop_requested_||!queue_.empty(); });
			if(queue_.empty()){
				if(stop_requested_){
					break;
				}
				continue;
			}
			chunk=std::move(queue_.front());
			queue_.pop_front();
			queue_not_full_.notify_one();
		}

		if(!chunk.data.empty()){
			buffer_.append(chunk.data);
			if(buffer_.size()>=buffer_threshold_){
				flush_buffer();
			}
		}
		if(chunk.flush){
			flush_buffer();
#if defined(COUPONGEN_HAS_ZSTD)
			if(use_zstd_){
				flush_zstd_stream(false);
			}
#endif
			if(file_&&std::fflush(file_)!=0){
				set_error(std::strerror(errno));
			}
		}
	}

	flush_buffer();
#if defined(COUPONGEN_HAS_ZSTD)
	if(use_zstd_){
		flush_zstd_stream(true);
	}
#endif
	if(file_&&std::fflush(file_)!=0){
		set_error(std::strerror(errno));
	}
}

void CouponWriter::flush_buffer(){
	if(!file_||buffer_.empty()){
		return;
	}

	if(!use_zstd_){
		write_file_bytes(buffer_.data(),buffer_.size());
		if(!io_error_.load(std::memory_order_acquire)){
			buffer_.clear();
		}
		return;
	}

#if defined(COUPONGEN_HAS_ZSTD)
	if(!zstd_cctx_){
		set_error("zstd context is not initialized");
		return;
	}
	ZSTD_inBuffer input{buffer_.data(),buffer_.size(),0};
	while(input.pos<input.size){
		ZSTD_outBuffer output{zstd_out_buffer_.data(),zstd_out_buffer_.size(),0};
		std::size_t code=ZSTD_compressStream2(
			static_cast<ZSTD_CCtx*>(zstd_cctx_),&output,&input,ZSTD_e_continue);
		if(ZSTD_isError(code)){
			std::string message="zstd compress error: ";
			message.append(ZSTD_getErrorName(code));
			set_error(message);
			break;
		}
		if(output.pos>0){
			write_file_bytes(zstd_out_buffer_.data(),output.pos);
			if(io_error_.load(std::memory_order_acquire)){
				break;
			}
		}
	}
	if(!io_error_.load(std::memory_order_acquire)){
		buffer_.clear();
	}
#else
	set_error("zstd not supported in this build");
#endif
}

void CouponWriter::write_file_bytes(const char*data,std::size_t size){
	if(!file_||size==0){
		return;
	}
	const char*cursor=data;
	std::size_t remaining=size;
	while(remaining>0){
		std::size_t written=std::fwrite(cursor,1,remaining,file_);
		if(written==0){
			set_error(std::ferror(file_)?std::strerror(errno)
										:"short write to output");
			break;
		}
		cursor+=written;
		remaining-=written;
	}
}

void CouponWriter::check_io_error() const{
	if(!io_error_.load(std::memory_order_acquire)){
		return;
	}
	std::lock_guard<std::mutex> lock(error_mutex_);
	throw_export_failure(error_message_.empty()?"I/O error":error_message_);
}

void CouponWriter::set_error(const std::string&message){
	bool expected=false;
	if(io_error_.compare_exchange_strong(expected,true,
										 std::memory_order_acq_rel)){
		std::lock_guard<std::mutex> lock(error_mutex_);
		error_message_=message;
	}
}

#if defined(COUPONGEN_HAS_ZSTD)
void CouponWriter::flush_zstd_stream(bool final_frame){
	if(!zstd_cctx_){
		set_error("zstd context is not initialized");
		return;
	}
	ZSTD_EndDirective mode=final_frame?ZSTD_e_end:ZSTD_e_flush;
	ZSTD_inBuffer input{nullptr,0,0};
	for(;;){
		ZSTD_outBuffer output{zstd_out_buffer_.data(),zstd_out_buffer_.size(),0};
		std::size_t code=ZSTD_compressStream2(
			static_cast<ZSTD_CCtx*>(zstd_cctx_),&output,&input,mode);
		if(ZSTD_isError(code)){
			std::string message="zstd compress error: ";
			message.append(ZSTD_getErrorName(code));
			set_error(message);
			return;
		}
		if(output.pos>0){
			write_file_bytes(zstd_out_buffer_.data(),output.pos);
			if(io_error_.load(std::memory_order_acquire)){
				return;
			}
		}
		if(code==0){
			return;
		}
	}
}
#endif

} // namespace coupongen
