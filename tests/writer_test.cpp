#include "writer.h"
#include "code_stream.h"
#include "error.h"
#include "exporter.h"
#include "generator.h"

#include<gtest/gtest.h>

#include<cstdio>
#include<filesystem>
#include<fstream>
#include<set>
#include<stdexcept>
#include<string>
#include<vector>

#if defined(COUPONGEN_HAS_ZSTD)
#include<zstd.h>
#endif

namespace coupongen{
namespace{

std::vector<std::string> read_lines(std::FILE*file){
	std::rewind(file);
	std::string content;
	char buffer[4096];
	std::size_t got=0;
	while((got=std::fread(buffer,1,sizeof(buffer),file))>0){
		content.append(buffer,got);
	}
	std::vector<std::string> lines;
	std::size_t start=0;
	while(start<content.size()){
		std::size_t end=content.find('\n',start);
		if(end==std::string::npos){
			lines.push_back(content.substr(start));
			break;
		}
		lines.push_back(content.substr(start,end-start));
		start=end+1;
	}
	return lines;
}

std::vector<std::string> read_lines(const std::filesystem::path&path){
	std::ifstream in(path);
	std::vector<std::string> lines;
	std::string line;
	while(std::getline(in,line)){
		lines.push_back(line);
	}
	return lines;
}

std::string read_bytes(std::FILE*file){
	std::rewind(file);
	std::string content;
	char buffer[4096];
	std::size_t got=0;
	while((got=std::fread(buffer,1,sizeof(buffer),file))>0){
		content.append(buffer,got);
	}
	return content;
}

class TempFile{
  public:
	TempFile() : file_(std::tmpfile()){}
	~TempFile(){
		if(file_){
			std::fclose(file_);
		}
	}
	std::FILE*get() const{ return file_; }

  private:
	std::FILE*file_;
};

TEST(CouponWriterTest,EmptyExportIsHeaderOnly){
	TempFile tmp;
	ASSERT_NE(tmp.get(),nullptr);
	CouponWriter writer(tmp.get());
	export_csv(std::vector<std::string>{},writer);
	EXPECT_EQ(read_lines(tmp.get()),std::vector<std::string>{"Coupon"});
	EXPECT_EQ(writer.rows_written(),0u);
}

TEST(CouponWriterTest,BufferedRoundTrip){
	std::vector<std::string> codes=generate_codes(10,5000,"LISA");
	TempFile tmp;
	ASSERT_NE(tmp.get(),nullptr);
	CouponWriter writer(tmp.get());
	export_csv(codes,writer);
	EXPECT_EQ(writer.rows_written(),codes.size());

	std::vector<std::string> lines=read_lines(tmp.get());
	ASSERT_EQ(lines.size(),codes.size()+1);
	EXPECT_EQ(lines.front(),"Coupon");
	std::set<std::string> parsed(lines.begin()+1,lines.end());
	EXPECT_EQ(parsed,std::set<std::string>(codes.begin(),codes.end()));
}

TEST(CouponWriterTest,StreamingRoundTrip){
	CodeStream stream=generate_stream(7,3000,"S");
	TempFile tmp;
	ASSERT_NE(tmp.get(),nullptr);
	CouponWriter writer(tmp.get());
	export_csv(stream,writer);
	EXPECT_EQ(stream.state(),StreamState::Exhausted);

	std::vector<std::string> lines=read_lines(tmp.get());
	ASSERT_EQ(lines.size(),3001u);
	EXPECT_EQ(lines.front(),"Coupon");
	std::set<std::string> parsed(lines.begin()+1,lines.end());
	EXPECT_EQ(parsed.size(),3000u);
	for(const std::string&code : parsed){
		EXPECT_EQ(code.size(),7u);
		EXPECT_EQ(code.front(),'S');
	}
}

TEST(CouponWriterTest,WritesToPath){
	std::filesystem::path path=
		std::filesystem::temp_directory_path()/"coupongen_writer_test.csv";
	std::vector<std::string> codes{"AAA1","AAA2","AAA3"};
	{
		CouponWriter writer(path.string());
		export_csv(codes,writer);
	}
	std::vector<std::string> lines=read_lines(path);
	EXPECT_EQ(lines,(std::vector<std::string>{"Coupon","AAA1","AAA2","AAA3"}));
	std::filesystem::remove(path);
}

TEST(CouponWriterTest,FinishIsIdempotent){
	TempFile tmp;
	ASSERT_NE(tmp.get(),nullptr);
	CouponWriter writer(tmp.get());
	writer.write_code("ONE");
	writer.finish();
	EXPECT_NO_THROW(writer.finish());
	EXPECT_EQ(read_lines(tmp.get()),
			  (std::vector<std::string>{"Coupon","ONE"}));
}

TEST(CouponWriterTest,UnopenablePathIsExportFailure){
	try{
		CouponWriter writer("/nonexistent-dir/coupons.csv");
		FAIL()<<"expected ExportWriteFailure";
	}catch(const GenerationError&ex){
		EXPECT_EQ(ex.kind(),GenerationErrorKind::ExportWriteFailure);
	}
}

TEST(CouponWriterTest,FullDeviceIsExportFailure){
	if(!std::filesystem::exists("/dev/full")){
		GTEST_SKIP()<<"/dev/full not available";
	}
	std::vector<std::string> codes=generate_codes(12,20000,"");
	try{
		CouponWriter writer("/dev/full");
		export_csv(codes,writer);
		FAIL()<<"expected ExportWriteFailure";
	}catch(const GenerationError&ex){
		EXPECT_EQ(ex.kind(),GenerationErrorKind::ExportWriteFailure);
	}
	// The generated set is untouched and can be exported elsewhere.
	TempFile tmp;
	ASSERT_NE(tmp.get(),nullptr);
	CouponWriter retry(tmp.get());
	export_csv(codes,retry);
	EXPECT_EQ(read_lines(tmp.get()).size(),codes.size()+1);
}

TEST(CouponWriterTest,WriteAfterFinishIsExportFailure){
	TempFile tmp;
	ASSERT_NE(tmp.get(),nullptr);
	CouponWriter writer(tmp.get());
	writer.write_code("KEPT");
	writer.finish();
	try{
		writer.write_code("LOST");
		FAIL()<<"expected ExportWriteFailure";
	}catch(const GenerationError&ex){
		EXPECT_EQ(ex.kind(),GenerationErrorKind::ExportWriteFailure);
	}
	EXPECT_EQ(writer.rows_written(),1u);
	EXPECT_EQ(read_lines(tmp.get()),
			  (std::vector<std::string>{"Coupon","KEPT"}));
}

TEST(CouponWriterTest,StdoutOutputWarns){
	testing::internal::CaptureStderr();
	{
		CouponWriter writer("");
		writer.finish();
	}
	std::string err=testing::internal::GetCapturedStderr();
	EXPECT_NE(err.find("[coupongen] warning: writing codes to stdout"),
			  std::string::npos);
}

TEST(CouponWriterTest,PlainOutputIsNotCompressed){
	TempFile tmp;
	ASSERT_NE(tmp.get(),nullptr);
	CouponWriter writer(tmp.get());
	EXPECT_FALSE(writer.compressed());
	writer.finish();
}

#if defined(COUPONGEN_HAS_ZSTD)

std::string decompress_zstd(const std::string&compressed){
	ZSTD_DCtx*dctx=ZSTD_createDCtx();
	EXPECT_NE(dctx,nullptr);
	std::string out;
	std::vector<char> chunk(ZSTD_DStreamOutSize());
	ZSTD_inBuffer input{compressed.data(),compressed.size(),0};
	std::size_t last=0;
	while(input.pos<input.size){
		ZSTD_outBuffer output{chunk.data(),chunk.size(),0};
		last=ZSTD_decompressStream(dctx,&output,&input);
		if(ZSTD_isError(last)){
			ADD_FAILURE()<<ZSTD_getErrorName(last);
			break;
		}
		out.append(chunk.data(),output.pos);
	}
	// Zero means the last frame was closed with ZSTD_e_end.
	EXPECT_EQ(last,0u);
	ZSTD_freeDCtx(dctx);
	return out;
}

TEST(CouponWriterTest,ZstdRoundTrip){
	std::vector<std::string> codes=generate_codes(12,40000,"Z");
	TempFile tmp;
	ASSERT_NE(tmp.get(),nullptr);
	CouponWriter writer(tmp.get(),true);
	EXPECT_TRUE(writer.compressed());
	writer.write_codes(codes);
	// A mid-stream flush emits a flushed block before the closing frame.
	writer.flush();
	writer.finish();

	std::string compressed=read_bytes(tmp.get());
	ASSERT_FALSE(compressed.empty());
	std::string text=decompress_zstd(compressed);

	std::vector<std::string> lines;
	std::size_t start=0;
	while(start<text.size()){
		std::size_t end=text.find('\n',start);
		ASSERT_NE(end,std::string::npos)<<"last row is not terminated";
		lines.push_back(text.substr(start,end-start));
		start=end+1;
	}
	ASSERT_EQ(lines.size(),codes.size()+1);
	EXPECT_EQ(lines.front(),"Coupon");
	std::set<std::string> parsed(lines.begin()+1,lines.end());
	EXPECT_EQ(parsed,std::set<std::string>(codes.begin(),codes.end()));
}

#else

TEST(CouponWriterTest,ZstdUnavailableIsRejected){
	TempFile tmp;
	ASSERT_NE(tmp.get(),nullptr);
	EXPECT_THROW(CouponWriter(tmp.get(),true),std::invalid_argument);
}

#endif

} // namespace
} // namespace coupongen
