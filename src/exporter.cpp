#include "exporter.h"

namespace coupongen{

void export_csv(const std::vector<std::string>&codes,CouponWriter&writer){
	writer.write_codes(codes);
	writer.finish();
}

void export_csv(CodeStream&stream,CouponWriter&writer){
	while(auto code=stream.next()){
		writer.write_code(*code);
	}
	writer.finish();
}

} // namespace coupongen
