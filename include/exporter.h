#pragma once

#include "code_stream.h"
#include "writer.h"

#include<string>
#include<vector>

namespace coupongen{

// Buffered mode: writes every code, then finishes the writer.
void export_csv(const std::vector<std::string>&codes,CouponWriter&writer);

// Streaming mode: pulls codes one at a time and writes each as it arrives,
// then finishes the writer.
void export_csv(CodeStream&stream,CouponWriter&writer);

} // namespace coupongen
