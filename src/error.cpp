#include "error.h"

namespace coupongen{

const char*error_kind_name(GenerationErrorKind kind) noexcept{
	switch(kind){
	case GenerationErrorKind::InitialsTooLong:
		return "InitialsTooLong";
	case GenerationErrorKind::TooManyRequested:
		return "TooManyRequested";
	case GenerationErrorKind::ExportWriteFailure:
		return "ExportWriteFailure";
	case GenerationErrorKind::SourceExhaustedUnexpectedly:
		return "SourceExhaustedUnexpectedly";
	}
	return "Unknown";
}

} // namespace coupongen
