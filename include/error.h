#pragma once

#include<stdexcept>
#include<string>

namespace coupongen{

enum class GenerationErrorKind{
	InitialsTooLong,
	TooManyRequested,
	ExportWriteFailure,
	SourceExhaustedUnexpectedly,
};

const char*error_kind_name(GenerationErrorKind kind) noexcept;

class GenerationError : public std::runtime_error{
  public:
	GenerationError(GenerationErrorKind kind,const std::string&message)
		: std::runtime_error(message),kind_(kind){}

	GenerationErrorKind kind() const noexcept{ return kind_; }

  private:
	GenerationErrorKind kind_;
};

} // namespace coupongen
