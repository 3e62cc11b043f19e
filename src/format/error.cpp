#include "membuffer/format/error.hpp"

#include <string>

namespace membuffer::format {
namespace {

class format_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "membuffer.format"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::unknown_field:
        return "field unknown";
      case errc::type_mismatch:
        return "field has a different type than requested";
      case errc::malformed_header:
        return "reached end of buffer before end of header";
      case errc::field_out_of_range:
        return "field range lies outside the payload";
      case errc::invalid_utf8:
        return "text field is not valid utf-8";
      case errc::length_mismatch:
        return "field length is not a multiple of the element size";
      case errc::payload_overflow:
        return "payload size limit exceeded";
      case errc::reserved_value:
        return "inline value collides with the header sentinel";
      case errc::too_many_fields:
        return "descriptor table exceeds field limit";
      case errc::structured_encode:
        return "structured value could not be serialized";
      case errc::structured_decode:
        return "structured value could not be parsed";
      default:
        return "unknown membuffer.format error";
    }
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static format_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // namespace membuffer::format
