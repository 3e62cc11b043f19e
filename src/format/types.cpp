#include "membuffer/format/types.hpp"

namespace membuffer::format {

const char* type_tag_name(type_tag t) noexcept {
  switch (t) {
    case type_tag::text:
      return "text";
    case type_tag::integer32:
      return "i32";
    case type_tag::vector_u8:
      return "bytes";
    case type_tag::vector_u64:
      return "u64[]";
    case type_tag::nested_buffer:
      return "membuffer";
    default:
      break;
  }
  return is_user_defined(t) ? "user" : "invalid";
}

}  // namespace membuffer::format
