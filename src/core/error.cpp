#include "membuffer/core/error.hpp"

#include <string>

namespace membuffer::core {
namespace {

class core_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "membuffer.core"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::invalid_argument:
        return "invalid argument";
      case errc::buffer_overflow:
        return "buffer overflow";
      default:
        return "unknown membuffer.core error";
    }
  }
};

}  // 匿名命名空间

const std::error_category& error_category() noexcept {
  static core_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // 命名空间 membuffer::core
