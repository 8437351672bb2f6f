#include <reina/schema/encoding/wire/error.hpp>

#include <spdlog/fmt/fmt.h>

namespace reina::schema::encoding::wire {

std::string_view kind_name(const codec_error_t& error) {
  return std::visit(
      overloaded{[](const buffer_too_small&) -> std::string_view {
                   return "buffer_too_small";
                 },
                 [](const checksum_mismatch&) -> std::string_view {
                   return "checksum_mismatch";
                 },
                 [](const invalid_data&) -> std::string_view {
                   return "invalid_data";
                 },
                 [](const overflow&) -> std::string_view {
                   return "overflow";
                 },
                 [](const io_error&) -> std::string_view {
                   return "io_error";
                 }},
      error);
}

std::string to_string(const codec_error_t& error) {
  return std::visit(
      overloaded{
          [](const buffer_too_small& e) {
            return fmt::format("buffer too small: need {} byte(s), have {}",
                               e.required, e.available);
          },
          [](const checksum_mismatch& e) {
            return fmt::format("checksum mismatch: stored {} vs computed {}",
                               reina::schema::to_hex(e.stored),
                               reina::schema::to_hex(e.computed));
          },
          [](const invalid_data& e) {
            return fmt::format("invalid data: {}", e.reason);
          },
          [](const overflow& e) {
            return fmt::format("integer overflow: {}", e.reason);
          },
          [](const io_error& e) {
            return fmt::format("I/O error: {}", e.reason);
          }},
      error);
}

}  // namespace reina::schema::encoding::wire
