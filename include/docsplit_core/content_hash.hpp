#pragma once

#include <string>
#include <string_view>

namespace docsplit_core {

class ContentHashError : public std::exception {
 public:
  explicit ContentHashError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Lowercase hex SHA-256 of the given bytes.
std::string compute_content_hash(std::string_view content);

}  // namespace docsplit_core
