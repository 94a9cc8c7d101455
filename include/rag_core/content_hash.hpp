#pragma once

#include <string>

namespace rag_core {

class ContentHashError : public std::exception {
 public:
  explicit ContentHashError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Lower-case hex SHA-256 of the content
std::string compute_content_hash(const std::string& content);

}  // namespace rag_core
