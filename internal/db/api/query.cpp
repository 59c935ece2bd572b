#include "query.hpp"

#include <stdexcept>
#include <string>

namespace jobstore::db {

std::string EncodeContinuation(int64_t offset) {
  return "o:" + std::to_string(offset);
}

int64_t DecodeContinuation(const std::string& token) {
  if (token.empty()) {
    return 0;
  }
  if (token.size() < 3 || token.compare(0, 2, "o:") != 0) {
    throw std::invalid_argument("malformed continuation token: " + token);
  }

  std::size_t consumed = 0;
  const auto  offset   = std::stoll(token.substr(2), &consumed);
  if (consumed != token.size() - 2 || offset < 0) {
    throw std::invalid_argument("malformed continuation token: " + token);
  }
  return offset;
}

} // namespace jobstore::db
