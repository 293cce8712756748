#pragma once
#include "util/stream.hpp"
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace RedisLite {

struct RESP {
  enum class type { SIMPLE_STRING, ERROR, INTEGER, BULK_STRING, ARRAY };
  type resp_type;
  std::string str;
  long long integer = 0;
  std::vector<RESP> elements;
  bool is_null = false; // BULK_STRING only

  bool operator==(const RESP &other) const = default;

  static RESP simple(std::string s) {
    return {.resp_type = type::SIMPLE_STRING, .str = std::move(s)};
  }
  static RESP error(std::string s) {
    return {.resp_type = type::ERROR, .str = std::move(s)};
  }
  static RESP number(long long n) {
    return {.resp_type = type::INTEGER, .integer = n};
  }
  static RESP bulk(std::string s) {
    return {.resp_type = type::BULK_STRING, .str = std::move(s)};
  }
  static RESP null_bulk() {
    return {.resp_type = type::BULK_STRING, .is_null = true};
  }
  static RESP array(std::vector<RESP> items) {
    return {.resp_type = type::ARRAY, .elements = std::move(items)};
  }
};

// Malformed input. The connection survives it.
struct ProtocolError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

constexpr int MAX_RESP_DEPTH = 128;
constexpr long long MAX_BULK_LEN = 512 * 1024 * 1024;
constexpr long long MAX_ARRAY_COUNT = 1024 * 1024;
constexpr size_t MAX_INLINE_LEN = 64 * 1024;

// Reads exactly one value. Throws ProtocolError or TransportError.
RESP decode_RESP(BufferedReader &in);

// Arrays may only hold scalars; a nested array throws std::invalid_argument.
std::string serialize_RESP(const RESP &resp);
void encode_RESP(BufferedWriter &out, const RESP &resp);

void encode_simple(BufferedWriter &out, std::string_view s);
void encode_error(BufferedWriter &out, std::string_view s);
void encode_integer(BufferedWriter &out, long long n);
void encode_bulk(BufferedWriter &out, std::string_view s);
void encode_null(BufferedWriter &out);

// Parses a base-10 signed 64-bit integer, rejecting anything else.
bool parse_i64(std::string_view text, long long &out);

// client helpers
RESP convert_inline_to_RESP(const std::string &input);
std::string format_RESP(const RESP &resp);

} // namespace RedisLite
