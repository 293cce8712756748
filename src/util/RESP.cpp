#include "RESP.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace RedisLite {

static constexpr long long RESERVE_LIMIT = 1024;

static std::string read_line_CRLF(BufferedReader &in) {
  auto line = in.read_line(MAX_INLINE_LEN);
  if (!line) {
    throw ProtocolError("line too long");
  }
  return *line;
}

bool parse_i64(std::string_view text, long long &out) {
  if (text.empty()) {
    return false;
  }
  const char *first = text.data();
  const char *last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, out, 10);
  return ec == std::errc() && ptr == last;
}

static long long stoll_safe(const std::string &line, const char *what) {
  long long val = 0;
  if (!parse_i64(line, val)) {
    throw ProtocolError(std::string("invalid ") + what + " '" + line + "'");
  }
  return val;
}

static RESP decode_RESP_internal(BufferedReader &in, int depth) {
  if (depth > MAX_RESP_DEPTH) {
    throw ProtocolError("nesting depth exceeded");
  }

  char prefix = in.read_byte();

  switch (prefix) {
  case '+':
    return RESP::simple(read_line_CRLF(in));
  case '-':
    return RESP::error(read_line_CRLF(in));
  case ':':
    return RESP::number(stoll_safe(read_line_CRLF(in), "integer"));
  case '$': {
    long long len = stoll_safe(read_line_CRLF(in), "bulk length");

    if (len == -1) {
      return RESP::null_bulk();
    }

    if (len < 0 || len > MAX_BULK_LEN) {
      throw ProtocolError("invalid bulk length");
    }

    std::string payload = in.read_exact(static_cast<size_t>(len));
    std::string terminator = in.read_exact(2);
    if (terminator != "\r\n") {
      throw ProtocolError("bulk string missing trailing CRLF");
    }
    return RESP::bulk(std::move(payload));
  }
  case '*': {
    long long count = stoll_safe(read_line_CRLF(in), "multibulk length");

    if (count < 0 || count > MAX_ARRAY_COUNT) {
      throw ProtocolError("invalid multibulk length");
    }

    RESP resp = RESP::array({});
    // the declared count is untrusted; grow as elements arrive
    resp.elements.reserve(
        static_cast<size_t>(std::min<long long>(count, RESERVE_LIMIT)));
    for (long long i = 0; i < count; ++i) {
      resp.elements.emplace_back(decode_RESP_internal(in, depth + 1));
    }
    return resp;
  }
  default: {
    // skip to the end of the line so the next decode starts clean
    if (prefix != '\n') {
      in.read_line(MAX_INLINE_LEN);
    }
    char shown[8];
    if (std::isprint(static_cast<unsigned char>(prefix))) {
      std::snprintf(shown, sizeof(shown), "%c", prefix);
    } else {
      std::snprintf(shown, sizeof(shown), "\\x%02x",
                    static_cast<unsigned char>(prefix));
    }
    throw ProtocolError(std::string("unexpected prefix '") + shown + "'");
  }
  }
}

RESP decode_RESP(BufferedReader &in) { return decode_RESP_internal(in, 0); }

static void serialize_scalar(std::string &out, const RESP &resp) {
  switch (resp.resp_type) {
  case RESP::type::SIMPLE_STRING:
    out += "+" + resp.str + "\r\n";
    return;
  case RESP::type::ERROR:
    out += "-" + resp.str + "\r\n";
    return;
  case RESP::type::INTEGER:
    out += ":" + std::to_string(resp.integer) + "\r\n";
    return;
  case RESP::type::BULK_STRING:
    if (resp.is_null) {
      out += "$-1\r\n";
    } else {
      out += "$" + std::to_string(resp.str.size()) + "\r\n";
      out += resp.str;
      out += "\r\n";
    }
    return;
  case RESP::type::ARRAY:
    throw std::invalid_argument("nested arrays are not supported");
  }
  throw std::invalid_argument("unknown RESP type");
}

// convert a RESP struct into its wire form
std::string serialize_RESP(const RESP &resp) {
  std::string out;
  if (resp.resp_type != RESP::type::ARRAY) {
    serialize_scalar(out, resp);
    return out;
  }

  out += "*" + std::to_string(resp.elements.size()) + "\r\n";
  for (const auto &element : resp.elements) {
    serialize_scalar(out, element);
  }
  return out;
}

void encode_RESP(BufferedWriter &out, const RESP &resp) {
  out.write(serialize_RESP(resp));
}

void encode_simple(BufferedWriter &out, std::string_view s) {
  out.write("+");
  out.write(s);
  out.write("\r\n");
}

void encode_error(BufferedWriter &out, std::string_view s) {
  out.write("-");
  out.write(s);
  out.write("\r\n");
}

void encode_integer(BufferedWriter &out, long long n) {
  out.write(":" + std::to_string(n) + "\r\n");
}

void encode_bulk(BufferedWriter &out, std::string_view s) {
  out.write("$" + std::to_string(s.size()) + "\r\n");
  out.write(s);
  out.write("\r\n");
}

void encode_null(BufferedWriter &out) { out.write("$-1\r\n"); }

// splits a typed line into an array of bulk strings, "double quotes" group
RESP convert_inline_to_RESP(const std::string &input) {
  RESP resp = RESP::array({});
  std::string word;
  bool in_word = false;
  bool in_quotes = false;

  for (size_t i = 0; i < input.size(); ++i) {
    char c = input[i];
    if (in_quotes) {
      if (c == '\\' && i + 1 < input.size()) {
        char next = input[++i];
        switch (next) {
        case 'n':
          word += '\n';
          break;
        case 'r':
          word += '\r';
          break;
        case 't':
          word += '\t';
          break;
        default:
          word += next;
          break;
        }
      } else if (c == '"') {
        in_quotes = false;
      } else {
        word += c;
      }
    } else if (c == '"') {
      in_quotes = true;
      in_word = true;
    } else if (std::isspace(static_cast<unsigned char>(c))) {
      if (in_word) {
        resp.elements.emplace_back(RESP::bulk(std::move(word)));
        word.clear();
        in_word = false;
      }
    } else {
      word += c;
      in_word = true;
    }
  }

  if (in_quotes) {
    throw std::invalid_argument("unbalanced quotes");
  }
  if (in_word) {
    resp.elements.emplace_back(RESP::bulk(std::move(word)));
  }
  return resp;
}

static void format_RESP_internal(std::ostringstream &oss, const RESP &resp,
                                 const std::string &indent) {
  switch (resp.resp_type) {
  case RESP::type::SIMPLE_STRING:
    oss << resp.str;
    break;
  case RESP::type::ERROR:
    oss << "(error) " << resp.str;
    break;
  case RESP::type::INTEGER:
    oss << "(integer) " << resp.integer;
    break;
  case RESP::type::BULK_STRING:
    if (resp.is_null) {
      oss << "(nil)";
    } else {
      oss << '"' << resp.str << '"';
    }
    break;
  case RESP::type::ARRAY:
    if (resp.elements.empty()) {
      oss << "(empty array)";
      break;
    }
    for (size_t i = 0; i < resp.elements.size(); ++i) {
      if (i > 0) {
        oss << '\n' << indent;
      }
      std::string label = std::to_string(i + 1) + ") ";
      oss << label;
      format_RESP_internal(oss, resp.elements[i],
                           indent + std::string(label.size(), ' '));
    }
    break;
  }
}

// renders a reply the way redis-cli prints it
std::string format_RESP(const RESP &resp) {
  std::ostringstream oss;
  format_RESP_internal(oss, resp, "");
  return oss.str();
}

} // namespace RedisLite
