#include "transfer/chain_record.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <limits>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace distore {
namespace transfer {

//==============================================
// SERIALIZATION AND DESERIALIZATION
//==============================================

std::string ChainRecordCodec::encode(const ChainRecord& record) {
  std::ostringstream out;
  out << RECORD_MARKER << '\n';

  if (record.name) {
    check_name(*record.name);
    out << "name=" << *record.name << '\n';
  }
  if (record.total_size) {
    out << "size=" << *record.total_size << '\n';
  }
  if (record.extent_count) {
    out << "len=" << *record.extent_count << '\n';
  }
  if (record.next) {
    out << "next=" << *record.next << '\n';
  }

  return out.str();
}

ChainRecord ChainRecordCodec::decode(const std::string& content) {
  ChainRecord record;
  if (content.empty()) {
    return record;
  }

  std::istringstream in(content);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty() || line.front() == '#') {
      continue;
    }

    std::size_t separator = line.find('=');
    if (separator == std::string::npos) {
      BOOST_LOG_TRIVIAL(debug) << "Chain codec: Line without separator: " << line;
      throw MalformedRecord("line without '=': \"" + line + "\"");
    }

    std::string key = line.substr(0, separator);
    std::string value = line.substr(separator + 1);

    if (key == "name") {
      record.name = value;
    } else if (key == "size") {
      record.total_size = parse_u64(key, value);
    } else if (key == "len") {
      record.extent_count = parse_u64(key, value);
    } else if (key == "next") {
      record.next = parse_u64(key, value);
    }
    // Other keys belong to newer writers
  }

  return record;
}


void ChainRecordCodec::check_name(const std::string& name) {
  if (name.find_first_of("\r\n") != std::string::npos) {
    BOOST_LOG_TRIVIAL(error) << "Chain codec: File name contains a line break";
    throw MalformedRecord("file name must not contain a line break");
  }
}


//==============================================
// QUERY METHODS
//==============================================

bool ChainRecordCodec::has_marker(const std::string& content) {
  const std::size_t length = std::strlen(RECORD_MARKER);
  if (content.compare(0, length, RECORD_MARKER) != 0) {
    return false;
  }
  return content.size() == length || content[length] == '\n' || content[length] == '\r';
}

std::uint64_t ChainRecordCodec::parse_u64(const std::string& key, const std::string& value) {
  bool digits_only = !value.empty() && std::all_of(value.begin(), value.end(),
      [](unsigned char c) { return std::isdigit(c) != 0; });
  if (!digits_only) {
    throw MalformedRecord("value of '" + key + "' is not an unsigned integer: \"" + value + "\"");
  }

  try {
    unsigned long long parsed = std::stoull(value);
    if (parsed > std::numeric_limits<std::uint64_t>::max()) {
      throw std::out_of_range(key);
    }
    return static_cast<std::uint64_t>(parsed);
  } catch (const std::out_of_range&) {
    throw MalformedRecord("value of '" + key + "' is out of range: \"" + value + "\"");
  }
}

} // namespace transfer
} // namespace distore
