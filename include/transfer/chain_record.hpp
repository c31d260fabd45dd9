#ifndef DISTORE_TRANSFER_CHAIN_RECORD_HPP
#define DISTORE_TRANSFER_CHAIN_RECORD_HPP

#include <cstdint>
#include <optional>
#include <string>
#include "store/record_store.hpp"
#include "transfer/transfer_error.hpp"

namespace distore {
namespace transfer {

// First line of every record written by this protocol
inline constexpr const char* RECORD_MARKER =
    "### This message is generated by Distore. Do not edit this message.";

// Metadata carried by one record of a chain. Only the head has name, size
// and extent count; any record may point at its successor.
struct ChainRecord {
  std::optional<std::string> name;
  std::optional<std::uint64_t> total_size;
  std::optional<std::uint64_t> extent_count;
  std::optional<store::RecordId> next;

  bool is_head() const { return name && total_size && extent_count; }
  bool is_tail() const { return !next; }

  bool operator==(const ChainRecord& other) const {
    return name == other.name && total_size == other.total_size
        && extent_count == other.extent_count && next == other.next;
  }
};

class ChainRecordCodec {
public:
  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Writes the marker line followed by one key=value line per present field
  static std::string encode(const ChainRecord& record);
  // Parses key=value lines, skipping comments, blank lines and unknown keys.
  // Throws MalformedRecord on a line without '=' or a bad numeric value.
  static ChainRecord decode(const std::string& content);

  // Throws MalformedRecord if name cannot be written on a name= line
  static void check_name(const std::string& name);

  // ---- QUERY METHODS ----
  // True if content starts with the protocol marker line
  static bool has_marker(const std::string& content);

private:
  static std::uint64_t parse_u64(const std::string& key, const std::string& value);
};

} // namespace transfer
} // namespace distore

#endif // DISTORE_TRANSFER_CHAIN_RECORD_HPP
