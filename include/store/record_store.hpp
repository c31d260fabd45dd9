#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace distore {
namespace store {

// Identifier assigned by the store when a record is created
using RecordId = std::uint64_t;
using Bytes = std::vector<uint8_t>;
// Lazily pulls the bytes of one attachment from the store
using AttachmentFetcher = std::function<Bytes()>;

// Attachment supplied when creating a record
struct OutgoingAttachment {
  std::string filename;
  Bytes data;
};

// Attachment as returned by the store
struct Attachment {
  std::string filename;
  std::uint64_t size{0};
  AttachmentFetcher fetch;
};

struct Record {
  RecordId id{0};
  std::string content;
  std::vector<Attachment> attachments;
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// Message-oriented record store the transfer protocol is layered on.
// Every operation either succeeds or throws StoreError.
class RecordStore {
public:
  virtual ~RecordStore() = default;

  // ---- RECORD OPERATIONS ----
  // Appends a record to the container and returns it with its assigned id
  virtual Record create(const std::string& container,
                        const std::vector<OutgoingAttachment>& attachments,
                        const std::string& content) = 0;
  // Replaces the text content of an existing record
  virtual void edit(const std::string& container, RecordId id, const std::string& content) = 0;
  virtual Record get(const std::string& container, RecordId id) = 0;
  virtual void remove(const std::string& container, RecordId id) = 0;

  // ---- PAGINATION ----
  // Returns up to limit records older than before (or the newest ones), newest first
  virtual std::vector<Record> list_page(const std::string& container,
                                        std::optional<RecordId> before,
                                        std::uint32_t limit) = 0;

  // ---- LIMITS ----
  virtual std::size_t max_attachments() const = 0;
  virtual std::uint64_t max_attachment_size() const = 0;
};

} // namespace store
} // namespace distore
