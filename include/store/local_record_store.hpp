#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>
#include "store/record_store.hpp"

namespace distore {
namespace store {

// Record store kept on the local filesystem. Record text and attachment
// manifests live under containers/<container>/<id>/, attachment bytes are
// content-addressed under blobs/.
class LocalRecordStore : public RecordStore {
public:
  static constexpr std::size_t DEFAULT_MAX_ATTACHMENTS = 10;
  static constexpr std::uint64_t DEFAULT_MAX_ATTACHMENT_SIZE = 25ull * 1000 * 1000;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit LocalRecordStore(const std::filesystem::path& base_path,
                            std::size_t max_attachments = DEFAULT_MAX_ATTACHMENTS,
                            std::uint64_t max_attachment_size = DEFAULT_MAX_ATTACHMENT_SIZE);


  // ---- RECORD OPERATIONS ----
  Record create(const std::string& container,
                const std::vector<OutgoingAttachment>& attachments,
                const std::string& content) override;
  void edit(const std::string& container, RecordId id, const std::string& content) override;
  Record get(const std::string& container, RecordId id) override;
  void remove(const std::string& container, RecordId id) override;


  // ---- PAGINATION ----
  std::vector<Record> list_page(const std::string& container,
                                std::optional<RecordId> before,
                                std::uint32_t limit) override;


  // ---- LIMITS ----
  std::size_t max_attachments() const override { return max_attachments_; }
  std::uint64_t max_attachment_size() const override { return max_attachment_size_; }

  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path base_path_;
  std::size_t max_attachments_;
  std::uint64_t max_attachment_size_;
  mutable std::mutex mutex_;


  // ---- RECORD LAYOUT ----
  std::filesystem::path container_path(const std::string& container) const;
  std::filesystem::path record_path(const std::string& container, RecordId id) const;
  // Reads content and manifest of a record, caller holds mutex_
  Record load_record(const std::string& container, RecordId id) const;
  // Reserves the next id of the container, caller holds mutex_
  RecordId allocate_id(const std::string& container);


  // ---- CAS STORAGE SUPPORT ----
  // Generate SHA-256 hash from key using OpenSSL EVP
  std::string hash_key(const std::string& key) const;
  // {base_path}/blobs/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}
  std::filesystem::path get_path_for_hash(const std::string& hash) const;
  std::filesystem::path blob_path(const std::string& container, RecordId id,
                                  std::size_t index, const std::string& filename) const;
  // Removes empty directories from path up to the blob root
  void prune_empty_dirs(std::filesystem::path path) const;


  // ---- UTILITY METHODS ----
  void check_directory_exists(const std::filesystem::path& path) const;
  void validate_container(const std::string& container) const;
  static void write_file(const std::filesystem::path& path, const char* data, std::size_t size);
  static std::string read_text(const std::filesystem::path& path);
};

} // namespace store
} // namespace distore
