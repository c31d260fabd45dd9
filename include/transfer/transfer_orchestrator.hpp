#ifndef DISTORE_TRANSFER_TRANSFER_ORCHESTRATOR_HPP
#define DISTORE_TRANSFER_TRANSFER_ORCHESTRATOR_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "store/record_store.hpp"
#include "transfer/chain_record.hpp"
#include "transfer/extent_splitter.hpp"
#include "transfer/progress_channel.hpp"

namespace distore {
namespace transfer {

// How upload assigns the next pointers of a chain
enum class LinkMode : uint8_t {
  // Create records tail first so each one is written with its final content
  BACKWARD = 0,
  // Create records head first with placeholder content, then edit each one
  FORWARD_EDIT
};

struct TransferOptions {
  std::size_t extent_size{ExtentSplitter::DEFAULT_EXTENT_SIZE};
  // Extents per record, 0 uses the store's attachment limit
  std::size_t batch_limit{0};
  LinkMode link_mode{LinkMode::BACKWARD};
  // Threads used to read or fetch the attachments of one record
  std::size_t workers{4};
  // Extents are written to a private directory below this one
  std::filesystem::path scratch_dir{std::filesystem::temp_directory_path() / "distore"};
};

// One record of an uploaded chain, in chain order
struct ChainLink {
  store::RecordId id{0};
  ChainRecord record;
  std::size_t attachment_count{0};
};

struct DownloadResult {
  std::string name;
  std::filesystem::path output;
  std::uint64_t bytes_written{0};
  std::uint64_t extents{0};
  std::size_t records{0};
};

// Drives upload, download and delete of record chains in one container.
// Progress of every phase is pushed to the channel; a closed channel aborts
// the transfer at its next store call or file operation.
class TransferOrchestrator {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TransferOrchestrator(store::RecordStore& store, const std::string& container,
                       ProgressChannel& channel, const TransferOptions& options = {});


  // ---- TRANSFERS ----
  // Stores the file as a chain and returns its records head first. The head
  // id is the handle for download, list and remove.
  std::vector<ChainLink> upload(const std::filesystem::path& file);
  // Rebuilds the file whose chain starts at head. Writes to output, or to the
  // recorded file name in the working directory.
  DownloadResult download(store::RecordId head,
                          const std::optional<std::filesystem::path>& output = std::nullopt);
  // Deletes every record of the chain starting at head, returns the count
  std::size_t remove(store::RecordId head);


  // ---- GETTERS ----
  // Extents per record for this store and options
  std::size_t batch_limit() const;
  const std::string& container() const { return container_; }

private:
  // ---- PARAMETERS ----
  store::RecordStore& store_;
  std::string container_;
  ProgressChannel& channel_;
  TransferOptions options_;
  // Last fraction reported for each phase, keeps a phase non-decreasing
  std::map<Phase, double> reported_;


  // ---- PROGRESS ----
  void begin_phase(Phase phase);
  void report(Phase phase, double fraction);
  // Throws TransferAborted when the consumer closed the channel
  void check_consumer(Phase phase) const;


  // ---- UPLOAD STEPS ----
  std::vector<store::OutgoingAttachment> prepare_attachments(const std::vector<Extent>& batch);
  ChainRecord link_record(std::size_t position, const std::optional<store::RecordId>& next,
                          const std::string& name, std::uint64_t total_size,
                          std::uint64_t extent_count) const;
  // Tail first, every record created with its final content
  std::vector<ChainLink> create_backward(const std::vector<std::vector<Extent>>& batches,
                                         const std::string& name, std::uint64_t total_size,
                                         std::uint64_t extent_count);
  // Head first with placeholders, then the edit pass
  std::vector<ChainLink> create_forward(const std::vector<std::vector<Extent>>& batches,
                                        const std::string& name, std::uint64_t total_size,
                                        std::uint64_t extent_count);
  void cleanup(const std::vector<Extent>& extents, const std::filesystem::path& work_dir,
               store::RecordId head);


  // ---- CHAIN WALK ----
  // Fetches and decodes one record, adding phase and id to any error
  ChainRecord fetch_record(store::RecordId id, Phase phase, store::Record& record);
  // Fetches a record that must be a chain head
  ChainRecord fetch_head(store::RecordId id, Phase phase, store::Record& record);
};

} // namespace transfer
} // namespace distore

#endif // DISTORE_TRANSFER_TRANSFER_ORCHESTRATOR_HPP
