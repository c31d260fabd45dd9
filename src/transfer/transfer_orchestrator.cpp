#include "transfer/transfer_orchestrator.hpp"
#include <algorithm>
#include <fstream>
#include <functional>
#include <future>
#include <iomanip>
#include <memory>
#include <random>
#include <set>
#include <sstream>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/log/trivial.hpp>
#include "transfer/batch_packer.hpp"
#include "transfer/transfer_error.hpp"

namespace distore {
namespace transfer {

namespace {

// Runs jobs on a bounded pool and hands each result to consume in job order
// on the calling thread
template <typename T, typename Consumer>
void run_in_order(std::size_t workers, const std::vector<std::function<T()>>& jobs, Consumer&& consume) {
  if (jobs.empty()) {
    return;
  }

  boost::asio::thread_pool pool(std::clamp<std::size_t>(workers, 1, jobs.size()));
  std::vector<std::future<T>> results;
  results.reserve(jobs.size());

  for (const auto& job : jobs) {
    auto task = std::make_shared<std::packaged_task<T()>>(job);
    results.push_back(task->get_future());
    boost::asio::post(pool, [task]() { (*task)(); });
  }

  for (std::size_t i = 0; i < results.size(); ++i) {
    consume(i, results[i].get());
  }
  pool.join();
}

store::Bytes read_extent(const Extent& extent) {
  std::ifstream file(extent.path, std::ios::binary);
  if (!file) {
    throw IoError("Uploading: cannot open extent " + extent.path.string());
  }
  store::Bytes data(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>{});
  if (file.bad()) {
    throw IoError("Uploading: read failed for extent " + extent.path.string());
  }
  return data;
}

std::string random_suffix() {
  std::random_device rd;
  std::mt19937_64 gen(rd());
  std::stringstream ss;
  ss << std::hex << std::setw(16) << std::setfill('0') << gen();
  return ss.str();
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TransferOrchestrator::TransferOrchestrator(store::RecordStore& store, const std::string& container,
                                           ProgressChannel& channel, const TransferOptions& options)
  : store_(store)
  , container_(container)
  , channel_(channel)
  , options_(options) {
  BOOST_LOG_TRIVIAL(debug) << "Orchestrator: Created for container " << container_
                           << " with extent size " << options_.extent_size;
}

std::size_t TransferOrchestrator::batch_limit() const {
  std::size_t limit = store_.max_attachments();
  if (options_.batch_limit != 0) {
    limit = std::min(limit, options_.batch_limit);
  }
  if (limit == 0) {
    throw TransferError("Store accepts no attachments per record");
  }
  return limit;
}


//==============================================
// TRANSFERS
//==============================================

std::vector<ChainLink> TransferOrchestrator::upload(const std::filesystem::path& file) {
  BOOST_LOG_TRIVIAL(info) << "Orchestrator: Uploading " << file.string() << " to container " << container_;

  if (options_.extent_size > store_.max_attachment_size()) {
    BOOST_LOG_TRIVIAL(error) << "Orchestrator: Extent size " << options_.extent_size
                             << " exceeds the store attachment limit " << store_.max_attachment_size();
    throw TransferError("Extent size exceeds the store attachment limit");
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(file, ec)) {
    throw IoError("Disassembling: not a regular file: " + file.string());
  }
  const std::string name = file.filename().string();
  // The head is created last in BACKWARD mode, a bad name must fail before any record exists
  ChainRecordCodec::check_name(name);
  const std::size_t limit = batch_limit();

  // Private directory so concurrent uploads of equally named files never collide
  std::filesystem::path work_dir = options_.scratch_dir / ("upload-" + random_suffix());
  std::filesystem::create_directories(work_dir, ec);
  if (ec) {
    throw IoError("Disassembling: cannot create " + work_dir.string() + ": " + ec.message());
  }

  // 1. Split into extents
  begin_phase(Phase::DISASSEMBLING);
  ExtentSplitter splitter(options_.extent_size);
  std::vector<Extent> extents = splitter.split(file, work_dir, [this](double fraction) {
    check_consumer(Phase::DISASSEMBLING);
    report(Phase::DISASSEMBLING, fraction);
  });
  report(Phase::DISASSEMBLING, 1.0);

  std::uint64_t total_size = 0;
  for (const auto& extent : extents) {
    total_size += extent.size;
  }

  // 2. Partition into batches, an empty file still gets a head record
  std::vector<std::vector<Extent>> batches = pack_batches(extents, limit);
  if (batches.empty()) {
    batches.emplace_back();
  }
  BOOST_LOG_TRIVIAL(info) << "Orchestrator: " << extents.size() << " extents packed into "
                          << batches.size() << " records";

  // 3-4. Create and link the records
  std::vector<ChainLink> links = options_.link_mode == LinkMode::BACKWARD
      ? create_backward(batches, name, total_size, extents.size())
      : create_forward(batches, name, total_size, extents.size());

  // 5. Drop local extents, the remote chain stays committed either way
  cleanup(extents, work_dir, links.front().id);

  BOOST_LOG_TRIVIAL(info) << "Orchestrator: Uploaded " << name << " as record " << links.front().id;
  return links;
}

DownloadResult TransferOrchestrator::download(store::RecordId head,
                                              const std::optional<std::filesystem::path>& output) {
  BOOST_LOG_TRIVIAL(info) << "Orchestrator: Downloading record " << head << " from container " << container_;

  begin_phase(Phase::DOWNLOADING);
  store::Record record;
  ChainRecord meta = fetch_head(head, Phase::DOWNLOADING, record);

  DownloadResult result;
  result.name = *meta.name;
  result.output = output ? *output : std::filesystem::path(*meta.name).filename();
  if (result.output.empty()) {
    throw InvalidRecord("Downloading: record " + std::to_string(head) + ": no usable file name");
  }

  const std::uint64_t total_size = *meta.total_size;
  const std::uint64_t extent_count = *meta.extent_count;

  check_consumer(Phase::DOWNLOADING);
  std::ofstream out(result.output, std::ios::binary | std::ios::trunc);
  if (!out) {
    BOOST_LOG_TRIVIAL(error) << "Orchestrator: Cannot create output file " << result.output.string();
    throw IoError("Downloading: cannot create " + result.output.string());
  }

  std::set<store::RecordId> visited{head};
  store::RecordId current = head;

  while (true) {
    ++result.records;
    BOOST_LOG_TRIVIAL(debug) << "Orchestrator: Streaming " << record.attachments.size()
                             << " extents of record " << current;

    std::vector<std::function<store::Bytes()>> jobs;
    for (const auto& attachment : record.attachments) {
      jobs.push_back(attachment.fetch);
    }

    try {
      run_in_order<store::Bytes>(options_.workers, jobs, [&](std::size_t, store::Bytes&& bytes) {
        check_consumer(Phase::DOWNLOADING);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!out) {
          throw IoError("Downloading: write failed for " + result.output.string());
        }
        result.bytes_written += bytes.size();
        ++result.extents;
        report(Phase::DOWNLOADING, total_size == 0
            ? 1.0 : static_cast<double>(result.bytes_written) / static_cast<double>(total_size));
      });
    } catch (const store::StoreError& e) {
      BOOST_LOG_TRIVIAL(error) << "Orchestrator: Attachment fetch failed for record " << current << ": " << e.what();
      throw store::StoreError("Downloading: record " + std::to_string(current)
                              + ": failed to fetch attachment: " + e.what());
    }

    if (!meta.next) {
      break;
    }

    current = *meta.next;
    if (!visited.insert(current).second) {
      BOOST_LOG_TRIVIAL(error) << "Orchestrator: Chain of record " << head << " loops at " << current;
      throw InvalidRecord("Downloading: record " + std::to_string(current) + " appears twice in the chain");
    }
    meta = fetch_record(current, Phase::DOWNLOADING, record);
  }

  if (result.extents < extent_count) {
    BOOST_LOG_TRIVIAL(error) << "Orchestrator: Chain of record " << head << " ended after "
                             << result.extents << " of " << extent_count << " extents";
    throw InvalidRecord("Downloading: chain of record " + std::to_string(head) + " ended after "
                        + std::to_string(result.extents) + " of " + std::to_string(extent_count) + " extents");
  }
  if (result.bytes_written != total_size) {
    throw InvalidRecord("Downloading: chain of record " + std::to_string(head) + " holds "
                        + std::to_string(result.bytes_written) + " bytes, head declares "
                        + std::to_string(total_size));
  }

  out.close();
  if (!out) {
    throw IoError("Downloading: write failed for " + result.output.string());
  }

  report(Phase::DOWNLOADING, 1.0);
  BOOST_LOG_TRIVIAL(info) << "Orchestrator: Downloaded " << result.bytes_written << " bytes from "
                          << result.records << " records into " << result.output.string();
  return result;
}

std::size_t TransferOrchestrator::remove(store::RecordId head) {
  BOOST_LOG_TRIVIAL(info) << "Orchestrator: Deleting chain " << head << " from container " << container_;

  begin_phase(Phase::DELETING);
  store::Record record;
  ChainRecord meta = fetch_head(head, Phase::DELETING, record);

  // Progress counts the extents held by deleted records, the batch limit the
  // chain was uploaded with is unknown here
  const std::uint64_t extent_count = *meta.extent_count;

  std::set<store::RecordId> visited{head};
  store::RecordId current = head;
  std::size_t removed = 0;
  std::uint64_t removed_extents = 0;

  while (true) {
    check_consumer(Phase::DELETING);
    // Read the successor before the record disappears
    std::optional<store::RecordId> next = meta.next;

    try {
      store_.remove(container_, current);
    } catch (const store::StoreError& e) {
      BOOST_LOG_TRIVIAL(error) << "Orchestrator: Failed to delete record " << current << ": " << e.what();
      throw store::StoreError("Deleting: record " + std::to_string(current) + ": " + e.what());
    }
    ++removed;
    removed_extents += record.attachments.size();
    if (extent_count > 0) {
      report(Phase::DELETING, static_cast<double>(removed_extents) / static_cast<double>(extent_count));
    }

    if (!next) {
      break;
    }
    if (!visited.insert(*next).second) {
      throw InvalidRecord("Deleting: record " + std::to_string(*next) + " appears twice in the chain");
    }
    current = *next;
    meta = fetch_record(current, Phase::DELETING, record);
  }

  report(Phase::DELETING, 1.0);
  BOOST_LOG_TRIVIAL(info) << "Orchestrator: Deleted " << removed << " records of chain " << head;
  return removed;
}


//==============================================
// PROGRESS
//==============================================

void TransferOrchestrator::begin_phase(Phase phase) {
  reported_[phase] = 0.0;
  report(phase, 0.0);
}

void TransferOrchestrator::report(Phase phase, double fraction) {
  double& last = reported_[phase];
  last = std::max(last, std::clamp(fraction, 0.0, 1.0));

  TransferEvent event;
  event.type = EventType::PROGRESS;
  event.progress = {phase, phase_label(phase), last};
  if (!channel_.produce(event)) {
    BOOST_LOG_TRIVIAL(debug) << "Orchestrator: Progress dropped, consumer disconnected";
  }
}

void TransferOrchestrator::check_consumer(Phase phase) const {
  if (channel_.is_closed()) {
    BOOST_LOG_TRIVIAL(warning) << "Orchestrator: Consumer disconnected, abandoning " << phase_label(phase);
    throw TransferAborted(std::string(phase_label(phase)) + ": progress consumer disconnected");
  }
}


//==============================================
// UPLOAD STEPS
//==============================================

std::vector<store::OutgoingAttachment> TransferOrchestrator::prepare_attachments(
    const std::vector<Extent>& batch) {
  std::vector<std::function<store::Bytes()>> jobs;
  for (const auto& extent : batch) {
    jobs.push_back([extent]() { return read_extent(extent); });
  }

  std::vector<store::OutgoingAttachment> attachments;
  attachments.reserve(batch.size());
  run_in_order<store::Bytes>(options_.workers, jobs, [&](std::size_t index, store::Bytes&& bytes) {
    attachments.push_back({batch[index].path.filename().string(), std::move(bytes)});
  });
  return attachments;
}

ChainRecord TransferOrchestrator::link_record(std::size_t position, const std::optional<store::RecordId>& next,
                                              const std::string& name, std::uint64_t total_size,
                                              std::uint64_t extent_count) const {
  ChainRecord record;
  if (position == 0) {
    record.name = name;
    record.total_size = total_size;
    record.extent_count = extent_count;
  }
  record.next = next;
  return record;
}

std::vector<ChainLink> TransferOrchestrator::create_backward(const std::vector<std::vector<Extent>>& batches,
                                                             const std::string& name, std::uint64_t total_size,
                                                             std::uint64_t extent_count) {
  const std::size_t count = batches.size();
  std::vector<ChainLink> links(count);
  std::optional<store::RecordId> next;

  begin_phase(Phase::UPLOADING);
  for (std::size_t i = count; i-- > 0;) {
    check_consumer(Phase::UPLOADING);
    ChainRecord record = link_record(i, next, name, total_size, extent_count);
    std::vector<store::OutgoingAttachment> attachments = prepare_attachments(batches[i]);

    store::Record created;
    try {
      created = store_.create(container_, attachments, ChainRecordCodec::encode(record));
    } catch (const store::StoreError& e) {
      BOOST_LOG_TRIVIAL(error) << "Orchestrator: Failed to create record for batch " << i + 1 << ": " << e.what();
      throw store::StoreError("Uploading: batch " + std::to_string(i + 1) + "/" + std::to_string(count)
                              + " of " + name + ": " + e.what());
    }

    BOOST_LOG_TRIVIAL(debug) << "Orchestrator: Batch " << i + 1 << "/" << count << " stored as record " << created.id;
    links[i] = {created.id, record, batches[i].size()};
    next = created.id;
    report(Phase::UPLOADING, static_cast<double>(count - i) / static_cast<double>(count));
  }

  // Records already carry their final content
  begin_phase(Phase::EDITING);
  report(Phase::EDITING, 1.0);
  return links;
}

std::vector<ChainLink> TransferOrchestrator::create_forward(const std::vector<std::vector<Extent>>& batches,
                                                            const std::string& name, std::uint64_t total_size,
                                                            std::uint64_t extent_count) {
  const std::size_t count = batches.size();
  std::vector<ChainLink> links(count);
  const std::string placeholder = ChainRecordCodec::encode(ChainRecord{});

  begin_phase(Phase::UPLOADING);
  for (std::size_t i = 0; i < count; ++i) {
    check_consumer(Phase::UPLOADING);
    std::vector<store::OutgoingAttachment> attachments = prepare_attachments(batches[i]);

    store::Record created;
    try {
      created = store_.create(container_, attachments, placeholder);
    } catch (const store::StoreError& e) {
      BOOST_LOG_TRIVIAL(error) << "Orchestrator: Failed to create record for batch " << i + 1 << ": " << e.what();
      throw store::StoreError("Uploading: batch " + std::to_string(i + 1) + "/" + std::to_string(count)
                              + " of " + name + ": " + e.what());
    }

    links[i].id = created.id;
    links[i].attachment_count = batches[i].size();
    report(Phase::UPLOADING, static_cast<double>(i + 1) / static_cast<double>(count));
  }

  // The id of record k+1 is known only now
  begin_phase(Phase::EDITING);
  for (std::size_t i = 0; i < count; ++i) {
    check_consumer(Phase::EDITING);
    std::optional<store::RecordId> next;
    if (i + 1 < count) {
      next = links[i + 1].id;
    }
    links[i].record = link_record(i, next, name, total_size, extent_count);

    try {
      store_.edit(container_, links[i].id, ChainRecordCodec::encode(links[i].record));
    } catch (const store::StoreError& e) {
      BOOST_LOG_TRIVIAL(error) << "Orchestrator: Failed to edit record " << links[i].id << ": " << e.what();
      throw store::StoreError("Editing: record " + std::to_string(links[i].id) + ": " + e.what());
    }
    report(Phase::EDITING, static_cast<double>(i + 1) / static_cast<double>(count));
  }

  return links;
}

void TransferOrchestrator::cleanup(const std::vector<Extent>& extents, const std::filesystem::path& work_dir,
                                   store::RecordId head) {
  std::vector<std::string> failures;
  std::error_code ec;

  for (const auto& extent : extents) {
    BOOST_LOG_TRIVIAL(debug) << "Orchestrator: Removing " << extent.path.string();
    std::filesystem::remove(extent.path, ec);
    if (ec) {
      failures.push_back(extent.path.string() + " (" + ec.message() + ")");
    }
  }
  std::filesystem::remove(work_dir, ec);
  if (ec) {
    failures.push_back(work_dir.string() + " (" + ec.message() + ")");
  }

  if (!failures.empty()) {
    std::string joined;
    for (const auto& failure : failures) {
      joined += (joined.empty() ? "" : ", ") + failure;
    }
    BOOST_LOG_TRIVIAL(error) << "Orchestrator: Cleanup failed after upload of record " << head << ": " << joined;
    throw IoError("record " + std::to_string(head) + " uploaded but local extents could not be removed: " + joined);
  }
}


//==============================================
// CHAIN WALK
//==============================================

ChainRecord TransferOrchestrator::fetch_record(store::RecordId id, Phase phase, store::Record& record) {
  check_consumer(phase);
  const std::string context = std::string(phase_label(phase)) + ": record " + std::to_string(id);

  try {
    record = store_.get(container_, id);
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Orchestrator: Failed to fetch record " << id << ": " << e.what();
    throw store::StoreError(context + ": " + e.what());
  }

  try {
    return ChainRecordCodec::decode(record.content);
  } catch (const MalformedRecord& e) {
    BOOST_LOG_TRIVIAL(error) << "Orchestrator: Record " << id << " cannot be decoded: " << e.what();
    throw MalformedRecord(context + ": " + e.what());
  }
}

ChainRecord TransferOrchestrator::fetch_head(store::RecordId id, Phase phase, store::Record& record) {
  ChainRecord meta = fetch_record(id, phase, record);
  if (!meta.is_head()) {
    BOOST_LOG_TRIVIAL(error) << "Orchestrator: Record " << id << " is not the head of a chain";
    throw InvalidRecord(std::string(phase_label(phase)) + ": record " + std::to_string(id)
                        + " is not the head of a chain (name, size and len are required)");
  }
  return meta;
}

} // namespace transfer
} // namespace distore
