#include "store/local_record_store.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>
#include <iomanip>
#include <sstream>
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace distore {
namespace store {

namespace {

constexpr const char* CONTENT_FILE = "content";
constexpr const char* MANIFEST_FILE = "manifest";
constexpr const char* NEXT_ID_FILE = "next_id";

bool is_record_dir_name(const std::string& name) {
  return !name.empty() && std::all_of(name.begin(), name.end(),
                                      [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with base directory path and ensure it exists
LocalRecordStore::LocalRecordStore(const std::filesystem::path& base_path,
                                   std::size_t max_attachments,
                                   std::uint64_t max_attachment_size)
  : base_path_(base_path)
  , max_attachments_(max_attachments)
  , max_attachment_size_(max_attachment_size) {
  BOOST_LOG_TRIVIAL(info) << "Record store: Initializing local record store at: " << base_path_.string();
  try {
    check_directory_exists(base_path_ / "containers");
    check_directory_exists(base_path_ / "blobs");
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Record store: Failed to create store directories: " << e.what();
    throw StoreError("Record store: Failed to create store directories: " + std::string(e.what()));
  }
}


//==============================================
// RECORD OPERATIONS
//==============================================

Record LocalRecordStore::create(const std::string& container,
                                const std::vector<OutgoingAttachment>& attachments,
                                const std::string& content) {
  validate_container(container);

  if (attachments.size() > max_attachments_) {
    BOOST_LOG_TRIVIAL(error) << "Record store: Too many attachments: " << attachments.size()
                             << " (limit " << max_attachments_ << ")";
    throw StoreError("Record store: Too many attachments for one record");
  }
  for (const auto& attachment : attachments) {
    if (attachment.data.size() > max_attachment_size_) {
      BOOST_LOG_TRIVIAL(error) << "Record store: Attachment " << attachment.filename
                               << " exceeds size limit: " << attachment.data.size();
      throw StoreError("Record store: Attachment too large: " + attachment.filename);
    }
    if (attachment.filename.empty() || attachment.filename.find('\n') != std::string::npos) {
      throw StoreError("Record store: Invalid attachment filename");
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  RecordId id = allocate_id(container);
  std::filesystem::path dir = record_path(container, id);

  try {
    check_directory_exists(dir);

    // Write attachment blobs first, the manifest lists them in order
    std::ostringstream manifest;
    for (std::size_t i = 0; i < attachments.size(); ++i) {
      const auto& attachment = attachments[i];
      std::filesystem::path path = blob_path(container, id, i, attachment.filename);
      check_directory_exists(path.parent_path());
      write_file(path, reinterpret_cast<const char*>(attachment.data.data()), attachment.data.size());
      manifest << attachment.data.size() << '\t' << attachment.filename << '\n';
    }

    std::string manifest_text = manifest.str();
    write_file(dir / MANIFEST_FILE, manifest_text.data(), manifest_text.size());
    write_file(dir / CONTENT_FILE, content.data(), content.size());
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Record store: Failed to create record " << id << ": " << e.what();
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    throw StoreError("Record store: Failed to create record: " + std::string(e.what()));
  }

  BOOST_LOG_TRIVIAL(info) << "Record store: Created record " << id << " in container " << container
                          << " with " << attachments.size() << " attachments";
  return load_record(container, id);
}

void LocalRecordStore::edit(const std::string& container, RecordId id, const std::string& content) {
  validate_container(container);
  std::lock_guard<std::mutex> lock(mutex_);

  std::filesystem::path dir = record_path(container, id);
  if (!std::filesystem::exists(dir / CONTENT_FILE)) {
    BOOST_LOG_TRIVIAL(error) << "Record store: Record not found: " << id;
    throw StoreError("Record store: Record not found: " + std::to_string(id));
  }

  write_file(dir / CONTENT_FILE, content.data(), content.size());
  BOOST_LOG_TRIVIAL(debug) << "Record store: Edited record " << id;
}

Record LocalRecordStore::get(const std::string& container, RecordId id) {
  validate_container(container);
  std::lock_guard<std::mutex> lock(mutex_);
  return load_record(container, id);
}

void LocalRecordStore::remove(const std::string& container, RecordId id) {
  validate_container(container);
  std::lock_guard<std::mutex> lock(mutex_);

  Record record = load_record(container, id);

  try {
    for (std::size_t i = 0; i < record.attachments.size(); ++i) {
      std::filesystem::path path = blob_path(container, id, i, record.attachments[i].filename);
      std::filesystem::remove(path);
      prune_empty_dirs(path.parent_path());
    }
    std::filesystem::remove_all(record_path(container, id));
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Record store: Failed to remove record " << id << ": " << e.what();
    throw StoreError("Record store: Failed to remove record: " + std::string(e.what()));
  }

  BOOST_LOG_TRIVIAL(info) << "Record store: Removed record " << id << " from container " << container;
}


//==============================================
// PAGINATION
//==============================================

std::vector<Record> LocalRecordStore::list_page(const std::string& container,
                                                std::optional<RecordId> before,
                                                std::uint32_t limit) {
  validate_container(container);
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<Record> page;
  std::filesystem::path dir = container_path(container);
  if (!std::filesystem::exists(dir)) {
    return page;
  }

  std::vector<RecordId> ids;
  try {
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
      std::string name = entry.path().filename().string();
      if (!entry.is_directory() || !is_record_dir_name(name)) {
        continue;
      }
      RecordId id = std::stoull(name);
      if (!before || id < *before) {
        ids.push_back(id);
      }
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Record store: Failed to scan container " << container << ": " << e.what();
    throw StoreError("Record store: Failed to scan container: " + std::string(e.what()));
  }

  // Newest first
  std::sort(ids.begin(), ids.end(), std::greater<RecordId>());
  if (ids.size() > limit) {
    ids.resize(limit);
  }

  for (RecordId id : ids) {
    page.push_back(load_record(container, id));
  }

  BOOST_LOG_TRIVIAL(debug) << "Record store: Listed " << page.size() << " records from " << container;
  return page;
}


//==============================================
// RECORD LAYOUT
//==============================================

std::filesystem::path LocalRecordStore::container_path(const std::string& container) const {
  return base_path_ / "containers" / container;
}

std::filesystem::path LocalRecordStore::record_path(const std::string& container, RecordId id) const {
  return container_path(container) / std::to_string(id);
}

Record LocalRecordStore::load_record(const std::string& container, RecordId id) const {
  std::filesystem::path dir = record_path(container, id);
  if (!std::filesystem::exists(dir / CONTENT_FILE)) {
    BOOST_LOG_TRIVIAL(error) << "Record store: Record not found: " << id;
    throw StoreError("Record store: Record not found: " + std::to_string(id));
  }

  Record record;
  record.id = id;
  record.content = read_text(dir / CONTENT_FILE);

  std::istringstream manifest(read_text(dir / MANIFEST_FILE));
  std::string line;
  std::size_t index = 0;
  while (std::getline(manifest, line)) {
    if (line.empty()) {
      continue;
    }
    std::size_t tab = line.find('\t');
    if (tab == std::string::npos) {
      throw StoreError("Record store: Corrupt manifest for record " + std::to_string(id));
    }

    Attachment attachment;
    attachment.size = std::stoull(line.substr(0, tab));
    attachment.filename = line.substr(tab + 1);

    std::filesystem::path path = blob_path(container, id, index, attachment.filename);
    attachment.fetch = [path]() -> Bytes {
      std::ifstream file(path, std::ios::binary);
      if (!file) {
        BOOST_LOG_TRIVIAL(error) << "Record store: Attachment blob missing: " << path.string();
        throw StoreError("Record store: Failed to open attachment: " + path.string());
      }
      return Bytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    };

    record.attachments.push_back(std::move(attachment));
    ++index;
  }

  return record;
}

RecordId LocalRecordStore::allocate_id(const std::string& container) {
  std::filesystem::path dir = container_path(container);
  try {
    check_directory_exists(dir);
  } catch (const std::filesystem::filesystem_error& e) {
    throw StoreError("Record store: Failed to create container directory: " + std::string(e.what()));
  }

  RecordId next = 1;
  std::filesystem::path counter = dir / NEXT_ID_FILE;
  if (std::filesystem::exists(counter)) {
    std::string text = read_text(counter);
    try {
      next = std::stoull(text);
    } catch (const std::exception&) {
      throw StoreError("Record store: Corrupt id counter in container " + container);
    }
  }

  std::string updated = std::to_string(next + 1);
  write_file(counter, updated.data(), updated.size());
  return next;
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::string LocalRecordStore::hash_key(const std::string& key) const {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;

  // Create a new message digest context for the hashing operation
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw StoreError("Record store: Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr)
      || !EVP_DigestUpdate(ctx, key.c_str(), key.length())
      || !EVP_DigestFinal_ex(ctx, hash, &hash_len)) {
    EVP_MD_CTX_free(ctx);
    throw StoreError("Record store: Failed to hash key");
  }
  EVP_MD_CTX_free(ctx);

  // Convert the raw hash bytes to a hexadecimal string
  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::filesystem::path LocalRecordStore::get_path_for_hash(const std::string& hash) const {
  std::filesystem::path path = base_path_ / "blobs";

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }

  path /= hash.substr(6);
  return path;
}

std::filesystem::path LocalRecordStore::blob_path(const std::string& container, RecordId id,
                                                  std::size_t index, const std::string& filename) const {
  std::string key = container + "/" + std::to_string(id) + "/" + std::to_string(index) + "/" + filename;
  return get_path_for_hash(hash_key(key));
}

void LocalRecordStore::prune_empty_dirs(std::filesystem::path path) const {
  const std::filesystem::path root = base_path_ / "blobs";
  while (path != root && std::filesystem::exists(path) && std::filesystem::is_empty(path)) {
    std::filesystem::remove(path);
    path = path.parent_path();
  }
}


//==============================================
// UTILITY METHODS
//==============================================

void LocalRecordStore::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

void LocalRecordStore::validate_container(const std::string& container) const {
  if (container.empty() || container == "." || container == ".."
      || container.find('/') != std::string::npos || container.find('\\') != std::string::npos) {
    BOOST_LOG_TRIVIAL(error) << "Record store: Invalid container name: '" << container << "'";
    throw StoreError("Record store: Invalid container name: '" + container + "'");
  }
}

void LocalRecordStore::write_file(const std::filesystem::path& path, const char* data, std::size_t size) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw StoreError("Record store: Failed to create file: " + path.string());
  }
  file.write(data, static_cast<std::streamsize>(size));
  if (!file) {
    throw StoreError("Record store: Failed to write file: " + path.string());
  }
}

std::string LocalRecordStore::read_text(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw StoreError("Record store: Failed to open file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

} // namespace store
} // namespace distore
