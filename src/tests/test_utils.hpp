#ifndef DISTORE_TEST_UTILS_HPP
#define DISTORE_TEST_UTILS_HPP

#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <gmock/gmock.h>
#include "logger/logger.hpp"
#include "store/record_store.hpp"

// Keep test output free of log records
inline void init_test_logging() {
  distore::logging::silence();
}

// Fresh directory under the system temp directory, removed on destruction
class TempDir {
public:
  explicit TempDir(const std::string& prefix) {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
      (prefix + "_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count())
       + "_" + std::to_string(rd()));
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

inline void write_test_file(const std::filesystem::path& path, const std::string& data) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  file.write(data.data(), static_cast<std::streamsize>(data.size()));
}

inline std::string read_test_file(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

// Deterministic content that differs at every offset of a period
inline std::string pattern_data(std::size_t size) {
  std::string data(size, '\0');
  for (std::size_t i = 0; i < size; ++i) {
    data[i] = static_cast<char>('a' + (i * 7 + i / 26) % 26);
  }
  return data;
}

class MockRecordStore : public distore::store::RecordStore {
public:
  MOCK_METHOD(distore::store::Record, create,
              (const std::string& container,
               const std::vector<distore::store::OutgoingAttachment>& attachments,
               const std::string& content), (override));
  MOCK_METHOD(void, edit, (const std::string& container, distore::store::RecordId id,
                           const std::string& content), (override));
  MOCK_METHOD(distore::store::Record, get, (const std::string& container, distore::store::RecordId id),
              (override));
  MOCK_METHOD(void, remove, (const std::string& container, distore::store::RecordId id), (override));
  MOCK_METHOD(std::vector<distore::store::Record>, list_page,
              (const std::string& container, std::optional<distore::store::RecordId> before,
               std::uint32_t limit), (override));
  MOCK_METHOD(std::size_t, max_attachments, (), (const, override));
  MOCK_METHOD(std::uint64_t, max_attachment_size, (), (const, override));
};

#endif // DISTORE_TEST_UTILS_HPP
