#ifndef DISTORE_TRANSFER_EXTENT_SPLITTER_HPP
#define DISTORE_TRANSFER_EXTENT_SPLITTER_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace distore {
namespace transfer {

// One fixed-size piece of a file, written to local temporary storage
struct Extent {
  std::uint32_t index{0};
  std::filesystem::path path;
  std::uint64_t size{0};
};

// Receives the completed fraction of the running step
using FractionFn = std::function<void(double)>;

class ExtentSplitter {
public:
  static constexpr std::size_t DEFAULT_EXTENT_SIZE = 10 * 1000 * 1000;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ExtentSplitter(std::size_t extent_size = DEFAULT_EXTENT_SIZE);


  // ---- SPLITTING ----
  // Splits the file at source into <filename>.part<N> files in output_dir
  std::vector<Extent> split(const std::filesystem::path& source,
                            const std::filesystem::path& output_dir,
                            const FractionFn& progress = nullptr) const;
  // Splits a stream whose length may be unknown. Extents already written are
  // left in place when an IoError is thrown.
  std::vector<Extent> split(std::istream& source,
                            const std::string& source_name,
                            std::optional<std::uint64_t> total_bytes,
                            const std::filesystem::path& output_dir,
                            const FractionFn& progress = nullptr) const;


  // ---- REASSEMBLY ----
  // Collects <name>.part<N> files from parts_dir ordered by N
  static std::vector<Extent> find_extents(const std::string& name,
                                          const std::filesystem::path& parts_dir);
  // Concatenates the extents of name into output, returns the bytes written.
  // No extents at all gives an empty output file.
  std::uint64_t assemble(const std::string& name,
                         const std::filesystem::path& parts_dir,
                         const std::filesystem::path& output,
                         const FractionFn& progress = nullptr) const;


  // ---- NAMING ----
  static std::string extent_name(const std::string& source_name, std::uint32_t index);
  // Index encoded in filename if it is an extent of source_name
  static std::optional<std::uint32_t> parse_extent_index(const std::string& source_name,
                                                         const std::string& filename);

  std::size_t extent_size() const { return extent_size_; }

private:
  std::size_t extent_size_;
};

} // namespace transfer
} // namespace distore

#endif // DISTORE_TRANSFER_EXTENT_SPLITTER_HPP
