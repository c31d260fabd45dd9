#include "transfer/extent_splitter.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include "transfer/transfer_error.hpp"

namespace distore {
namespace transfer {

namespace {

constexpr const char* EXTENT_SUFFIX = ".part";

void report(const FractionFn& progress, double fraction) {
  if (progress) {
    progress(std::clamp(fraction, 0.0, 1.0));
  }
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ExtentSplitter::ExtentSplitter(std::size_t extent_size)
  : extent_size_(extent_size) {
  if (extent_size_ == 0) {
    throw std::invalid_argument("Extent splitter: Extent size must be positive");
  }
}


//==============================================
// SPLITTING
//==============================================

std::vector<Extent> ExtentSplitter::split(const std::filesystem::path& source,
                                          const std::filesystem::path& output_dir,
                                          const FractionFn& progress) const {
  BOOST_LOG_TRIVIAL(info) << "Extent splitter: Disassembling " << source.string();

  std::ifstream file(source, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Extent splitter: Cannot open file: " << source.string();
    throw IoError("cannot open file: " + source.string());
  }

  std::optional<std::uint64_t> total_bytes;
  std::error_code ec;
  auto size = std::filesystem::file_size(source, ec);
  if (!ec) {
    total_bytes = size;
  }

  return split(file, source.filename().string(), total_bytes, output_dir, progress);
}

std::vector<Extent> ExtentSplitter::split(std::istream& source,
                                          const std::string& source_name,
                                          std::optional<std::uint64_t> total_bytes,
                                          const std::filesystem::path& output_dir,
                                          const FractionFn& progress) const {
  if (!source.good()) {
    BOOST_LOG_TRIVIAL(error) << "Extent splitter: Invalid input stream for " << source_name;
    throw IoError("invalid input stream for " + source_name);
  }

  std::error_code ec;
  std::filesystem::create_directories(output_dir, ec);
  if (ec) {
    throw IoError("cannot create directory " + output_dir.string() + ": " + ec.message());
  }

  // Number of extents the source will produce, when its length is known
  std::uint64_t expected = 0;
  if (total_bytes && *total_bytes > 0) {
    expected = (*total_bytes + extent_size_ - 1) / extent_size_;
  }

  std::vector<Extent> extents;
  std::vector<char> buffer(extent_size_);

  while (true) {
    source.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize bytes_read = source.gcount();
    if (source.bad()) {
      BOOST_LOG_TRIVIAL(error) << "Extent splitter: Read failed for " << source_name;
      throw IoError("read failed for " + source_name);
    }
    if (bytes_read == 0) {
      break;
    }

    if (extents.size() >= std::numeric_limits<std::uint32_t>::max()) {
      throw IoError("too many extents for " + source_name);
    }

    Extent extent;
    extent.index = static_cast<std::uint32_t>(extents.size());
    extent.path = output_dir / extent_name(source_name, extent.index);
    extent.size = static_cast<std::uint64_t>(bytes_read);

    BOOST_LOG_TRIVIAL(debug) << "Extent splitter: Writing " << extent.path.string();
    std::ofstream out(extent.path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw IoError("cannot create extent " + extent.path.string());
    }
    out.write(buffer.data(), bytes_read);
    out.close();
    if (!out) {
      BOOST_LOG_TRIVIAL(error) << "Extent splitter: Write failed for " << extent.path.string();
      throw IoError("write failed for " + extent.path.string());
    }

    extents.push_back(extent);
    report(progress, expected > 0 ? static_cast<double>(extents.size()) / expected : 1.0);

    if (source.eof()) {
      break;
    }
  }

  if (extents.empty()) {
    report(progress, 1.0);
  }

  BOOST_LOG_TRIVIAL(info) << "Extent splitter: Disassembled " << source_name
                          << " into " << extents.size() << " extents";
  return extents;
}


//==============================================
// REASSEMBLY
//==============================================

std::vector<Extent> ExtentSplitter::find_extents(const std::string& name,
                                                 const std::filesystem::path& parts_dir) {
  std::vector<Extent> extents;
  std::error_code ec;
  std::filesystem::directory_iterator it(parts_dir, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Extent splitter: Cannot read directory " << parts_dir.string();
    throw IoError("cannot read directory " + parts_dir.string() + ": " + ec.message());
  }

  for (const auto& entry : it) {
    if (!entry.is_regular_file()) {
      continue;
    }
    auto index = parse_extent_index(name, entry.path().filename().string());
    if (!index) {
      continue;
    }
    extents.push_back({*index, entry.path(), entry.file_size()});
  }

  // Numeric order, part10 comes after part9
  std::sort(extents.begin(), extents.end(),
            [](const Extent& a, const Extent& b) { return a.index < b.index; });
  return extents;
}

std::uint64_t ExtentSplitter::assemble(const std::string& name,
                                       const std::filesystem::path& parts_dir,
                                       const std::filesystem::path& output,
                                       const FractionFn& progress) const {
  BOOST_LOG_TRIVIAL(info) << "Extent splitter: Assembling " << name << " from " << parts_dir.string();

  std::vector<Extent> extents = find_extents(name, parts_dir);
  // An empty file was disassembled into no extents
  if (extents.empty()) {
    BOOST_LOG_TRIVIAL(info) << "Extent splitter: No extents of " << name << ", writing an empty file";
  }
  for (std::size_t i = 0; i < extents.size(); ++i) {
    if (extents[i].index != i) {
      BOOST_LOG_TRIVIAL(error) << "Extent splitter: Missing extent " << i << " of " << name;
      throw IoError("missing extent " + extent_name(name, static_cast<std::uint32_t>(i)));
    }
  }

  std::ofstream out(output, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw IoError("cannot create output file " + output.string());
  }

  std::uint64_t total = 0;
  std::vector<char> buffer(64 * 1024);
  for (std::size_t i = 0; i < extents.size(); ++i) {
    BOOST_LOG_TRIVIAL(debug) << "Extent splitter: Writing " << extents[i].path.string();
    std::ifstream in(extents[i].path, std::ios::binary);
    if (!in) {
      throw IoError("cannot open extent " + extents[i].path.string());
    }
    while (in.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || in.gcount() > 0) {
      out.write(buffer.data(), in.gcount());
      total += static_cast<std::uint64_t>(in.gcount());
    }
    if (in.bad() || !out) {
      throw IoError("copy failed for extent " + extents[i].path.string());
    }
    report(progress, static_cast<double>(i + 1) / extents.size());
  }

  out.close();
  if (!out) {
    throw IoError("write failed for " + output.string());
  }
  if (extents.empty()) {
    report(progress, 1.0);
  }

  BOOST_LOG_TRIVIAL(info) << "Extent splitter: Assembled " << extents.size() << " extents into "
                          << output.string() << " (" << total << " bytes)";
  return total;
}


//==============================================
// NAMING
//==============================================

std::string ExtentSplitter::extent_name(const std::string& source_name, std::uint32_t index) {
  return source_name + EXTENT_SUFFIX + std::to_string(index);
}

std::optional<std::uint32_t> ExtentSplitter::parse_extent_index(const std::string& source_name,
                                                                const std::string& filename) {
  const std::string prefix = source_name + EXTENT_SUFFIX;
  if (filename.size() <= prefix.size() || filename.compare(0, prefix.size(), prefix) != 0) {
    return std::nullopt;
  }

  std::string digits = filename.substr(prefix.size());
  if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
    return std::nullopt;
  }
  // Writers never pad indices, "part01" is not an extent
  if (digits.size() > 1 && digits.front() == '0') {
    return std::nullopt;
  }
  if (digits.size() > 10) {
    return std::nullopt;
  }

  unsigned long long value = std::stoull(digits);
  if (value > std::numeric_limits<std::uint32_t>::max()) {
    return std::nullopt;
  }
  return static_cast<std::uint32_t>(value);
}

} // namespace transfer
} // namespace distore
