#ifndef DISTORE_TRANSFER_CATALOG_LISTER_HPP
#define DISTORE_TRANSFER_CATALOG_LISTER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "store/record_store.hpp"
#include "transfer/chain_record.hpp"

namespace distore {
namespace transfer {

struct CatalogEntry {
  ChainRecord record;
  store::RecordId id{0};
};

// Lists the files stored in a container by walking its full history
class CatalogLister {
public:
  static constexpr std::uint32_t DEFAULT_PAGE_SIZE = 100;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CatalogLister(store::RecordStore& store, const std::string& container,
                std::uint32_t page_size = DEFAULT_PAGE_SIZE);


  // ---- LISTING ----
  // Chain heads of the container, newest container activity first
  std::vector<CatalogEntry> list();
  // Every record of the container, paging backwards until an empty page
  std::vector<store::Record> fetch_history();


  // ---- FILTERING ----
  // Decoded metadata if the record is the head of a chain written by this protocol
  static std::optional<ChainRecord> as_head(const store::Record& record);

private:
  // ---- PARAMETERS ----
  store::RecordStore& store_;
  std::string container_;
  std::uint32_t page_size_;
};

} // namespace transfer
} // namespace distore

#endif // DISTORE_TRANSFER_CATALOG_LISTER_HPP
