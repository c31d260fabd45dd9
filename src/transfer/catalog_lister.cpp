#include "transfer/catalog_lister.hpp"
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include "transfer/transfer_error.hpp"

namespace distore {
namespace transfer {

CatalogLister::CatalogLister(store::RecordStore& store, const std::string& container,
                             std::uint32_t page_size)
  : store_(store)
  , container_(container)
  , page_size_(page_size) {
  if (page_size_ == 0) {
    throw std::invalid_argument("Catalog lister: Page size must be positive");
  }
}

std::vector<CatalogEntry> CatalogLister::list() {
  BOOST_LOG_TRIVIAL(info) << "Catalog lister: Listing container " << container_;

  std::vector<CatalogEntry> entries;
  for (const auto& record : fetch_history()) {
    if (auto head = as_head(record)) {
      entries.push_back({*head, record.id});
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Catalog lister: Found " << entries.size() << " files";
  return entries;
}

std::vector<store::Record> CatalogLister::fetch_history() {
  std::vector<store::Record> history;
  std::optional<store::RecordId> before;

  while (true) {
    std::vector<store::Record> page;
    try {
      page = store_.list_page(container_, before, page_size_);
    } catch (const store::StoreError& e) {
      BOOST_LOG_TRIVIAL(error) << "Catalog lister: Failed to fetch page: " << e.what();
      throw store::StoreError("Listing: page before "
                              + (before ? std::to_string(*before) : std::string("newest"))
                              + ": " + e.what());
    }

    if (page.empty()) {
      break;
    }

    // A store that hands out the same page again would loop forever
    if (before && page.back().id >= *before) {
      throw store::StoreError("Listing: pagination did not advance past record " + std::to_string(*before));
    }

    BOOST_LOG_TRIVIAL(debug) << "Catalog lister: Retrieved page of " << page.size() << " records";
    before = page.back().id;
    for (auto& record : page) {
      history.push_back(std::move(record));
    }
  }

  return history;
}

std::optional<ChainRecord> CatalogLister::as_head(const store::Record& record) {
  if (!ChainRecordCodec::has_marker(record.content)) {
    return std::nullopt;
  }

  try {
    ChainRecord decoded = ChainRecordCodec::decode(record.content);
    if (!decoded.name) {
      return std::nullopt;
    }
    return decoded;
  } catch (const MalformedRecord& e) {
    BOOST_LOG_TRIVIAL(warning) << "Catalog lister: Skipping record " << record.id << ": " << e.what();
    return std::nullopt;
  }
}

} // namespace transfer
} // namespace distore
