#ifndef DISTORE_TRANSFER_BATCH_PACKER_HPP
#define DISTORE_TRANSFER_BATCH_PACKER_HPP

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <vector>

namespace distore {
namespace transfer {

// Groups items into consecutive batches of at most limit items, keeping
// their order within and across batches
template <typename T>
std::vector<std::vector<T>> pack_batches(const std::vector<T>& items, std::size_t limit) {
  if (limit == 0) {
    throw std::invalid_argument("Batch packer: Batch limit must be positive");
  }

  std::vector<std::vector<T>> batches;
  batches.reserve((items.size() + limit - 1) / limit);

  for (std::size_t start = 0; start < items.size(); start += limit) {
    std::size_t end = std::min(start + limit, items.size());
    batches.emplace_back(items.begin() + start, items.begin() + end);
  }
  return batches;
}

} // namespace transfer
} // namespace distore

#endif // DISTORE_TRANSFER_BATCH_PACKER_HPP
