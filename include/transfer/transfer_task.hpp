#ifndef DISTORE_TRANSFER_TRANSFER_TASK_HPP
#define DISTORE_TRANSFER_TRANSFER_TASK_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include "transfer/progress_channel.hpp"

namespace distore {
namespace transfer {

// Runs one transfer on a background thread. The operation reports progress
// through the channel and returns a summary; the task then pushes a FINISHED
// event, or a FAILED event carrying the error message.
class TransferTask {
public:
  using Operation = std::function<std::string(ProgressChannel&)>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TransferTask(ProgressChannel& channel, Operation operation);
  ~TransferTask();

  TransferTask(const TransferTask&) = delete;
  TransferTask& operator=(const TransferTask&) = delete;


  // ---- CONTROL ----
  // Blocks until the operation has returned
  void join();
  bool running() const { return running_; }

private:
  // ---- PARAMETERS ----
  ProgressChannel& channel_;
  std::atomic<bool> running_{true};
  std::unique_ptr<std::thread> worker_;

  void run(Operation operation);
};

} // namespace transfer
} // namespace distore

#endif // DISTORE_TRANSFER_TRANSFER_TASK_HPP
