#include "transfer/transfer_task.hpp"
#include <boost/log/trivial.hpp>
#include "transfer/transfer_error.hpp"

namespace distore {
namespace transfer {

TransferTask::TransferTask(ProgressChannel& channel, Operation operation)
  : channel_(channel) {
  worker_ = std::make_unique<std::thread>(&TransferTask::run, this, std::move(operation));
}

TransferTask::~TransferTask() {
  join();
}

void TransferTask::join() {
  if (worker_ && worker_->joinable()) {
    worker_->join();
  }
}

void TransferTask::run(Operation operation) {
  BOOST_LOG_TRIVIAL(debug) << "Transfer task: Started";

  TransferEvent event;
  try {
    event.message = operation(channel_);
    event.type = EventType::FINISHED;
    BOOST_LOG_TRIVIAL(info) << "Transfer task: Finished: " << event.message;
  } catch (const TransferAborted& e) {
    // Nobody is listening any more
    BOOST_LOG_TRIVIAL(warning) << "Transfer task: " << e.what();
    running_ = false;
    return;
  } catch (const std::exception& e) {
    event.type = EventType::FAILED;
    event.message = e.what();
    BOOST_LOG_TRIVIAL(error) << "Transfer task: Failed: " << e.what();
  }

  if (!channel_.produce(event)) {
    BOOST_LOG_TRIVIAL(debug) << "Transfer task: Result dropped, consumer disconnected";
  }
  running_ = false;
}

} // namespace transfer
} // namespace distore
