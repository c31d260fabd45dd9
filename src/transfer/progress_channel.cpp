#include "transfer/progress_channel.hpp"
#include <boost/log/trivial.hpp>

namespace distore {
namespace transfer {

const char* phase_label(Phase phase) {
    switch (phase) {
        case Phase::DISASSEMBLING: return "Disassembling";
        case Phase::UPLOADING: return "Uploading";
        case Phase::EDITING: return "Editing";
        case Phase::DOWNLOADING: return "Downloading";
        case Phase::DELETING: return "Deleting";
        case Phase::ASSEMBLING: return "Assembling";
        default: return "Unknown";
    }
}

bool ProgressChannel::produce(const TransferEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return false;
    }

    queue_.push(event);
    BOOST_LOG_TRIVIAL(trace) << "Progress channel: Added event. Channel size: " << queue_.size();
    return true;
}

bool ProgressChannel::consume(TransferEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return false;
    }

    event = std::move(queue_.front());
    queue_.pop();
    return true;
}

void ProgressChannel::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    std::queue<TransferEvent>().swap(queue_);
    BOOST_LOG_TRIVIAL(debug) << "Progress channel: Closed by consumer";
}

bool ProgressChannel::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool ProgressChannel::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

std::size_t ProgressChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace transfer
} // namespace distore
