#ifndef DISTORE_TRANSFER_PROGRESS_CHANNEL_HPP
#define DISTORE_TRANSFER_PROGRESS_CHANNEL_HPP

#include <cstdint>
#include <mutex>
#include <queue>
#include <string>

namespace distore {
namespace transfer {

// Steps of a transfer that report progress separately
enum class Phase : uint8_t {
    DISASSEMBLING = 0,
    UPLOADING,
    EDITING,
    DOWNLOADING,
    DELETING,
    ASSEMBLING
};

const char* phase_label(Phase phase);

struct TransferProgress {
    Phase phase{Phase::DISASSEMBLING};
    std::string label;
    // Completed share of the phase, in [0, 1]
    double fraction{0.0};
};

enum class EventType : uint8_t {
    PROGRESS = 0,
    FINISHED,
    FAILED
};

// Message sent from a background transfer to the foreground
struct TransferEvent {
    EventType type{EventType::PROGRESS};
    TransferProgress progress;
    // Result summary on FINISHED, error text on FAILED
    std::string message;
};

// Ordered single-direction queue of transfer events. Producers never block;
// closing the channel tells the producer its consumer is gone.
class ProgressChannel {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR
    ProgressChannel() = default;
    ~ProgressChannel() = default;


    // ---- CHANNEL CONTROL METHODS ----
    // Adds an event to the back of the queue, false once the channel is closed
    bool produce(const TransferEvent& event);
    // Retrieves and removes the next event
    bool consume(TransferEvent& event);
    // Marks the consumer as gone and drops pending events
    void close();


    // ---- QUERY METHODS ----
    bool is_closed() const;
    bool empty() const;
    std::size_t size() const;

private:
    // ---- PARAMETERS ----
    mutable std::mutex mutex_;
    std::queue<TransferEvent> queue_;
    bool closed_{false};
};

} // namespace transfer
} // namespace distore

#endif // DISTORE_TRANSFER_PROGRESS_CHANNEL_HPP
