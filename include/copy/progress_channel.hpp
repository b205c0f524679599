#pragma once

#include "copy/progress.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace treecopy {

// Thread-safe queue between the copying thread and whoever renders progress.
//
// capacity == 0 means unbounded. With a bound, Send() blocks while the queue is
// full and the receiving side is still open. CloseReceiver() drops queued
// events, wakes a blocked sender and makes every later Send() fail.
// CloseSender() lets consumers drain what is queued and then see end of stream.
class ProgressChannel final : public IProgressSink {
  public:
    explicit ProgressChannel(std::size_t capacity = 0);

    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    bool Send(const ProgressEvent& e) override;

    // Blocks until an event is available; nullopt at end of stream or after
    // CloseReceiver().
    std::optional<ProgressEvent> Receive();
    std::optional<ProgressEvent> TryReceive();

    void CloseSender();
    void CloseReceiver();

    std::size_t Capacity() const { return capacity_; }
    std::size_t Pending() const;
    bool SenderClosed() const;
    bool ReceiverClosed() const;

  private:
    const std::size_t capacity_;

    mutable std::mutex mu_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<ProgressEvent> queue_;
    bool sender_closed_ = false;
    bool receiver_closed_ = false;
};

} // namespace treecopy
