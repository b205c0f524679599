#include "copy/progress_channel.hpp"

#include <utility>

namespace treecopy {

ProgressChannel::ProgressChannel(std::size_t capacity) : capacity_(capacity) {}

bool ProgressChannel::Send(const ProgressEvent& e) {
    std::unique_lock<std::mutex> lk(mu_);
    if (capacity_ > 0) {
        not_full_.wait(lk, [this] { return receiver_closed_ || queue_.size() < capacity_; });
    }
    if (receiver_closed_ || sender_closed_) return false;

    queue_.push_back(e);
    lk.unlock();
    not_empty_.notify_one();
    return true;
}

std::optional<ProgressEvent> ProgressChannel::Receive() {
    std::unique_lock<std::mutex> lk(mu_);
    not_empty_.wait(lk, [this] { return receiver_closed_ || sender_closed_ || !queue_.empty(); });
    if (receiver_closed_ || queue_.empty()) return std::nullopt;

    ProgressEvent e = std::move(queue_.front());
    queue_.pop_front();
    lk.unlock();
    not_full_.notify_one();
    return e;
}

std::optional<ProgressEvent> ProgressChannel::TryReceive() {
    std::unique_lock<std::mutex> lk(mu_);
    if (receiver_closed_ || queue_.empty()) return std::nullopt;

    ProgressEvent e = std::move(queue_.front());
    queue_.pop_front();
    lk.unlock();
    not_full_.notify_one();
    return e;
}

void ProgressChannel::CloseSender() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        sender_closed_ = true;
    }
    not_empty_.notify_all();
}

void ProgressChannel::CloseReceiver() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        receiver_closed_ = true;
        queue_.clear();
    }
    not_full_.notify_all();
    not_empty_.notify_all();
}

std::size_t ProgressChannel::Pending() const {
    std::lock_guard<std::mutex> lk(mu_);
    return queue_.size();
}

bool ProgressChannel::SenderClosed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sender_closed_;
}

bool ProgressChannel::ReceiverClosed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return receiver_closed_;
}

} // namespace treecopy
