#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace treecopy {

struct ProgressStarted {
    std::uint64_t total_bytes = 0;
    std::size_t total_files = 0;
};

struct ProgressAdvanced {
    std::uint64_t bytes_processed = 0;
};

struct ProgressCompleted {};

struct ProgressFailed {
    std::string message;
};

// One logical operation emits: Started, any number of Advanced with
// non-decreasing bytes, then either Completed or (on abort) at most one Failed.
using ProgressEvent = std::variant<ProgressStarted, ProgressAdvanced, ProgressCompleted, ProgressFailed>;

class IProgressSink {
  public:
    virtual ~IProgressSink() = default;
    // false once nobody is listening any more.
    virtual bool Send(const ProgressEvent& e) = 0;
};

// Wraps an optional sink for a single operation. After the first failed send
// every further Emit is dropped; emission never affects the operation itself.
class ProgressEmitter {
  public:
    explicit ProgressEmitter(IProgressSink* sink) : sink_(sink) {}

    bool Active() const { return sink_ != nullptr; }

    void Emit(const ProgressEvent& e) {
        if (std::holds_alternative<ProgressStarted>(e)) started_ = true;
        if (!sink_) return;
        if (!sink_->Send(e)) sink_ = nullptr;
    }

    // Reports an aborted operation; only meaningful once Started went out.
    void EmitFailure(std::string message) {
        if (!started_) return;
        Emit(ProgressFailed{std::move(message)});
    }

  private:
    IProgressSink* sink_ = nullptr;
    bool started_ = false;
};

} // namespace treecopy
