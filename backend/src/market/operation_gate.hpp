#pragma once
#include <atomic>
#include <mutex>
#include <thread>

// Serializes engine entry points and rejects re-entry from the thread already inside
// (a collaborator calling back into the engine mid-operation).
class OperationGate {
public:
    class Scope {
    public:
        explicit Scope(OperationGate& gate) : gate_(gate) {
            if (gate_.owner_.load(std::memory_order_acquire) == std::this_thread::get_id()) {
                return; // re-entrant; entered() stays false
            }
            lk_ = std::unique_lock<std::mutex>(gate_.mtx_);
            gate_.owner_.store(std::this_thread::get_id(), std::memory_order_release);
            entered_ = true;
        }
        ~Scope() {
            if (entered_) {
                gate_.owner_.store(std::thread::id{}, std::memory_order_release);
            }
        }
        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

        bool entered() const noexcept { return entered_; }

    private:
        OperationGate& gate_;
        std::unique_lock<std::mutex> lk_;
        bool entered_{false};
    };

private:
    std::mutex mtx_;
    std::atomic<std::thread::id> owner_{};
};
