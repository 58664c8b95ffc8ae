#pragma once
#include <array>
#include <atomic>
#include <cstddef>
#include <optional>
#include <thread>

constexpr std::size_t LogRingBufferMaxSize = 4'096;

enum class SlotState {
    VACANT,
    WRITING,
    WRITTEN,
    READING,
};

enum class RingState {
    FULL,
    EMPTY,
    SUCCESS,
};

struct PolledIdx {
    std::size_t polled_idx;
    std::size_t idx_in_buffer;
};

template<typename T>
struct RingResult {
    RingState state;
    std::optional<T> content;

    RingResult(RingState state_, std::optional<T> content_)
        : state(state_), content(std::move(content_)) {}
};

// A slot moves VACANT -> WRITING -> WRITTEN -> READING -> VACANT. Producers
// and the consumer spin on the slot state, so a claimed index is never read
// before its writer has finished with it.
template<typename T>
class Slot {
public:
    bool claim(SlotState expected, SlotState new_state) {
        return state.compare_exchange_weak(expected, new_state, std::memory_order_acq_rel);
    }

    void set(T&& to_set) {
        value = std::move(to_set);
        state.store(SlotState::WRITTEN, std::memory_order_release);
    }

    T take() {
        T out = std::move(value);
        value = T{};
        state.store(SlotState::VACANT, std::memory_order_release);
        return out;
    }

    SlotState read_state() const {
        return state.load(std::memory_order_acquire);
    }

private:
    std::atomic<SlotState> state = SlotState::VACANT;
    T value;
};

// Multi-producer, single-consumer ring. `push` never blocks: a full ring is
// reported back to the caller, who decides whether to retry.
template<typename T, std::size_t N = LogRingBufferMaxSize>
class MPSCRingBuffer {
public:
    MPSCRingBuffer() = default;

    MPSCRingBuffer(const MPSCRingBuffer&) = delete;

    MPSCRingBuffer& operator=(const MPSCRingBuffer&) = delete;

    bool is_empty() const {
        return tail.load(std::memory_order_acquire) == head.load(std::memory_order_acquire);
    }

    std::size_t size() const {
        return head.load(std::memory_order_acquire) - tail.load(std::memory_order_acquire);
    }

    static constexpr std::size_t capacity() {
        return N - 1;
    }

    RingState push(T content) {
        auto maybe_head = try_claim_head();
        if (!maybe_head.has_value()) {
            return RingState::FULL;
        }
        auto& slot = data[maybe_head->idx_in_buffer];
        while (!slot.claim(SlotState::VACANT, SlotState::WRITING)) {
            std::this_thread::yield();
        }
        slot.set(std::move(content));
        return RingState::SUCCESS;
    }

    RingResult<T> fetch() {
        auto maybe_tail = try_claim_tail();
        if (!maybe_tail.has_value()) {
            return RingResult<T>(RingState::EMPTY, std::nullopt);
        }
        auto& slot = data[maybe_tail->idx_in_buffer];
        while (!slot.claim(SlotState::WRITTEN, SlotState::READING)) {
            std::this_thread::yield();
        }
        return RingResult<T>(RingState::SUCCESS, slot.take());
    }

private:
    std::optional<PolledIdx> try_claim_head() {
        while (true) {
            std::size_t t = tail.load(std::memory_order_acquire);
            std::size_t h = head.load(std::memory_order_acquire);
            if (h - t >= N - 1) {
                return std::nullopt;  // full
            }
            if (head.compare_exchange_weak(h, h + 1, std::memory_order_acq_rel)) {
                return PolledIdx{h, h % N};
            }
        }
    }

    std::optional<PolledIdx> try_claim_tail() {
        while (true) {
            std::size_t t = tail.load(std::memory_order_acquire);
            std::size_t h = head.load(std::memory_order_acquire);
            if (t == h) {
                return std::nullopt;  // empty
            }
            if (tail.compare_exchange_weak(t, t + 1, std::memory_order_acq_rel)) {
                return PolledIdx{t, t % N};
            }
        }
    }

    std::atomic<std::size_t> head = 0;
    std::atomic<std::size_t> tail = 0;
    std::array<Slot<T>, N> data;
};
