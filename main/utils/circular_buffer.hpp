#ifndef CIRCULAR_BUFFER_HPP
#define CIRCULAR_BUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <array>

// What push() does when the buffer is already full.
enum class OverflowPolicy : uint8_t {
    DROP_NEWEST = 0, // reject the incoming value, keep the backlog
    DROP_OLDEST = 1  // evict the oldest value to make room
};

// Fixed-capacity, header-only FIFO ring.
// - No dynamic allocation (storage is embedded).
// - No internal locking; the owner serializes access.
// - T should be copyable. Large T can be inspected in place via front().
template<typename T, std::size_t Capacity>
class CircularBuffer {
public:
    static_assert(Capacity > 0, "CircularBuffer capacity must be greater than zero");

    explicit CircularBuffer(OverflowPolicy policy = OverflowPolicy::DROP_NEWEST)
        : policy(policy), head_index(0), tail_index(0), count(0), dropped(0) {}

    // Returns false if the value was not stored (DROP_NEWEST on a full buffer).
    // Either way a full buffer bumps droppedCount().
    bool push(const T& value) {
        if (isFull()) {
            ++dropped;
            if (policy == OverflowPolicy::DROP_NEWEST) {
                return false;
            }
            tail_index = (tail_index + 1U) % Capacity;
            --count;
        }
        storage[head_index] = value;
        head_index = (head_index + 1U) % Capacity;
        ++count;
        return true;
    }

    bool pop(T& out_value) {
        if (isEmpty()) {
            return false;
        }
        out_value = storage[tail_index];
        dropFront();
        return true;
    }

    // Oldest element, or nullptr when empty. Valid until the next mutation.
    const T* front() const {
        return isEmpty() ? nullptr : &storage[tail_index];
    }

    void dropFront() {
        if (isEmpty()) {
            return;
        }
        tail_index = (tail_index + 1U) % Capacity;
        --count;
    }

    bool isFull() const {
        return count == Capacity;
    }

    bool isEmpty() const {
        return count == 0U;
    }

    std::size_t getCount() const {
        return count;
    }

    std::size_t getCapacity() const {
        return Capacity;
    }

    std::size_t droppedCount() const {
        return dropped;
    }

    OverflowPolicy overflowPolicy() const {
        return policy;
    }

    // Discards contents; the drop counter is kept.
    void clear() {
        head_index = 0U;
        tail_index = 0U;
        count = 0U;
    }

private:
    std::array<T, Capacity> storage;
    OverflowPolicy policy;
    std::size_t head_index;
    std::size_t tail_index;
    std::size_t count;
    std::size_t dropped;
};

#endif // CIRCULAR_BUFFER_HPP
