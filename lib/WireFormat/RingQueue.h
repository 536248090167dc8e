/*
 * =================================================================================
 * Project:   Stride Coach - Interval Walking Trainer
 * File:      lib/WireFormat/RingQueue.h
 *
 * Description:
 * Fixed-capacity FIFO for payloads staged between the BLE task and loop().
 * No heap allocation. Not synchronized: callers hold the state lock.
 * =================================================================================
 */
#pragma once
#include <stddef.h>

template <typename T, size_t N>
class RingQueue {
public:
    RingQueue() : _head(0), _tail(0), _count(0) {}

    /**
     * Appends `item` at the back.
     * @return false if the queue is full (the item is not stored).
     */
    bool push(const T& item) {
        if (_count == N) return false;
        _items[_head] = item;
        _head = (_head + 1) % N;
        _count++;
        return true;
    }

    /**
     * Appends `item`, evicting the oldest entry when full.
     * @return true if an entry was evicted.
     */
    bool pushOverwrite(const T& item) {
        bool evicted = false;
        if (_count == N) {
            _tail = (_tail + 1) % N;
            _count--;
            evicted = true;
        }
        push(item);
        return evicted;
    }

    // Removes the oldest entry into `out`. Returns false when empty.
    bool pop(T& out) {
        if (_count == 0) return false;
        out = _items[_tail];
        _tail = (_tail + 1) % N;
        _count--;
        return true;
    }

    void clear() { _head = _tail = _count = 0; }

    size_t size() const { return _count; }
    bool empty() const { return _count == 0; }
    bool full() const { return _count == N; }
    static size_t capacity() { return N; }

private:
    T _items[N];
    size_t _head;
    size_t _tail;
    size_t _count;
};
