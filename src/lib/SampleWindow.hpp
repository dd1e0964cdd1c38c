#pragma once

#include <cstddef>
#include <stdexcept>
#include <vector>


namespace Lib {

/**
 * @brief Fixed size window of the most recent samples
 *
 * Storage is allocated once. When the window is full a push evicts the oldest
 * sample. Index 0 is always the oldest sample still held.
 */
template <typename T>
class SampleWindow {
public:
    /**
     * @brief Construct an empty window
     *
     * @param capacity Number of samples kept
     * @throws std::invalid_argument if capacity is 0
     */
    explicit SampleWindow(size_t capacity) : m_Slots(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("Sample window needs room for at least one sample");
        }
    }

    void push(const T& sample) {
        m_Slots[(m_Oldest + m_Count) % m_Slots.size()] = sample;
        if (m_Count < m_Slots.size()) {
            m_Count++;
        } else {
            m_Oldest = (m_Oldest + 1) % m_Slots.size();
        }
    }

    const T& operator[](size_t index) const {
        if (index >= m_Count) {
            throw std::out_of_range("Sample index past the newest sample");
        }
        return m_Slots[(m_Oldest + index) % m_Slots.size()];
    }

    void clear() {
        m_Oldest = 0;
        m_Count  = 0;
    }

    size_t size() const { return m_Count; }
    size_t capacity() const { return m_Slots.size(); }
    bool empty() const { return m_Count == 0; }

private:
    std::vector<T> m_Slots;
    size_t m_Oldest = 0;  // Slot of index 0
    size_t m_Count  = 0;
};

} // namespace Lib
