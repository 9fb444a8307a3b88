#pragma once

#include <optional>
#include <utility>

namespace HardwareKey {

/**
 * @brief Holder for at most one pending value
 *
 * Used for the pending connect/unplug callbacks. takeAndClear() empties the
 * slot before the caller gets to run the value, so a callback that re-enters
 * the coordinator sees an empty slot and cannot be invoked twice.
 */
template <typename T>
class SingleSlot {
public:
    bool isSet() const { return m_value.has_value(); }

    /**
     * @brief Store a value
     * @return false if the slot was already occupied (value is not replaced)
     */
    bool set(T value) {
        if (m_value) {
            return false;
        }
        m_value = std::move(value);
        return true;
    }

    /**
     * @brief Move the value out and leave the slot empty
     */
    std::optional<T> takeAndClear() {
        std::optional<T> taken;
        taken.swap(m_value);
        return taken;
    }

    void clear() { m_value.reset(); }

private:
    std::optional<T> m_value;
};

} // namespace HardwareKey
