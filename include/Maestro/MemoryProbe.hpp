// =================================================================
// include/Maestro/MemoryProbe.hpp
// =================================================================
// Injectable source of system memory readings.

#pragma once

#include <cstdint>

namespace Maestro {

/**
 * @brief Total and free memory taken from one reading
 */
struct MemorySnapshot {
    uint64_t total = 0;     ///< Bytes of installed memory
    uint64_t free = 0;      ///< Bytes available to new allocations
};

/**
 * @brief Reports total and free system memory in bytes
 *
 * Implementations must be callable from the degradation monitor thread.
 */
class MemoryProbe {
public:
    virtual ~MemoryProbe() = default;

    /**
     * @brief Total physical memory
     * @return Bytes of installed memory
     */
    virtual uint64_t totalMemory() const = 0;

    /**
     * @brief Memory available to new allocations
     * @return Bytes currently free
     */
    virtual uint64_t freeMemory() const = 0;

    /**
     * @brief Total and free memory from a single reading
     */
    virtual MemorySnapshot sample() const;

    /**
     * @brief Used memory as a percentage of total, from one sample()
     * @return (total - free) / total * 100, or 0 when total is unknown
     */
    double usedMemoryPercent() const;

    static double usedPercentOf(const MemorySnapshot& snapshot);
};

/**
 * @brief Memory probe backed by the operating system
 *
 * On Linux reads MemTotal/MemAvailable from /proc/meminfo and falls back to
 * sysinfo(2) when the file is unreadable.
 */
class SystemMemoryProbe : public MemoryProbe {
public:
    SystemMemoryProbe() = default;

    uint64_t totalMemory() const override;
    uint64_t freeMemory() const override;
    MemorySnapshot sample() const override;

private:
    /**
     * @brief Read total and available memory in bytes
     * @return True if both values were obtained
     */
    bool readMemoryInfo(uint64_t& total_bytes, uint64_t& available_bytes) const;
};

} // namespace Maestro
