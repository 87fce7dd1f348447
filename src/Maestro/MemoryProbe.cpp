// =================================================================
// src/Maestro/MemoryProbe.cpp
// =================================================================
// System memory readings for degradation monitoring.

#include "Maestro/MemoryProbe.hpp"
#include <fstream>
#include <sstream>
#include <string>

#if defined(_WIN32)
#include <windows.h>
#elif defined(__linux__)
#include <sys/sysinfo.h>
#else
#include <unistd.h>
#endif

namespace Maestro {

MemorySnapshot MemoryProbe::sample() const {
    MemorySnapshot snapshot;
    snapshot.total = totalMemory();
    snapshot.free = freeMemory();
    return snapshot;
}

double MemoryProbe::usedMemoryPercent() const {
    return usedPercentOf(sample());
}

double MemoryProbe::usedPercentOf(const MemorySnapshot& snapshot) {
    if (snapshot.total == 0) {
        return 0.0;
    }
    uint64_t free_bytes = snapshot.free > snapshot.total ? snapshot.total : snapshot.free;
    return (static_cast<double>(snapshot.total - free_bytes) / static_cast<double>(snapshot.total)) * 100.0;
}

uint64_t SystemMemoryProbe::totalMemory() const {
    uint64_t total = 0;
    uint64_t available = 0;
    readMemoryInfo(total, available);
    return total;
}

uint64_t SystemMemoryProbe::freeMemory() const {
    uint64_t total = 0;
    uint64_t available = 0;
    readMemoryInfo(total, available);
    return available;
}

MemorySnapshot SystemMemoryProbe::sample() const {
    MemorySnapshot snapshot;
    readMemoryInfo(snapshot.total, snapshot.free);
    return snapshot;
}

bool SystemMemoryProbe::readMemoryInfo(uint64_t& total_bytes, uint64_t& available_bytes) const {
    total_bytes = 0;
    available_bytes = 0;

#if defined(_WIN32)
    MEMORYSTATUSEX status;
    status.dwLength = sizeof(status);
    if (!GlobalMemoryStatusEx(&status)) {
        return false;
    }
    total_bytes = static_cast<uint64_t>(status.ullTotalPhys);
    available_bytes = static_cast<uint64_t>(status.ullAvailPhys);
    return true;
#else
    std::ifstream file("/proc/meminfo");
    if (file.is_open()) {
        uint64_t mem_total_kb = 0;
        uint64_t mem_available_kb = 0;

        std::string line;
        while (std::getline(file, line)) {
            std::istringstream iss(line);
            std::string key;
            uint64_t value = 0;
            std::string unit;
            iss >> key >> value >> unit;

            if (key == "MemTotal:") {
                mem_total_kb = value;
            } else if (key == "MemAvailable:") {
                mem_available_kb = value;
            }

            if (mem_total_kb > 0 && mem_available_kb > 0) {
                break;
            }
        }

        if (mem_total_kb > 0) {
            total_bytes = mem_total_kb * 1024;
            available_bytes = mem_available_kb * 1024;
            return true;
        }
    }

#if defined(__linux__)
    struct sysinfo info;
    if (sysinfo(&info) != 0) {
        return false;
    }
    total_bytes = static_cast<uint64_t>(info.totalram) * info.mem_unit;
    available_bytes = static_cast<uint64_t>(info.freeram + info.bufferram) * info.mem_unit;
    return true;
#else
    long pages = sysconf(_SC_PHYS_PAGES);
    long page_size = sysconf(_SC_PAGE_SIZE);
    if (pages <= 0 || page_size <= 0) {
        return false;
    }
    total_bytes = static_cast<uint64_t>(pages) * static_cast<uint64_t>(page_size);
    // No portable free-page count; report everything as available.
    available_bytes = total_bytes;
    return true;
#endif
#endif
}

} // namespace Maestro
