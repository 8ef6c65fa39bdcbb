#pragma once

#include <sys/resource.h>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>

namespace DiffExpr {
namespace Utils {

/**
 * @brief Wall time since construction (or reset) and process peak resident memory.
 */
class ResourceMonitor {
public:
    ResourceMonitor() {
        reset();
    }

    void reset() {
        start_time_ = std::chrono::steady_clock::now();
    }

    double get_elapsed_seconds() const {
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_time_;
        return elapsed.count();
    }

    // Peak resident set size in bytes, 0 if unavailable
    size_t get_peak_memory() const {
        struct rusage usage;
        if (getrusage(RUSAGE_SELF, &usage) != 0) {
            return 0;
        }
        // ru_maxrss is in kilobytes on Linux
        return static_cast<size_t>(usage.ru_maxrss) * 1024;
    }

    void print_stats(const std::string& label = "Execution") const {
        std::cout << "[" << label << "] ";
        std::cout << "Time: " << std::fixed << std::setprecision(4) << get_elapsed_seconds() << " s";
        std::cout << ", Peak RSS: " << std::fixed << std::setprecision(2) << (get_peak_memory() / 1024.0 / 1024.0)
                  << " MB";
        std::cout << std::defaultfloat << std::endl;
    }

private:
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace Utils
} // namespace DiffExpr
