// profiler.hpp
#ifndef PROFILER_HPP
#define PROFILER_HPP

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <windows.h>
#include <psapi.h>
#else
#include <sys/resource.h>
#endif

class Stopwatch {
private:
    using clock = std::chrono::steady_clock;
    clock::time_point t0{}, t1{};
    bool running = false;

public:
    void start() {
        t0 = clock::now();
        running = true;
    }

    // returns the elapsed time in ms
    double stop() {
        t1 = clock::now();
        running = false;
        return std::chrono::duration<double, std::milli>(t1 - t0).count();
    }

    double ms() const {
        const auto end = running ? clock::now() : t1;
        return std::chrono::duration<double, std::milli>(end - t0).count();
    }
};

static std::string fmt_ms(double ms, int prec = 3) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss << std::setprecision(prec) << ms;
    return oss.str();
}

static void print_time(const std::string& phase, double ms) {
    std::cout << "[time] " << phase << ": " << fmt_ms(ms) << " ms\n";
}

static void print_mem_now(const std::string& label) {
#ifdef _WIN32
    PROCESS_MEMORY_COUNTERS pmc;
    if (GetProcessMemoryInfo(GetCurrentProcess(), &pmc, sizeof(pmc))) {
        std::cout << "[mem ] " << label << " WorkingSet: "
                  << (pmc.WorkingSetSize / 1024) << " KB, Peak: "
                  << (pmc.PeakWorkingSetSize / 1024) << " KB\n";
    }
#else
    struct rusage usage;
    if (getrusage(RUSAGE_SELF, &usage) == 0) {
        std::cout << "[mem ] " << label << " RSS: "
                  << (usage.ru_maxrss) << " KB\n";
    }
#endif
}

#endif
