#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef SPQRBIND_SCOPE_TIMER_HPP
#define SPQRBIND_SCOPE_TIMER_HPP

#include <chrono>
#include <iostream>
#include <string>

namespace utils{
    /**
     * @brief Wall-clock timer for the enclosing scope
     *
     * Prints the elapsed time when it goes out of scope, unless disabled.
     * The elapsed milliseconds can also be written to a caller variable.
     */
    class ScopeTimer{

    private:
        std::string name;
        bool enabled;
        double* elapsed_out;
        std::chrono::high_resolution_clock::time_point start;

    public:
        explicit ScopeTimer(const std::string& timer_name, bool print = true, double* elapsed_ms = nullptr)
            : name(timer_name)
            , enabled(print)
            , elapsed_out(elapsed_ms)
            , start(std::chrono::high_resolution_clock::now()) {}

        ScopeTimer(const ScopeTimer&) = delete;
        ScopeTimer& operator=(const ScopeTimer&) = delete;

        double elapsed_ms() const {
            auto now = std::chrono::high_resolution_clock::now();
            return std::chrono::duration_cast<std::chrono::microseconds>(now - start).count() / 1000.0;
        }

        ~ScopeTimer() {
            double duration = elapsed_ms();
            if (elapsed_out) {
                *elapsed_out = duration;
            }
            if (enabled) {
                std::cout << name << " took: " << duration << " ms" << std::endl;
            }
        }
    };
}

#endif
