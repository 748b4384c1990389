#pragma once

#ifndef lumina_simple_timer_hpp
#define lumina_simple_timer_hpp

#include <chrono>

namespace lumina
{
    class simple_cpu_timer
    {
        typedef std::chrono::high_resolution_clock::time_point timepoint;
        typedef std::chrono::high_resolution_clock::duration timeduration;

        bool isRunning{ false };
        timepoint startTime, pauseTime;

        inline timepoint current_time_point() const { return std::chrono::high_resolution_clock::now(); }

    public:

        void start()
        {
            reset();
            isRunning = true;
        }

        void stop()
        {
            pauseTime = current_time_point();
            isRunning = false;
        }

        void reset()
        {
            startTime = current_time_point();
            pauseTime = startTime;
        }

        // Time between start() and stop(), or until now while running
        double elapsed_ms() const
        {
            const timepoint end = isRunning ? current_time_point() : pauseTime;
            return std::chrono::duration<double>(end - startTime).count() * 1000.0;
        }

        bool is_running() const
        {
            return isRunning;
        }
    };

} // end namespace lumina

#endif // end lumina_simple_timer_hpp
