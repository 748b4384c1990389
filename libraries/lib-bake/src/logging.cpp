#include "lumina-bake/logging.hpp"

#include "spdlog/sinks/stdout_color_sinks.h"

namespace lumina
{
    template<> log * singleton<log>::single = nullptr;

    log::log()
    {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

        bake_log = std::make_shared<spdlog::logger>("lumina-bake-log", sinks[0]);
        atlas_log = std::make_shared<spdlog::logger>("lumina-atlas-log", sinks[0]);
        gpu_log = std::make_shared<spdlog::logger>("lumina-gpu-log", sinks[0]);
    }

    void log::set_bake_logger(spdlog::sink_ptr sink)
    {
        sinks = { sink };
        bake_log = std::make_shared<spdlog::logger>("lumina-bake-log", sink);
        atlas_log = std::make_shared<spdlog::logger>("lumina-atlas-log", sink);
        gpu_log = std::make_shared<spdlog::logger>("lumina-gpu-log", sink);
    }

} // end namespace lumina
