#pragma once

#ifndef lumina_bake_log_hpp
#define lumina_bake_log_hpp

#include "spdlog/spdlog.h"

#include "lumina-core/util/util.hpp"

namespace lumina
{
    typedef std::shared_ptr<spdlog::logger> spdlog_t;

    struct log : public lumina::singleton<log>
    {
        std::vector<spdlog::sink_ptr> sinks;
        spdlog_t bake_log, atlas_log, gpu_log;

        log();

        // Redirects every lumina logger to a single sink (tests capture output this way)
        void set_bake_logger(spdlog::sink_ptr sink);

        friend class lumina::singleton<log>;
    };

    template<> log * singleton<log>::single;

} // end namespace lumina

#endif // end lumina_bake_log_hpp
