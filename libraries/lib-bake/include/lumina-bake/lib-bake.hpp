#pragma once

#ifndef lumina_lib_bake_hpp
#define lumina_lib_bake_hpp

#include "lumina-bake/logging.hpp"
#include "lumina-bake/bake-settings.hpp"
#include "lumina-bake/workbench.hpp"
#include "lumina-bake/atlas-map.hpp"
#include "lumina-bake/atlas-mapper.hpp"
#include "lumina-bake/auto-uv.hpp"
#include "lumina-bake/auto-index.hpp"
#include "lumina-bake/light-scene.hpp"
#include "lumina-bake/light-probe.hpp"
#include "lumina-bake/render-device.hpp"
#include "lumina-bake/soft-render-device.hpp"
#include "lumina-bake/work-scheduler.hpp"
#include "lumina-bake/irradiance-renderer.hpp"
#include "lumina-bake/compositor.hpp"
#include "lumina-bake/lightmap-baker.hpp"
#include "lumina-bake/lightmap-export.hpp"

#endif // end lumina_lib_bake_hpp
