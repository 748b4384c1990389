#pragma once

#ifndef lumina_lib_core_hpp
#define lumina_lib_core_hpp

#include "lumina-core/math/math-core.hpp"

#include "lumina-core/util/util.hpp"
#include "lumina-core/util/simple-timer.hpp"
#include "lumina-core/util/image-buffer.hpp"
#include "lumina-core/util/geometry.hpp"
#include "lumina-core/util/procedural-mesh.hpp"

#include "lumina-core/tools/animation-clip.hpp"

#endif // end lumina_lib_core_hpp
