#pragma once

#ifndef lumina_lightmap_export_hpp
#define lumina_lightmap_export_hpp

#include "lumina-bake/lightmap-texture.hpp"

namespace lumina
{
    // Radiance .hdr, linear RGB. Rows are written top-down (atlas row 0 ends up at the bottom).
    void export_lightmap_hdr(const lightmap_texture & texture, const std::string & path);

    // 8-bit RGBA .png of `rgb * exposure`, clamped to [0, 1] without tone mapping. Alpha is always 255.
    void export_lightmap_png(const lightmap_texture & texture, const std::string & path, const float exposure = 1.f);

} // end namespace lumina

#endif // end lumina_lightmap_export_hpp
