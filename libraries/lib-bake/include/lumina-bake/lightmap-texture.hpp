#pragma once

#ifndef lumina_lightmap_texture_hpp
#define lumina_lightmap_texture_hpp

#include "lumina-core/math/math-core.hpp"
#include "lumina-core/util/util.hpp"
#include "lumina-core/util/image-buffer.hpp"

namespace lumina
{
    //////////////////////////
    //   lightmap_texture   //
    //////////////////////////

    // RGBA32F host buffer that render devices mirror into their own texture objects.
    // Writers call mark_dirty() after touching the buffer so devices re-upload on the next use.
    class lightmap_texture : public non_copyable
    {
        image_buffer<float> buffer;
        uint64_t uid;
        uint64_t revision{ 1 };

    public:

        lightmap_texture(const int width, const int height);

        int2 size() const { return buffer.size(); }
        int width() const { return buffer.size().x; }
        int height() const { return buffer.size().y; }
        size_t num_texels() const { return buffer.num_pixels(); }

        float * data() { return buffer.data(); }
        const float * data() const { return buffer.data(); }
        const image_buffer<float> & get_buffer() const { return buffer; }

        float4 get_texel(const size_t index) const;
        void set_texel(const size_t index, const float4 & rgba);

        uint64_t get_uid() const { return uid; }
        uint64_t get_revision() const { return revision; }
        void mark_dirty() { ++revision; }

        void clear();
        void fill_test_pattern();
        void copy_from(const lightmap_texture & other);
    };

    // 4x4 tile checkerboard used to make unsampled texels stand out
    float4 test_pattern_texel(const int x, const int y);

} // end namespace lumina

#endif // end lumina_lightmap_texture_hpp
