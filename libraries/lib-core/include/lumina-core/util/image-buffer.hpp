#pragma once

#ifndef lumina_image_buffer_hpp
#define lumina_image_buffer_hpp

#include "lumina-core/math/math-common.hpp"

#include <memory>
#include <cstring>

namespace lumina
{
    // Interleaved, row-major pixel storage. Row 0 is the bottom row, matching GL textures.
    template <typename T>
    class image_buffer
    {
        int2 dims{ 0, 0 };
        int channels{ 0 };
        std::unique_ptr<T[]> buffer;

    public:

        image_buffer() {};
        image_buffer(const int2 & size, const int channels) : dims(size), channels(channels),
            buffer(new T[size_t(size.x) * size_t(size.y) * size_t(channels)]())
        {
        }

        image_buffer(const image_buffer<T> & r) : dims(r.dims), channels(r.channels)
        {
            if (r.buffer)
            {
                buffer.reset(new T[r.num_values()]);
                std::memcpy(buffer.get(), r.buffer.get(), r.size_bytes());
            }
        }

        image_buffer(image_buffer<T> && r) = default;
        image_buffer & operator = (image_buffer<T> && r) = default;

        image_buffer & operator = (const image_buffer<T> & r)
        {
            if (this == &r) return *this;
            dims = r.dims;
            channels = r.channels;
            buffer.reset(r.buffer ? new T[r.num_values()] : nullptr);
            if (r.buffer) std::memcpy(buffer.get(), r.buffer.get(), r.size_bytes());
            return *this;
        }

        int2 size() const { return dims; }
        size_t num_pixels() const { return size_t(dims.x) * size_t(dims.y); }
        size_t num_values() const { return num_pixels() * size_t(channels); }
        size_t size_bytes() const { return num_values() * sizeof(T); }
        int num_channels() const { return channels; }
        bool empty() const { return !buffer; }

        T * data() { return buffer.get(); }
        const T * data() const { return buffer.get(); }

        T & operator()(int y, int x, int channel) { return buffer[size_t(channels) * (size_t(y) * dims.x + x) + channel]; }
        const T & operator()(int y, int x, int channel) const { return buffer[size_t(channels) * (size_t(y) * dims.x + x) + channel]; }

        void fill(const T & value) { std::fill(buffer.get(), buffer.get() + num_values(), value); }
    };

    // Samples a 4-channel float image with repeat wrapping. `uv` of (0, 0) is the bottom-left corner.
    inline float4 sample_nearest(const image_buffer<float> & image, const float2 & uv)
    {
        const int2 size = image.size();
        const int x = wrap_index(int(std::floor(uv.x * size.x)), size.x);
        const int y = wrap_index(int(std::floor(uv.y * size.y)), size.y);
        return { image(y, x, 0), image(y, x, 1), image(y, x, 2), image(y, x, 3) };
    }

    inline float4 sample_bilinear(const image_buffer<float> & image, const float2 & uv)
    {
        const int2 size = image.size();
        const float fx = uv.x * size.x - 0.5f;
        const float fy = uv.y * size.y - 0.5f;
        const int x0 = int(std::floor(fx));
        const int y0 = int(std::floor(fy));
        const float cx = fx - x0;
        const float cy = fy - y0;

        auto fetch = [&](int y, int x) -> float4
        {
            x = wrap_index(x, size.x);
            y = wrap_index(y, size.y);
            return { image(y, x, 0), image(y, x, 1), image(y, x, 2), image(y, x, 3) };
        };

        const float4 bottom = fetch(y0, x0) * (1.f - cx) + fetch(y0, x0 + 1) * cx;
        const float4 top = fetch(y0 + 1, x0) * (1.f - cx) + fetch(y0 + 1, x0 + 1) * cx;
        return bottom * (1.f - cy) + top * cy;
    }

} // end namespace lumina

#endif // end lumina_image_buffer_hpp
