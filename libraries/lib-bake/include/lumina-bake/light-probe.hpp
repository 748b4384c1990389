#pragma once

#ifndef lumina_light_probe_hpp
#define lumina_light_probe_hpp

#include "lumina-bake/render-device.hpp"
#include "lumina-bake/atlas-map.hpp"

#include <array>
#include <functional>

namespace lumina
{
    // World-space frame a probe is rendered from
    struct probe_placement
    {
        float3 position;
        float3 normal;
        float3 u;
        float3 v;
    };

    // Surface frame at face-local (u, v) of an atlas item face, carried into world space by `world`
    probe_placement make_probe_placement(const atlas_map_item & item, const uint32_t faceIndex, const float u, const float v, const float4x4 & world);

    // Per-pixel solid-angle weight of a square 90 degree view: pixels further from the center cover less of the hemisphere
    std::vector<float> make_probe_area_lookup(const int probeSize);

    class light_probe_sampler;

    // Access to one batch slot of the most recent readback
    class probe_readback
    {
        const light_probe_sampler & sampler;
        const image_buffer<float> & pixels;
        int slot;

    public:

        probe_readback(const light_probe_sampler & sampler, const image_buffer<float> & pixels, const int slot) : sampler(sampler), pixels(pixels), slot(slot) {}

        int get_slot() const { return slot; }

        // Area-weighted RGB over the up view and the upper halves of the side views, alpha 1
        float4 average() const;
    };

    /////////////////////////////
    //   light_probe_sampler   //
    /////////////////////////////

    // Renders batches of five-view hemicube probes into one shared target. Each batch slot occupies
    // a 4 x 2 tile region: the up view on the top row, the four side views (+U, -U, +V, -V) below it.
    class light_probe_sampler
    {
        friend class probe_readback;

        int probeSize;
        int batchCount;
        std::vector<float> areaLookup;
        image_buffer<float> readback;
        std::vector<int64_t> batchTexels;

    public:

        typedef std::function<void(const size_t texelIndex, const probe_placement & placement)> queue_fn;
        typedef std::function<void(const queue_fn & queue)> request_fn;
        typedef std::function<void(const size_t texelIndex, const probe_readback & readback)> consume_fn;

        static constexpr float fov_degrees = 90.f;
        static constexpr float near_clip = 0.05f;
        static constexpr float far_clip = 50.f;

        light_probe_sampler(const int probeSize = 16, const int batchCount = 8);

        int get_probe_size() const { return probeSize; }
        int get_batch_count() const { return batchCount; }
        int2 get_target_size() const { return { probeSize * 4, probeSize * 2 * batchCount }; }
        const std::vector<float> & get_area_lookup() const { return areaLookup; }

        // The five views of batch slot `slot`: up view first, then +U, -U, +V, -V
        std::array<probe_view, 5> make_probe_views(const probe_placement & placement, const int slot) const;

        // Fills up to batch_count slots via `request`, stopping at the first slot left empty, reads the
        // target back once and hands each filled slot to `consume` in order. Returns the filled slot count.
        int render_batch(render_device & device, const light_scene & scene, const request_fn & request, const consume_fn & consume);
    };

} // end namespace lumina

#endif // end lumina_light_probe_hpp
