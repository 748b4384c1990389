#pragma once

#ifndef lumina_bake_settings_hpp
#define lumina_bake_settings_hpp

#include "lumina-bake/serialization.hpp"

namespace lumina
{
    enum class texture_filter : uint32_t
    {
        nearest,
        linear
    };

    NLOHMANN_JSON_SERIALIZE_ENUM(texture_filter, {
        { texture_filter::nearest, "nearest" },
        { texture_filter::linear, "linear" },
    })

    ///////////////////////
    //   bake_settings   //
    ///////////////////////

    struct bake_settings
    {
        int atlas_width{ 64 };
        int atlas_height{ 64 };
        int probe_size{ 16 };               // side of one probe view in pixels
        int probe_batch_count{ 8 };         // texels rendered before each readback
        int pass_count{ 2 };                // bounce passes per renderer
        int texel_budget{ 100 };            // texels examined per scheduler step
        float frame_budget_ms{ 0.f };       // 0: exactly one step per tick
        float emissive_multiplier{ 32.f };  // display -> physical emissive conversion
        float3 sky_color{ 0, 0, 0 };        // radiance seen by probes where nothing is hit
        float auto_uv_world_width{ 0.f };   // world extent covered by the atlas width, 0 disables auto-UV
        texture_filter output_filter{ texture_filter::linear };
    };

    template<class F> void visit_fields(bake_settings & o, F f)
    {
        f("atlas_width",          o.atlas_width,          range_metadata<int>{ 1, 8192 });
        f("atlas_height",         o.atlas_height,         range_metadata<int>{ 1, 8192 });
        f("probe_size",           o.probe_size,           range_metadata<int>{ 2, 256 }, even_metadata{});
        f("probe_batch_count",    o.probe_batch_count,    range_metadata<int>{ 1, 64 });
        f("pass_count",           o.pass_count,           range_metadata<int>{ 1, 16 });
        f("texel_budget",         o.texel_budget,         range_metadata<int>{ 1, 1000000 });
        f("frame_budget_ms",      o.frame_budget_ms,      range_metadata<float>{ 0.f, 1000.f });
        f("emissive_multiplier",  o.emissive_multiplier,  range_metadata<float>{ 0.f, 1.0e6f });
        f("sky_color",            o.sky_color);
        f("auto_uv_world_width",  o.auto_uv_world_width,  range_metadata<float>{ 0.f, 1.0e6f });
        f("output_filter",        o.output_filter);
    }

    void to_json(json & archive, const bake_settings & s);
    void from_json(const json & archive, bake_settings & s);

    // Throws std::invalid_argument naming the first field outside its declared range
    void validate_bake_settings(const bake_settings & s);

    bake_settings load_bake_settings(const std::string & path);
    void save_bake_settings(const std::string & path, const bake_settings & s);

} // end namespace lumina

#endif // end lumina_bake_settings_hpp
