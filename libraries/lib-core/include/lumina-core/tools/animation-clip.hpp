#pragma once

#ifndef lumina_animation_clip_hpp
#define lumina_animation_clip_hpp

#include "lumina-core/math/math-core.hpp"

#include <string>
#include <stdexcept>

namespace lumina
{
    template <typename T>
    struct keyframe_track
    {
        std::vector<float> times; // ascending
        std::vector<T> values;

        bool empty() const { return times.empty(); }
        void add(float time, const T & value)
        {
            if (!times.empty() && time < times.back()) throw std::invalid_argument("keyframes must be added in ascending time order");
            times.push_back(time);
            values.push_back(value);
        }
    };

    // Locates the keyframe pair around `t` and the blend factor between them (clamped to the track ends)
    template <typename T>
    inline void find_keyframes(const keyframe_track<T> & track, float t, size_t & a, size_t & b, float & alpha)
    {
        if (t <= track.times.front()) { a = b = 0; alpha = 0.f; return; }
        if (t >= track.times.back()) { a = b = track.times.size() - 1; alpha = 0.f; return; }

        b = static_cast<size_t>(std::upper_bound(track.times.begin(), track.times.end(), t) - track.times.begin());
        a = b - 1;
        const float span = track.times[b] - track.times[a];
        alpha = span > 0.f ? (t - track.times[a]) / span : 0.f;
    }

    inline float3 sample_track(const keyframe_track<float3> & track, float t, const float3 & fallback)
    {
        if (track.empty()) return fallback;
        size_t a, b; float alpha;
        find_keyframes(track, t, a, b, alpha);
        return mix(track.values[a], track.values[b], alpha);
    }

    inline float4 sample_track(const keyframe_track<float4> & track, float t, const float4 & fallback)
    {
        if (track.empty()) return fallback;
        size_t a, b; float alpha;
        find_keyframes(track, t, a, b, alpha);
        return qslerp(track.values[a], track.values[b], alpha);
    }

    // Rigid-body keyframe animation for a single object. Evaluates to that object's world matrix.
    struct animation_clip
    {
        std::string name;
        keyframe_track<float3> position;
        keyframe_track<float4> rotation; // quaternion xyzw
        keyframe_track<float3> scale;

        float duration() const
        {
            float d = 0.f;
            if (!position.empty()) d = std::max(d, position.times.back());
            if (!rotation.empty()) d = std::max(d, rotation.times.back());
            if (!scale.empty()) d = std::max(d, scale.times.back());
            return d;
        }

        float4x4 evaluate(float time) const
        {
            const float3 p = sample_track(position, time, { 0, 0, 0 });
            const float4 r = sample_track(rotation, time, { 0, 0, 0, 1 });
            const float3 s = sample_track(scale, time, { 1, 1, 1 });
            return make_trs_matrix(p, r, s);
        }
    };

} // end namespace lumina

#endif // end lumina_animation_clip_hpp
