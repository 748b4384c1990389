#include "lumina-gfx-gl/gl-render-device.hpp"

#include <cstddef>

namespace lumina
{
    namespace
    {
        constexpr int MAX_SCENE_LIGHTS = 16;

        const char s_atlasVert[] = R"(#version 330
            layout(location = 0) in vec2 inAtlasUv;
            layout(location = 1) in vec3 inPayload;
            out vec2 v_local;
            flat out float v_faceId;
            void main()
            {
                v_local = inPayload.xy;
                v_faceId = inPayload.z;
                gl_Position = vec4(inAtlasUv * 2.0 - 1.0, 0.0, 1.0);
            }
        )";

        const char s_atlasFrag[] = R"(#version 330
            in vec2 v_local;
            flat in float v_faceId;
            out vec4 f_color;
            void main()
            {
                f_color = vec4(v_local, v_faceId, 0.0);
            }
        )";

        const char s_sceneVert[] = R"(#version 330
            layout(location = 0) in vec3 inPosition;
            layout(location = 1) in vec3 inNormal;
            layout(location = 2) in vec2 inUv0;
            layout(location = 3) in vec2 inUv1;
            uniform mat4 u_viewProj;
            uniform mat4 u_model;
            uniform mat3 u_normalMatrix;
            out vec3 v_position;
            out vec3 v_normal;
            out vec2 v_uv0;
            out vec2 v_uv1;
            void main()
            {
                vec4 world = u_model * vec4(inPosition, 1.0);
                v_position = world.xyz;
                v_normal = u_normalMatrix * inNormal;
                v_uv0 = inUv0;
                v_uv1 = inUv1;
                gl_Position = u_viewProj * world;
            }
        )";

        const char s_sceneFrag[] = R"(#version 330
            const int MAX_LIGHTS = 16;
            const int KIND_SPOT = 1;

            struct scene_light
            {
                int kind;
                vec3 position;
                vec3 direction;
                vec3 radiance;
                vec4 params; // cone cos outer, cone cos inner, distance, decay
                int shadowLayer;
                mat4 shadowMatrix;
            };

            uniform scene_light u_lights[MAX_LIGHTS];
            uniform int u_lightCount;
            uniform sampler2DArray s_shadowMaps;

            uniform vec3 u_albedo;
            uniform int u_hasAlbedoMap;
            uniform sampler2D s_albedo;
            uniform vec3 u_emissive;
            uniform int u_hasEmissiveMap;
            uniform sampler2D s_emissive;
            uniform int u_hasLightmap;
            uniform sampler2D s_lightmap;

            in vec3 v_position;
            in vec3 v_normal;
            in vec2 v_uv0;
            in vec2 v_uv1;
            out vec4 f_color;

            bool is_shadowed(scene_light light, vec3 position, vec3 normal)
            {
                if (light.shadowLayer < 0) return false;
                vec4 clip = light.shadowMatrix * vec4(position + normal * 0.001, 1.0);
                vec3 coord = (clip.xyz / clip.w) * 0.5 + 0.5;
                if (any(lessThan(coord, vec3(0.0))) || any(greaterThan(coord, vec3(1.0)))) return false;
                float occluder = texture(s_shadowMaps, vec3(coord.xy, float(light.shadowLayer))).r;
                return coord.z - 0.0005 > occluder;
            }

            vec3 evaluate_light(scene_light light, vec3 position, vec3 normal)
            {
                vec3 toLight = -light.direction;
                float lightDistance = 0.0;
                if (light.kind == KIND_SPOT)
                {
                    vec3 delta = light.position - position;
                    lightDistance = length(delta);
                    toLight = lightDistance > 0.0 ? delta / lightDistance : vec3(0.0);
                }

                float nDotL = dot(normal, toLight);
                if (nDotL <= 0.0) return vec3(0.0);
                if (light.kind != KIND_SPOT) return light.radiance * nDotL;

                float cosTheta = dot(-toLight, light.direction);
                float spot = (light.params.y - light.params.x > 1e-6) ? smoothstep(light.params.x, light.params.y, cosTheta) : step(light.params.x, cosTheta);

                float attenuation = 1.0;
                if (light.params.z > 0.0 && light.params.w > 0.0) attenuation = pow(clamp(1.0 - lightDistance / light.params.z, 0.0, 1.0), light.params.w);

                return light.radiance * (nDotL * spot * attenuation);
            }

            void main()
            {
                vec3 normal = normalize(v_normal);

                vec3 albedo = u_albedo;
                if (u_hasAlbedoMap != 0) albedo *= texture(s_albedo, v_uv0).rgb;

                vec3 emissive = u_emissive;
                if (u_hasEmissiveMap != 0) emissive *= texture(s_emissive, v_uv0).rgb;

                vec3 irradiance = vec3(0.0);
                for (int i = 0; i < u_lightCount; ++i)
                {
                    vec3 direct = evaluate_light(u_lights[i], v_position, normal);
                    if (direct == vec3(0.0)) continue;
                    if (is_shadowed(u_lights[i], v_position, normal)) continue;
                    irradiance += direct;
                }

                if (u_hasLightmap != 0)
                {
                    ivec2 size = textureSize(s_lightmap, 0);
                    ivec2 texel = min(ivec2(floor(fract(v_uv1) * vec2(size))), size - 1);
                    irradiance += texelFetch(s_lightmap, texel, 0).rgb;
                }

                f_color = vec4(albedo * irradiance + emissive, 1.0);
            }
        )";

        const char s_shadowVert[] = R"(#version 330
            layout(location = 0) in vec3 inPosition;
            uniform mat4 u_viewProj;
            uniform mat4 u_model;
            void main()
            {
                gl_Position = u_viewProj * u_model * vec4(inPosition, 1.0);
            }
        )";

        const char s_shadowFrag[] = R"(#version 330
            void main() {}
        )";

        // Fullscreen triangle generated from gl_VertexID
        const char s_compositeVert[] = R"(#version 330
            void main()
            {
                vec2 p = vec2((gl_VertexID << 1) & 2, gl_VertexID & 2);
                gl_Position = vec4(p * 2.0 - 1.0, 0.0, 1.0);
            }
        )";

        const char s_compositeFrag[] = R"(#version 330
            uniform sampler2D s_layer;
            uniform vec2 u_targetSize;
            uniform float u_multiplier;
            out vec4 f_color;
            void main()
            {
                ivec2 size = textureSize(s_layer, 0);
                vec2 uv = gl_FragCoord.xy / u_targetSize;
                ivec2 texel = min(ivec2(floor(uv * vec2(size))), size - 1);
                f_color = vec4(texelFetch(s_layer, texel, 0).rgb * u_multiplier, 0.0);
            }
        )";

        struct scene_vertex
        {
            float3 position;
            float3 normal;
            float2 uv0;
            float2 uv1;
        };

        GLenum to_gl_filter(const texture_filter filter)
        {
            return filter == texture_filter::nearest ? GL_NEAREST : GL_LINEAR;
        }
    }

    gl_render_device::gl_render_device(const texture_filter outputFilter, const int shadowMapResolution)
        : outputFilter(outputFilter), shadowMapResolution(shadowMapResolution)
    {
        if (shadowMapResolution <= 0) throw std::invalid_argument("shadow map resolution must be positive");

        atlasProgram = GlShader(s_atlasVert, s_atlasFrag);
        sceneProgram = GlShader(s_sceneVert, s_sceneFrag);
        shadowProgram = GlShader(s_shadowVert, s_shadowFrag);
        compositeProgram = GlShader(s_compositeVert, s_compositeFrag);

        gl_check_error(__FILE__, __LINE__);
    }

    void gl_render_device::rasterize_atlas(const std::vector<atlas_raster_vertex> & triangles, image_buffer<float> & target)
    {
        if (target.num_channels() != 4) throw std::invalid_argument("atlas target must have 4 channels");

        const int2 size = target.size();

        GlTexture2D color;
        color.setup(size.x, size.y, GL_RGBA32F, GL_RGBA, GL_FLOAT, nullptr);

        glBindFramebuffer(GL_FRAMEBUFFER, atlasFramebuffer);
        glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, color, 0);
        atlasFramebuffer.check_complete();

        GlVertexArray vao;
        GlBuffer vertexBuffer;
        glBindVertexArray(vao);
        vertexBuffer.set_buffer_data(GL_ARRAY_BUFFER, GLsizeiptr(triangles.size() * sizeof(atlas_raster_vertex)), triangles.data(), GL_STREAM_DRAW);
        glEnableVertexAttribArray(0);
        glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, sizeof(atlas_raster_vertex), (const GLvoid *) offsetof(atlas_raster_vertex, atlas_uv));
        glEnableVertexAttribArray(1);
        glVertexAttribPointer(1, 3, GL_FLOAT, GL_FALSE, sizeof(atlas_raster_vertex), (const GLvoid *) offsetof(atlas_raster_vertex, payload));

        glViewport(0, 0, size.x, size.y);
        glDisable(GL_DEPTH_TEST);
        glDisable(GL_CULL_FACE);
        glDisable(GL_BLEND);
        glDisable(GL_SCISSOR_TEST);
        glClearColor(0.f, 0.f, 0.f, 0.f);
        glClear(GL_COLOR_BUFFER_BIT);

        // the face id is flat and must come from the first corner
        glProvokingVertex(GL_FIRST_VERTEX_CONVENTION);

        atlasProgram.bind();
        glDrawArrays(GL_TRIANGLES, 0, GLsizei(triangles.size()));
        atlasProgram.unbind();

        glProvokingVertex(GL_LAST_VERTEX_CONVENTION);
        glBindVertexArray(0);

        glPixelStorei(GL_PACK_ALIGNMENT, 1);
        glReadPixels(0, 0, size.x, size.y, GL_RGBA, GL_FLOAT, target.data());
        glBindFramebuffer(GL_FRAMEBUFFER, 0);

        gl_check_error(__FILE__, __LINE__);
    }

    void gl_render_device::begin_probe_target(const int2 & size, const float3 & clearColor)
    {
        if (size.x <= 0 || size.y <= 0) throw std::invalid_argument("probe target must have a positive size");

        if (probeSize != size)
        {
            probeColor.setup(size.x, size.y, GL_RGBA32F, GL_RGBA, GL_FLOAT, nullptr);
            probeDepth.setup(GL_DEPTH_COMPONENT24, size.x, size.y);

            glBindFramebuffer(GL_FRAMEBUFFER, probeFramebuffer);
            glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, probeColor, 0);
            glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_DEPTH_ATTACHMENT, GL_RENDERBUFFER, probeDepth);
            probeFramebuffer.check_complete();

            probeSize = size;
            log::get()->gpu_log->info("probe target resized to {}x{}", size.x, size.y);
        }

        glBindFramebuffer(GL_FRAMEBUFFER, probeFramebuffer);
        glViewport(0, 0, size.x, size.y);
        glDisable(GL_SCISSOR_TEST);
        glDepthMask(GL_TRUE);
        glClearColor(clearColor.x, clearColor.y, clearColor.z, 0.f);
        glClearDepth(1.0);
        glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

        gl_check_error(__FILE__, __LINE__);
    }

    GLuint gl_render_device::get_material_texture(const image_buffer<float> & image)
    {
        auto it = materialTextures.find(&image);
        if (it != materialTextures.end()) return it->second;

        GLenum format;
        switch (image.num_channels())
        {
        case 1: format = GL_RED; break;
        case 3: format = GL_RGB; break;
        case 4: format = GL_RGBA; break;
        default: throw std::invalid_argument("unsupported material texture channel count: " + std::to_string(image.num_channels()));
        }

        GlTexture2D & texture = materialTextures[&image];
        texture.setup(image.size().x, image.size().y, GL_RGBA32F, format, GL_FLOAT, image.data(), GL_LINEAR);
        return texture;
    }

    GLuint gl_render_device::get_texture(const lightmap_texture & texture)
    {
        device_texture & entry = lightmapTextures[texture.get_uid()];

        if (entry.texture.size != texture.size())
        {
            entry.texture.setup(texture.width(), texture.height(), GL_RGBA32F, GL_RGBA, GL_FLOAT, texture.data(), to_gl_filter(outputFilter));
            entry.revision = texture.get_revision();
        }
        else if (entry.revision != texture.get_revision())
        {
            entry.texture.upload(GL_RGBA, GL_FLOAT, texture.data());
            entry.revision = texture.get_revision();
        }

        return entry.texture;
    }

    void gl_render_device::prepare_scene(const light_scene & scene)
    {
        if (scene.uid == sceneUid) return;

        if (scene.lights.size() > MAX_SCENE_LIGHTS)
        {
            throw std::runtime_error("light scene has " + std::to_string(scene.lights.size()) + " lights, the GL device supports " + std::to_string(MAX_SCENE_LIGHTS));
        }

        sceneUid = scene.uid;
        sceneMeshes.clear();
        sceneMeshes.resize(scene.items.size());
        materialTextures.clear();

        for (size_t i = 0; i < scene.items.size(); ++i)
        {
            const auto & item = scene.items[i];
            if (!item.mesh) continue;

            const runtime_mesh & mesh = *item.mesh;

            runtime_mesh withNormals;
            const std::vector<float3> * normals = &mesh.normals;
            if (mesh.normals.size() != mesh.vertices.size())
            {
                withNormals.vertices = mesh.vertices;
                withNormals.faces = mesh.faces;
                compute_normals(withNormals);
                normals = &withNormals.normals;
            }

            std::vector<scene_vertex> vertices(mesh.vertices.size());
            for (size_t v = 0; v < vertices.size(); ++v)
            {
                vertices[v].position = mesh.vertices[v];
                vertices[v].normal = (*normals)[v];
                vertices[v].uv0 = v < mesh.texcoord0.size() ? mesh.texcoord0[v] : float2(0, 0);
                vertices[v].uv1 = v < mesh.texcoord1.size() ? mesh.texcoord1[v] : float2(0, 0);
            }

            scene_mesh & m = sceneMeshes[i];
            glBindVertexArray(m.vao);
            m.vertexBuffer.set_buffer_data(GL_ARRAY_BUFFER, GLsizeiptr(vertices.size() * sizeof(scene_vertex)), vertices.data(), GL_STATIC_DRAW);
            m.indexBuffer.set_buffer_data(GL_ELEMENT_ARRAY_BUFFER, GLsizeiptr(mesh.faces.size() * sizeof(uint3)), mesh.faces.data(), GL_STATIC_DRAW);
            m.indexCount = GLsizei(mesh.faces.size() * 3);

            glEnableVertexAttribArray(0);
            glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, sizeof(scene_vertex), (const GLvoid *) offsetof(scene_vertex, position));
            glEnableVertexAttribArray(1);
            glVertexAttribPointer(1, 3, GL_FLOAT, GL_FALSE, sizeof(scene_vertex), (const GLvoid *) offsetof(scene_vertex, normal));
            glEnableVertexAttribArray(2);
            glVertexAttribPointer(2, 2, GL_FLOAT, GL_FALSE, sizeof(scene_vertex), (const GLvoid *) offsetof(scene_vertex, uv0));
            glEnableVertexAttribArray(3);
            glVertexAttribPointer(3, 2, GL_FLOAT, GL_FALSE, sizeof(scene_vertex), (const GLvoid *) offsetof(scene_vertex, uv1));
            glBindVertexArray(0);
        }

        render_shadow_maps(scene);

        gl_check_error(__FILE__, __LINE__);
    }

    void gl_render_device::render_shadow_maps(const light_scene & scene)
    {
        shadowLayers.assign(scene.lights.size(), -1);

        int layerCount = 0;
        for (size_t l = 0; l < scene.lights.size(); ++l)
        {
            if (scene.lights[l].cast_shadow) shadowLayers[l] = layerCount++;
        }
        if (layerCount == 0) return;

        if (shadowMaps.size != int3(shadowMapResolution, shadowMapResolution, layerCount))
        {
            shadowMaps.setup(GL_TEXTURE_2D_ARRAY, shadowMapResolution, shadowMapResolution, layerCount, GL_DEPTH_COMPONENT32F, GL_DEPTH_COMPONENT, GL_FLOAT, nullptr);
        }

        glBindFramebuffer(GL_FRAMEBUFFER, shadowFramebuffer);
        glDrawBuffer(GL_NONE);
        glReadBuffer(GL_NONE);
        glViewport(0, 0, shadowMapResolution, shadowMapResolution);
        glDisable(GL_SCISSOR_TEST);
        glDisable(GL_BLEND);
        glEnable(GL_DEPTH_TEST);
        glDepthFunc(GL_LESS);
        glDepthMask(GL_TRUE);
        glDisable(GL_CULL_FACE); // occluders are double-sided

        shadowProgram.bind();

        for (size_t l = 0; l < scene.lights.size(); ++l)
        {
            if (shadowLayers[l] < 0) continue;

            const light_scene_light & light = scene.lights[l];
            glFramebufferTextureLayer(GL_FRAMEBUFFER, GL_DEPTH_ATTACHMENT, shadowMaps, 0, shadowLayers[l]);
            shadowFramebuffer.check_complete();
            glClear(GL_DEPTH_BUFFER_BIT);

            shadowProgram.uniform("u_viewProj", mul(light.shadow_projection, light.shadow_view));

            for (size_t i = 0; i < scene.items.size(); ++i)
            {
                if (!sceneMeshes[i].indexCount) continue;
                shadowProgram.uniform("u_model", scene.items[i].world_matrix);
                glBindVertexArray(sceneMeshes[i].vao);
                glDrawElements(GL_TRIANGLES, sceneMeshes[i].indexCount, GL_UNSIGNED_INT, nullptr);
            }
        }

        glBindVertexArray(0);
        shadowProgram.unbind();
        glBindFramebuffer(GL_FRAMEBUFFER, 0);

        gl_check_error(__FILE__, __LINE__);
    }

    void gl_render_device::render_light_scene(const light_scene & scene, const probe_view & view)
    {
        if (probeSize.x == 0) throw std::runtime_error("render_light_scene called without a bound probe target");

        prepare_scene(scene);

        glBindFramebuffer(GL_FRAMEBUFFER, probeFramebuffer);
        glViewport(view.viewport.x, view.viewport.y, view.viewport.z, view.viewport.w);
        glEnable(GL_SCISSOR_TEST);
        glScissor(view.scissor.x, view.scissor.y, view.scissor.z, view.scissor.w);
        glEnable(GL_DEPTH_TEST);
        glDepthFunc(GL_LESS);
        glDepthMask(GL_TRUE);
        glEnable(GL_CULL_FACE);
        glCullFace(GL_BACK);
        glFrontFace(GL_CCW);
        glDisable(GL_BLEND);

        sceneProgram.bind();
        sceneProgram.uniform("u_viewProj", mul(view.projection, view.view));
        sceneProgram.uniform("u_lightCount", int(scene.lights.size()));

        for (size_t l = 0; l < scene.lights.size(); ++l)
        {
            const light_scene_light & light = scene.lights[l];
            const std::string prefix = "u_lights[" + std::to_string(l) + "].";
            sceneProgram.uniform(prefix + "kind", light.kind == light_kind::spot ? 1 : 0);
            sceneProgram.uniform(prefix + "position", light.position);
            sceneProgram.uniform(prefix + "direction", light.direction);
            sceneProgram.uniform(prefix + "radiance", light.radiance);
            sceneProgram.uniform(prefix + "params", float4(light.cone_cos_outer, light.cone_cos_inner, light.distance, light.decay));
            sceneProgram.uniform(prefix + "shadowLayer", shadowLayers[l]);
            sceneProgram.uniform(prefix + "shadowMatrix", mul(light.shadow_projection, light.shadow_view));
        }

        sceneProgram.texture("s_shadowMaps", 3, shadowMaps, GL_TEXTURE_2D_ARRAY);

        for (size_t i = 0; i < scene.items.size(); ++i)
        {
            const light_scene_item & item = scene.items[i];
            if (!sceneMeshes[i].indexCount) continue;

            sceneProgram.uniform("u_model", item.world_matrix);
            sceneProgram.uniform("u_normalMatrix", make_normal_matrix(item.world_matrix));
            sceneProgram.uniform("u_albedo", item.albedo);
            sceneProgram.uniform("u_emissive", item.emissive);

            sceneProgram.uniform("u_hasAlbedoMap", item.albedo_map ? 1 : 0);
            if (item.albedo_map) sceneProgram.texture("s_albedo", 0, get_material_texture(*item.albedo_map), GL_TEXTURE_2D);

            sceneProgram.uniform("u_hasEmissiveMap", item.emissive_map ? 1 : 0);
            if (item.emissive_map) sceneProgram.texture("s_emissive", 1, get_material_texture(*item.emissive_map), GL_TEXTURE_2D);

            sceneProgram.uniform("u_hasLightmap", item.lightmap ? 1 : 0);
            if (item.lightmap) sceneProgram.texture("s_lightmap", 2, get_texture(*item.lightmap), GL_TEXTURE_2D);

            glBindVertexArray(sceneMeshes[i].vao);
            glDrawElements(GL_TRIANGLES, sceneMeshes[i].indexCount, GL_UNSIGNED_INT, nullptr);
        }

        glBindVertexArray(0);
        sceneProgram.unbind();
        glDisable(GL_SCISSOR_TEST);

        gl_check_error(__FILE__, __LINE__);
    }

    void gl_render_device::read_probe_target(image_buffer<float> & out)
    {
        if (probeSize.x == 0) throw std::runtime_error("read_probe_target called without a bound probe target");

        if (out.size() != probeSize || out.num_channels() != 4) out = image_buffer<float>(probeSize, 4);

        glBindFramebuffer(GL_FRAMEBUFFER, probeFramebuffer);
        glPixelStorei(GL_PACK_ALIGNMENT, 1);
        glReadPixels(0, 0, probeSize.x, probeSize.y, GL_RGBA, GL_FLOAT, out.data());

        gl_check_error(__FILE__, __LINE__);
    }

    void gl_render_device::composite_layers(const std::vector<composite_layer> & layers, lightmap_texture & target)
    {
        const int2 size = target.size();

        if (compositeColor.size != size)
        {
            compositeColor.setup(size.x, size.y, GL_RGBA32F, GL_RGBA, GL_FLOAT, nullptr);
            glBindFramebuffer(GL_FRAMEBUFFER, compositeFramebuffer);
            glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, compositeColor, 0);
            compositeFramebuffer.check_complete();
        }

        glBindFramebuffer(GL_FRAMEBUFFER, compositeFramebuffer);
        glViewport(0, 0, size.x, size.y);
        glDisable(GL_DEPTH_TEST);
        glDisable(GL_CULL_FACE);
        glDisable(GL_SCISSOR_TEST);
        glClearColor(0.f, 0.f, 0.f, 1.f);
        glClear(GL_COLOR_BUFFER_BIT);

        glEnable(GL_BLEND);
        glBlendFunc(GL_ONE, GL_ONE);

        compositeProgram.bind();
        compositeProgram.uniform("u_targetSize", float2(size));
        glBindVertexArray(emptyVao);

        for (const auto & layer : layers)
        {
            if (!layer.texture || layer.multiplier == 0.f) continue;
            compositeProgram.texture("s_layer", 0, get_texture(*layer.texture), GL_TEXTURE_2D);
            compositeProgram.uniform("u_multiplier", layer.multiplier);
            glDrawArrays(GL_TRIANGLES, 0, 3);
        }

        glBindVertexArray(0);
        compositeProgram.unbind();
        glDisable(GL_BLEND);

        glPixelStorei(GL_PACK_ALIGNMENT, 1);
        glReadPixels(0, 0, size.x, size.y, GL_RGBA, GL_FLOAT, target.data());
        glBindFramebuffer(GL_FRAMEBUFFER, 0);
        target.mark_dirty();

        gl_check_error(__FILE__, __LINE__);
    }

} // end namespace lumina
