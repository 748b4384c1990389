#pragma once

#ifndef lumina_auto_index_hpp
#define lumina_auto_index_hpp

#include "lumina-core/util/geometry.hpp"

namespace lumina
{
    // Builds the face index array of a non-indexed triangle soup (every three vertices form a triangle).
    // Each corner is pointed at the first vertex with an identical position, normal and texcoords, so
    // faces sharing a corner become connected. Vertex arrays are left unchanged.
    // Throws std::invalid_argument if the mesh already has faces or is not a multiple of three vertices.
    void auto_index(runtime_mesh & mesh);

} // end namespace lumina

#endif // end lumina_auto_index_hpp
