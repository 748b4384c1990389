#pragma once

#ifndef lumina_serialization_hpp
#define lumina_serialization_hpp

#include <string>
#include <type_traits>
#include <stdexcept>

#include "lumina-core/math/math-core.hpp"

#include <nlohmann/json.hpp>

// Variadic unpacking of field metadata. SFINAE keeps discarding the leading argument
// until the requested metadata type matches, and returns nullptr when none does.
template<class T, class A, class... O>
std::enable_if_t<!std::is_same<T, A>::value, const T *> unpack(const A & first, const O & ... others)
{
    return unpack<T>(others...);
}

template<class T, class... O>
const T * unpack(const T & meta, const O & ... others) { return &meta; }

template<class T>
const T * unpack() { return nullptr; }

template<class T> struct range_metadata { T min, max; };
struct even_metadata {};

using json = nlohmann::json;

namespace linalg
{
    // json conversion for linalg vectors, found by ADL
    template<class T, int M> void to_json(json & archive, const vec<T, M> & v)
    {
        archive = json::array();
        for (int i = 0; i < M; ++i) archive.push_back(v[i]);
    }

    template<class T, int M> void from_json(const json & archive, vec<T, M> & v)
    {
        if (!archive.is_array() || archive.size() != M) throw std::invalid_argument("expected json array of " + std::to_string(M) + " numbers");
        for (int i = 0; i < M; ++i) v[i] = archive.at(i).get<T>();
    }
}

#endif // end lumina_serialization_hpp
