/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_CORE_MEMOIZED_H
#define PFL_CORE_MEMOIZED_H

/**
 * @file Memoized.h
 * @brief Compute-once storage for derived properties of immutable objects
 */

#include <mutex>
#include <optional>
#include <utility>

namespace pfl {

/**
 * @brief Lazily computed, never invalidated value
 *
 * The owning object is immutable, so the cached value stays valid for its
 * whole lifetime. Concurrent first accesses compute the value exactly once.
 * Copies start with an empty cache.
 */
template<typename T>
class Memoized {
public:
    Memoized() = default;
    Memoized(const Memoized&) {}
    Memoized& operator=(const Memoized&) { return *this; }

    template<typename Compute>
    const T& get(Compute&& compute) const {
        std::call_once(flag_, [&]() { value_.emplace(std::forward<Compute>(compute)()); });
        return *value_;
    }

private:
    mutable std::once_flag flag_;
    mutable std::optional<T> value_;
};

} // namespace pfl

#endif // PFL_CORE_MEMOIZED_H
