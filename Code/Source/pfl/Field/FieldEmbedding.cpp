/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#include "pfl/Field/FieldEmbedding.h"
#include "pfl/Field/Resample.h"
#include "pfl/Core/PFLException.h"
#include "pfl/Extrapolation/ConstantExtrapolation.h"
#include "pfl/Math/VectorOps.h"

#include <utility>

namespace pfl {
namespace field {

using extrapolation::Extrapolation;
using math::Tensor;

FieldEmbedding::FieldEmbedding(Field field) : field_(std::move(field)) {}

std::string FieldEmbedding::to_string() const {
    return "embedded " + field_.to_string();
}

bool FieldEmbedding::equals(const Extrapolation& other) const {
    auto embedding = dynamic_cast<const FieldEmbedding*>(&other);
    return embedding != nullptr && field_.equals(embedding->field_);
}

ExtrapolationPtr FieldEmbedding::component(const std::string& item) const {
    Field centered = field_.at_centers();
    if (!centered.values().shape().contains(dims::VECTOR)) {
        return ptr();
    }
    return std::make_shared<const FieldEmbedding>(centered.slice(math::Selection{{dims::VECTOR, item}}));
}

ExtrapolationPtr FieldEmbedding::slice(const math::Selection& selection) const {
    // Positions are taken care of by sampling; only non-spatial dimensions are sliced
    math::Selection rest;
    const math::Shape& geometry_shape = field_.geometry()->shape();
    for (const auto& [name, item] : selection) {
        if (name != dims::VECTOR && !geometry_shape.contains(name) && field_.values().shape().contains(name)) {
            rest[name] = item;
        }
    }
    if (rest.empty()) {
        return ptr();
    }
    return std::make_shared<const FieldEmbedding>(field_.slice(rest));
}

ExtrapolationPtr FieldEmbedding::spatial_gradient() const {
    return std::make_shared<const FieldEmbedding>(field_.gradient());
}

ExtrapolationPtr FieldEmbedding::transform(math::UnaryOp op) const {
    return std::make_shared<const FieldEmbedding>(field_.map(op));
}

ExtrapolationPtr FieldEmbedding::combine_with(const Extrapolation& other, math::BinaryOp op,
                                              bool this_is_left) const {
    if (auto constant = dynamic_cast<const extrapolation::ConstantExtrapolation*>(&other)) {
        return std::make_shared<const FieldEmbedding>(field_.combine(constant->value(), op, !this_is_left));
    }
    if (auto embedding = dynamic_cast<const FieldEmbedding*>(&other)) {
        Field combined = this_is_left ? field_.combine(embedding->field_, op, false)
                                      : embedding->field_.combine(field_, op, false);
        return std::make_shared<const FieldEmbedding>(combined);
    }
    return nullptr;
}

Tensor FieldEmbedding::pad_slab(const Tensor& core, const std::string& dim, bool upper, Index width,
                                const extrapolation::PadCoordinates* coords) const {
    PFL_THROW_IF(coords == nullptr, InvalidArgumentException,
                 "Padding with an embedded field needs the sample coordinates");
    const Index n = core.shape().size(dim);
    const auto axes = field_.geometry()->vector_axes();
    std::vector<Tensor> components;
    for (const auto& a : axes) {
        const bool own = a == dim;
        PFL_THROW_IF(!own && !core.shape().contains(a), ShapeMismatchException,
                     "Padded values " + core.shape().to_string() + " lack axis '" + a + "' of " + field_.to_string());
        math::Dim d = core.shape().dim(a);
        if (own) {
            d.size = width;
        }
        std::vector<Real> positions;
        for (Index i = 0; i < d.size; ++i) {
            const Index k = own ? (upper ? n + i : i - width) : i;
            positions.push_back(coords->coordinate(a, k));
        }
        components.push_back(Tensor::from_values(math::Shape{d}, positions));
    }
    Tensor slab = sample_at_points(field_, math::vec(axes, components));
    return slab.expand(core.shape().with_size(dim, width));
}

} // namespace field
} // namespace pfl
