/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#include "pfl/Field/FieldMath.h"
#include "pfl/Field/Resample.h"
#include "pfl/Core/PFLException.h"
#include "pfl/Geometry/Point.h"
#include "pfl/Geometry/Sphere.h"
#include "pfl/Geometry/UniformGrid.h"

#include <optional>

namespace pfl {
namespace field {

using geometry::GeometryType;
using math::Selection;
using math::Shape;
using math::Tensor;

namespace {

void check_compatible(const std::vector<Field>& fields, const char* operation) {
    PFL_CHECK_ARG(!fields.empty(), std::string("Cannot ") + operation + " an empty list of fields");
    const Field& first = fields.front();
    for (const auto& f : fields) {
        PFL_THROW_IF(!extrapolation::same(f.boundary(), first.boundary()), NotImplementedException,
                     std::string(operation) + " fields with different boundaries");
        PFL_CHECK_ARG(f.sampled_at() == first.sampled_at(),
                      std::string("Cannot ") + operation + " centered and staggered fields");
    }
}

} // namespace

Field stack(const std::vector<Field>& fields, const math::Dim& dim) {
    check_compatible(fields, "stack");
    const Field& first = fields.front();
    bool shared = true;
    std::vector<GeometryPtr> geometries;
    for (const auto& f : fields) {
        shared = shared && f.geometry()->equals(*first.geometry());
        geometries.push_back(f.geometry());
    }
    GeometryPtr geometry = shared ? first.geometry() : geometry::stack(geometries, dim);

    Tensor values;
    if (first.values().is_uniform()) {
        std::vector<Tensor> parts;
        for (const auto& f : fields) {
            parts.push_back(f.values());
        }
        values = Tensor::stack(parts, dim);
    } else {
        // Staggered grids: stack every face component separately
        const math::Dim& faces = first.values().shape().dim(first.values().stack_dim());
        std::vector<Tensor> components;
        for (Index i = 0; i < faces.size; ++i) {
            std::vector<Tensor> parts;
            for (const auto& f : fields) {
                parts.push_back(f.values().component(i, faces.name));
            }
            components.push_back(Tensor::stack(parts, dim));
        }
        values = Tensor::stack(components, faces);
    }
    return Field(geometry, values, first.boundary(), first.sampled_at());
}

Field concat(const std::vector<Field>& fields, const std::string& dim) {
    check_compatible(fields, "concatenate");
    const Field& first = fields.front();
    const GeometryType type = first.geometry()->type();
    std::vector<Tensor> centers;
    std::vector<Tensor> radii;
    std::vector<Tensor> values;
    for (const auto& f : fields) {
        PFL_THROW_IF(f.geometry()->type() != type, NotImplementedException,
                     std::string("concatenating ") + geometry::to_string(type) + " and " +
                         geometry::to_string(f.geometry()->type()) + " fields");
        PFL_CHECK_SHAPE(f.geometry()->shape().contains(dim),
                        "Cannot concatenate along '" + dim + "', not a dimension of " + f.geometry()->to_string());
        const Shape along = f.geometry()->shape().only(std::vector<std::string>{dim});
        centers.push_back(f.geometry()->center());
        values.push_back(f.values().expand(along));
        if (type == GeometryType::Sphere) {
            radii.push_back(static_cast<const geometry::Sphere&>(*f.geometry()).radius().expand(along));
        }
    }
    GeometryPtr geometry;
    if (type == GeometryType::Point) {
        geometry = std::make_shared<const geometry::Point>(Tensor::concat(centers, dim));
    } else if (type == GeometryType::Sphere) {
        geometry = std::make_shared<const geometry::Sphere>(Tensor::concat(centers, dim), Tensor::concat(radii, dim));
    } else {
        PFL_NOT_IMPLEMENTED(std::string("concatenating ") + geometry::to_string(type) + " fields");
    }
    return Field(geometry, Tensor::concat(values, dim), first.boundary());
}

Field pad(const Field& field, const extrapolation::PadWidths& widths) {
    PFL_THROW_IF(!field.is_grid(), NotImplementedException, "padding " + field.to_string());
    const auto& grid = static_cast<const geometry::UniformGrid&>(*field.geometry());
    auto padded_grid = grid.padded(widths);
    const ExtrapolationPtr& rule = field.boundary();
    if (field.is_centered()) {
        extrapolation::PadCoordinates coords = sample_coordinates(grid);
        return Field(padded_grid, rule->pad(field.values(), widths, &coords), rule);
    }
    std::vector<Tensor> components;
    for (const auto& a : grid.axes()) {
        extrapolation::PadCoordinates coords = sample_coordinates(grid, a);
        Tensor faces = rule->component(a)->pad(field.face_component(a), widths, &coords);
        const auto [lower_stored, upper_stored] = rule->valid_outer_faces(a);
        components.push_back(faces.slice(Selection{
            {a, math::Range{Index(lower_stored ? 0 : 1),
                            upper_stored ? std::optional<Index>() : std::optional<Index>(-1)}}}));
    }
    return Field(padded_grid, Tensor::stack(components, math::dual(dims::VECTOR, grid.axes())), rule,
                 SampleLocation::Face);
}

Field pad(const Field& field, Index width) {
    extrapolation::PadWidths widths;
    for (const auto& a : field.geometry()->vector_axes()) {
        widths[a] = {width, width};
    }
    return pad(field, widths);
}

} // namespace field
} // namespace pfl
