/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#include "pfl/Field/Field.h"
#include "pfl/Field/BoundDim.h"
#include "pfl/Field/DifferentialOperators.h"
#include "pfl/Field/FieldEmbedding.h"
#include "pfl/Field/Resample.h"
#include "pfl/Core/Logger.h"
#include "pfl/Core/PFLException.h"
#include "pfl/Extrapolation/ConstantExtrapolation.h"
#include "pfl/Extrapolation/Constants.h"
#include "pfl/Geometry/Mesh.h"
#include "pfl/Geometry/Point.h"
#include "pfl/Geometry/UniformGrid.h"

#include <algorithm>
#include <optional>
#include <utility>
#include <variant>

namespace pfl {
namespace field {

using geometry::GeometryType;
using math::Dim;
using math::Selection;
using math::Shape;
using math::Tensor;

namespace {

bool has_faces(const geometry::Geometry& geometry) {
    return geometry.type() == GeometryType::UniformGrid || geometry.type() == GeometryType::Mesh;
}

/// True if `values` carry every dual dimension of the faces of `geometry`
bool carries_faces(const geometry::Geometry& geometry, const Tensor& values) {
    if (values.shape().dual().empty() || !has_faces(geometry)) {
        return false;
    }
    const Shape face_dual = geometry.face_shape().dual();
    for (const auto& d : face_dual.dims()) {
        if (!values.shape().contains(d.name)) {
            return false;
        }
    }
    return true;
}

/// Broadcast `values` over the sample dimensions of `points` and check their sizes
Tensor fit_values(const Tensor& values, const Tensor& points) {
    if (!points.is_uniform()) {
        const Dim& stack = points.shape().dim(points.stack_dim());
        const bool split = values.shape().contains(stack.name);
        PFL_CHECK_SHAPE(!split || values.shape().size(stack.name) == stack.size,
                        "Values " + values.shape().to_string() + " do not match the sample points " +
                            points.shape().to_string());
        std::vector<Tensor> components;
        for (Index i = 0; i < stack.size; ++i) {
            components.push_back(fit_values(split ? values.component(i, stack.name) : values,
                                            points.component(i, stack.name)));
        }
        return Tensor::stack(components, stack);
    }
    Shape samples = points.shape().without(dims::VECTOR).non_batch().non_channel();
    std::vector<Dim> broadcast;
    for (const auto& d : samples.dims()) {
        if (!values.shape().contains(d.name) || values.shape().size(d.name) == 1) {
            broadcast.push_back(d);
        }
    }
    Tensor fitted = values;
    if (!broadcast.empty()) {
        Selection squeeze;
        for (const auto& d : broadcast) {
            if (values.shape().contains(d.name)) {
                squeeze[d.name] = Index(0);
            }
        }
        fitted = values.slice(squeeze).expand(Shape(broadcast));
    }
    for (const auto& d : samples.dims()) {
        PFL_CHECK_SHAPE(fitted.shape().size(d.name) == d.size,
                        "Values " + values.shape().to_string() + " do not match the sample points " +
                            samples.to_string());
    }
    return fitted;
}

/// Boundary keys of `geometry` whose faces `rule` fixes
std::vector<std::string> determined_keys(const geometry::Geometry& geometry, const extrapolation::Extrapolation& rule) {
    std::vector<std::string> keys;
    for (const auto& entry : geometry.boundary_faces()) {
        if (rule.determines_boundary_values(entry.first)) {
            keys.push_back(entry.first);
        }
    }
    return keys;
}

/// Values of mesh boundary faces that the stored values do not hold
Tensor restored_mesh_faces(const extrapolation::Extrapolation& rule, const geometry::Mesh& mesh,
                           const Selection& faces, const Shape& shape) {
    if (auto c = dynamic_cast<const extrapolation::ConstantExtrapolation*>(&rule)) {
        const Index count = mesh.face_centers().slice(faces).shape().size(dims::DUAL_FACES);
        return Tensor::full(shape.with_size(dims::DUAL_FACES, count), c->value());
    }
    if (auto e = dynamic_cast<const FieldEmbedding*>(&rule)) {
        return sample_at_points(e->field(), mesh.face_centers().slice(faces));
    }
    PFL_NOT_IMPLEMENTED("restoring mesh faces from " + rule.to_string());
}

} // namespace

const char* to_string(SampleLocation at) {
    switch (at) {
        case SampleLocation::Center: return "center";
        case SampleLocation::Face:   return "face";
        default:                     return "unknown";
    }
}

std::vector<Selection> determined_faces(const geometry::Geometry& geometry,
                                        const extrapolation::Extrapolation& boundary) {
    std::vector<Selection> faces;
    for (const auto& [key, selection] : geometry.boundary_faces()) {
        if (boundary.determines_boundary_values(key)) {
            faces.push_back(selection);
        }
    }
    return faces;
}

// ---------------------------------------------------------------------------
// Boundary / Operand
// ---------------------------------------------------------------------------

Boundary::Boundary() : rule_(extrapolation::ZERO) {}

Boundary::Boundary(Real value) : rule_(extrapolation::as_extrapolation(value)) {}

Boundary::Boundary(const std::map<std::string, ExtrapolationPtr>& per_dim)
    : rule_(extrapolation::as_extrapolation(per_dim)) {}

Boundary::Boundary(const std::map<std::string, extrapolation::MixedExtrapolation::Sides>& per_side)
    : rule_(extrapolation::as_extrapolation(per_side)) {}

Boundary::Boundary(const Field& embedded) : rule_(std::make_shared<const FieldEmbedding>(embedded)) {}

void Boundary::check_rule() const {
    PFL_CHECK_NOT_NULL(rule_, "Boundary rule");
}

Operand::Operand(const Field& field) : field_(std::make_shared<const Field>(field)) {}

Operand::Operand(const Tensor& value) : tensor_(value) {}

Operand::Operand(Real value) : tensor_(value) {}

Operand::Operand(std::vector<Real> per_axis) : values_(std::move(per_axis)), per_axis_(true) {}

Operand::Operand(std::initializer_list<Real> per_axis) : values_(per_axis), per_axis_(true) {}

const Field& Operand::field() const {
    PFL_THROW_IF(field_ == nullptr, InvalidArgumentException, "Operand is not a field");
    return *field_;
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

Field::Field(GeometryPtr geometry, Tensor values, Boundary boundary, SampleLocation at)
    : geometry_(std::move(geometry)), boundary_(boundary.get()) {
    init(std::move(values), at);
}

Field::Field(GeometryPtr geometry, const Initializer& initializer, Boundary boundary, SampleLocation at,
             const SampleOptions& options)
    : geometry_(std::move(geometry)), boundary_(boundary.get()) {
    PFL_CHECK_NOT_NULL(geometry_, "Field geometry");
    PFL_CHECK_ARG(static_cast<bool>(initializer), "Field initializer is empty");
    init(sample(initializer, geometry_, at, boundary_, options), at);
}

Field::Field(GeometryPtr geometry, const GeometryPtr& shape, Boundary boundary, SampleLocation at,
             const SampleOptions& options)
    : geometry_(std::move(geometry)), boundary_(boundary.get()) {
    PFL_CHECK_NOT_NULL(geometry_, "Field geometry");
    PFL_CHECK_NOT_NULL(shape, "Indicator geometry");
    init(sample(shape, geometry_, at, boundary_, options), at);
}

Field::Field(GeometryPtr geometry, const Field& source, Boundary boundary, SampleLocation at,
             const SampleOptions& options)
    : geometry_(std::move(geometry)), boundary_(boundary.get()) {
    PFL_CHECK_NOT_NULL(geometry_, "Field geometry");
    init(sample(source, geometry_, at, boundary_, options), at);
}

void Field::init(Tensor values, SampleLocation at) {
    PFL_CHECK_NOT_NULL(geometry_, "Field geometry");
    PFL_CHECK_NOT_NULL(boundary_, "Field boundary");
    if (carries_faces(*geometry_, values)) {
        at = SampleLocation::Face;
    }
    if (at == SampleLocation::Face) {
        PFL_THROW_IF(!has_faces(*geometry_), InvalidArgumentException,
                     "Cannot sample at the faces of " + geometry_->to_string());
        values_ = fit_values(values, sample_points(geometry_, at, boundary_));
    } else {
        values_ = fit_values(values, geometry_->center());
    }
}

// ---------------------------------------------------------------------------
// Layout and properties
// ---------------------------------------------------------------------------

bool Field::is_staggered() const {
    return carries_faces(*geometry_, values_);
}

GeometryPtr Field::sampled_elements() const {
    if (is_centered()) {
        return geometry_;
    }
    return std::make_shared<const geometry::Point>(center());
}

GeometryPtr Field::elements() const {
    warn_deprecated("Field::elements", "use Field::sampled_elements() instead");
    return sampled_elements();
}

Tensor Field::center() const {
    if (is_staggered()) {
        return sample_points(geometry_, SampleLocation::Face, boundary_);
    }
    return geometry_->center();
}

Shape Field::shape() const {
    if (is_centered()) {
        return values_.shape();
    }
    std::vector<std::string> layout = geometry_->face_shape().dual().names();
    for (const auto& d : geometry_->shape().dims()) {
        layout.push_back(d.name);
    }
    Shape result = geometry_->shape() & values_.shape().without(layout);
    if (is_grid()) {
        result = result & Shape{math::vector_dim(geometry_->vector_axes())};
    }
    return result;
}

Shape Field::resolution() const {
    return geometry_->shape().spatial();
}

geometry::BoxPtr Field::bounds() const {
    if (is_grid()) {
        return static_cast<const geometry::UniformGrid&>(*geometry_).bounds();
    }
    Tensor c = geometry_->center();
    Tensor h = geometry_->bounding_half_extent();
    Tensor lower = c - h;
    std::vector<std::string> elements = lower.shape().without(dims::VECTOR).non_batch().non_channel().names();
    return std::make_shared<const geometry::Box>(lower.min(elements), (c + h).max(elements));
}

Tensor Field::dx() const {
    if (is_grid()) {
        return static_cast<const geometry::UniformGrid&>(*geometry_).dx();
    }
    return geometry_->bounding_radius() * Real(2);
}

bool Field::is_grid() const {
    return geometry_->type() == GeometryType::UniformGrid;
}

bool Field::is_mesh() const {
    return geometry_->type() == GeometryType::Mesh;
}

bool Field::is_point_cloud() const {
    return !is_grid() && !is_mesh();
}

// ---------------------------------------------------------------------------
// Resampling
// ---------------------------------------------------------------------------

Field Field::at_centers() const {
    if (is_centered()) {
        return *this;
    }
    return Field(geometry_, *this, boundary_, SampleLocation::Center);
}

Field Field::at_faces(const ExtrapolationPtr& boundary) const {
    ExtrapolationPtr rule = boundary != nullptr ? boundary : boundary_;
    if (is_staggered()) {
        return with_boundary(rule);
    }
    return Field(geometry_, *this, rule, SampleLocation::Face);
}

Field Field::at(const Field& representation, bool keep_extrapolation) const {
    return resample(*this, representation, keep_extrapolation);
}

Field Field::at(const GeometryPtr& geometry, SampleLocation location) const {
    PFL_CHECK_NOT_NULL(geometry, "Target geometry");
    if (geometry_->equals(*geometry) && location == sampled_at()) {
        return *this;
    }
    return Field(geometry, *this, boundary_, location);
}

Tensor Field::closest_values(const Tensor& points) const {
    warn_deprecated("Field::closest_values", "resample onto a point cloud instead");
    return sample_at_points(*this, points);
}

// ---------------------------------------------------------------------------
// Derived fields
// ---------------------------------------------------------------------------

Field Field::with_values(const Tensor& values) const {
    return Field(geometry_, values, boundary_, sampled_at());
}

Field Field::with_values(const Field& source) const {
    SampleOptions options;
    options.dot_face_normal = !values_.shape().contains(dims::VECTOR);
    return Field(geometry_, source, boundary_, sampled_at(), options);
}

Field Field::with_geometry(const GeometryPtr& geometry) const {
    PFL_CHECK_NOT_NULL(geometry, "Field geometry");
    PFL_CHECK_SHAPE(geometry->shape().non_batch() == geometry_->shape().non_batch(),
                    "Cannot replace " + geometry_->to_string() + " by " + geometry->to_string());
    return Field(geometry, values_, boundary_, sampled_at());
}

Field Field::with_boundary(const Boundary& boundary) const {
    const ExtrapolationPtr& rule = boundary.get();
    if (extrapolation::same(rule, boundary_)) {
        return *this;
    }
    if (is_centered()) {
        return Field(geometry_, values_, rule, SampleLocation::Center);
    }
    if (determined_keys(*geometry_, *boundary_) == determined_keys(*geometry_, *rule)) {
        return Field(geometry_, values_, rule, SampleLocation::Face);
    }
    if (is_grid()) {
        const auto& grid = static_cast<const geometry::UniformGrid&>(*geometry_);
        std::vector<Tensor> components;
        for (const auto& a : grid.axes()) {
            const auto [lower_stored, upper_stored] = rule->valid_outer_faces(a);
            math::Range keep{Index(lower_stored ? 0 : 1),
                             upper_stored ? std::optional<Index>() : std::optional<Index>(-1)};
            components.push_back(face_component(a).slice(Selection{{a, keep}}));
        }
        return Field(geometry_, Tensor::stack(components, math::dual(dims::VECTOR, grid.axes())), rule,
                     SampleLocation::Face);
    }
    // Meshes: interior faces first, then every boundary in key order
    const auto& mesh = static_cast<const geometry::Mesh&>(*geometry_);
    const Index interior = mesh.interior_face_count();
    std::vector<Tensor> parts;
    if (interior > 0) {
        parts.push_back(values_.slice(Selection{{dims::DUAL_FACES, math::range(0, interior)}}));
    }
    Index offset = interior;
    for (const auto& [key, faces] : mesh.boundary_faces()) {
        const auto& r = std::get<math::Range>(faces.at(dims::DUAL_FACES));
        const Index count = r.stop.value() - r.start.value();
        const bool stored = !boundary_->determines_boundary_values(key);
        const bool keep = !rule->determines_boundary_values(key);
        if (stored) {
            if (keep) {
                parts.push_back(values_.slice(Selection{{dims::DUAL_FACES, math::range(offset, offset + count)}}));
            }
            offset += count;
        } else if (keep) {
            parts.push_back(restored_mesh_faces(*boundary_->on_side(key, false), mesh, faces, values_.shape()));
        }
    }
    PFL_CHECK_ARG(!parts.empty(), "Boundary " + rule->to_string() + " leaves no mesh faces to store");
    return Field(geometry_, Tensor::concat(parts, dims::DUAL_FACES), rule, SampleLocation::Face);
}

Field Field::shifted(const Tensor& delta) const {
    return with_geometry(geometry_->shifted(delta));
}

Field Field::slice(const Selection& selection) const {
    ExtrapolationPtr rule = boundary_->slice(selection);
    auto picked = selection.find(dims::VECTOR);
    if (picked != selection.end() && std::holds_alternative<std::string>(picked->second)) {
        rule = rule->component(std::get<std::string>(picked->second));
    }
    if (picked != selection.end() && is_grid() && is_staggered()) {
        Selection faces = selection;
        faces.erase(dims::VECTOR);
        faces[dims::DUAL_VECTOR] = picked->second;
        return Field(sampled_elements()->slice(faces), values_.slice(faces), rule);
    }
    return Field(geometry_->slice(geometry::without_vector(selection)), values_.slice(selection), rule,
                 sampled_at());
}

BoundDim Field::dimension(const std::string& name) const {
    return BoundDim(*this, name);
}

// ---------------------------------------------------------------------------
// Values
// ---------------------------------------------------------------------------

Tensor Field::face_component(const std::string& axis) const {
    PFL_THROW_IF(!is_grid() || !is_staggered(), InvalidArgumentException,
                 "face_component() needs a staggered grid field, got " + to_string());
    const auto& grid = static_cast<const geometry::UniformGrid&>(*geometry_);
    const Dim& faces = values_.shape().dim(dims::DUAL_VECTOR);
    Index i = faces.item_index(axis);
    if (faces.item_names.empty()) {
        const auto& axes = grid.axes();
        auto it = std::find(axes.begin(), axes.end(), axis);
        i = it == axes.end() ? -1 : static_cast<Index>(it - axes.begin());
    }
    PFL_THROW_IF(i < 0, OutOfRangeException, "No faces normal to '" + axis + "' in " + to_string());
    const auto [lower_stored, upper_stored] = boundary_->valid_outer_faces(axis);
    extrapolation::PadCoordinates coords = sample_coordinates(grid, axis, lower_stored ? 0 : 1);
    return boundary_->component(axis)->pad(values_.component(i, dims::DUAL_VECTOR),
                                           {{axis, {lower_stored ? 0 : 1, upper_stored ? 0 : 1}}}, &coords);
}

Tensor Field::staggered_tensor() const {
    PFL_THROW_IF(!is_grid() || !is_staggered(), InvalidArgumentException,
                 "staggered_tensor() needs a staggered grid field, got " + to_string());
    const auto& grid = static_cast<const geometry::UniformGrid&>(*geometry_);
    std::vector<Tensor> components;
    for (const auto& a : grid.axes()) {
        extrapolation::PadWidths widths;
        for (const auto& other : grid.axes()) {
            if (other != a) {
                widths[other] = {0, 1};
            }
        }
        extrapolation::PadCoordinates coords = sample_coordinates(grid, a);
        components.push_back(boundary_->component(a)->pad(face_component(a), widths, &coords));
    }
    return Tensor::stack(components, math::vector_dim(grid.axes()));
}

Tensor Field::uniform_values() const {
    if (is_grid() && is_staggered()) {
        return staggered_tensor();
    }
    return values_;
}

// ---------------------------------------------------------------------------
// Arithmetic
// ---------------------------------------------------------------------------

Field Field::map(math::UnaryOp op) const {
    return Field(geometry_, values_.map(op), boundary_->transform(op), sampled_at());
}

Field Field::combine(const Operand& other, math::BinaryOp op, bool reversed) const {
    if (other.is_field()) {
        const Field& rhs = other.field();
        const bool aligned = rhs.geometry_->equals(*geometry_) && rhs.sampled_at() == sampled_at();
        Field operand = aligned ? rhs : Field(geometry_, rhs, rhs.boundary_, sampled_at());
        ExtrapolationPtr rule = reversed ? extrapolation::combine(operand.boundary_, boundary_, op)
                                         : extrapolation::combine(boundary_, operand.boundary_, op);
        Tensor a = with_boundary(rule).values_;
        Tensor b = operand.with_boundary(rule).values_;
        return Field(geometry_, reversed ? math::binary(b, a, op) : math::binary(a, b, op), rule, sampled_at());
    }
    Tensor value = other.tensor();
    if (other.is_per_axis()) {
        const auto axes = geometry_->vector_axes();
        PFL_CHECK_SHAPE(other.values().size() == axes.size(),
                        "Expected one value per axis of " + geometry_->to_string() + ", got " +
                            std::to_string(other.values().size()));
        value = Tensor::vector(axes, other.values());
    }
    // Vector operands act per face orientation of staggered grids
    if (is_grid() && is_staggered() && value.shape().contains(dims::VECTOR)) {
        value = value.rename(dims::VECTOR, dims::DUAL_VECTOR);
    }
    Tensor result = reversed ? math::binary(value, values_, op) : math::binary(values_, value, op);
    return Field(geometry_, result, boundary_, sampled_at());
}

// ---------------------------------------------------------------------------
// Differential operators
// ---------------------------------------------------------------------------

Field Field::gradient(const GradientOptions& options) const {
    return differential_operators()->gradient(*this, options);
}

Field Field::divergence(int order) const {
    return differential_operators()->divergence(*this, order);
}

Field Field::curl() const {
    return differential_operators()->curl(*this);
}

Field Field::laplace(const std::vector<std::string>& dims, int order) const {
    return differential_operators()->laplace(*this, dims, order);
}

Field Field::downsample(int factor) const {
    PFL_THROW_IF(factor < 1 || (factor & (factor - 1)) != 0, NotImplementedException,
                 "downsampling by " + std::to_string(factor) + ", only powers of two are supported");
    auto operators = differential_operators();
    Field result = *this;
    for (int f = factor; f > 1; f /= 2) {
        result = operators->downsample2x(result);
    }
    return result;
}

// ---------------------------------------------------------------------------
// Comparison
// ---------------------------------------------------------------------------

bool Field::equals(const Field& other) const {
    if (geometry_->type() != other.geometry_->type() || geometry_->shape() != other.geometry_->shape()) {
        return false;
    }
    if (!extrapolation::same(boundary_, other.boundary_) || sampled_at() != other.sampled_at()) {
        return false;
    }
    return math::close(values_, other.values_);
}

std::string Field::to_string() const {
    std::string kind;
    if (is_grid()) {
        kind = is_staggered() ? "Grid faces" : "Grid";
    } else if (is_mesh()) {
        kind = is_staggered() ? "Mesh faces" : "Mesh";
    } else {
        kind = "Point cloud";
    }
    return kind + "[" + shape().to_string() + ", boundary=" + boundary_->to_string() + "]";
}

Field operator>>(const Field& a, const Field& b) {
    warn_deprecated("Field::operator>>", "use Field::at() instead");
    return a.at(b);
}

} // namespace field
} // namespace pfl
