/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_FIELD_FIELD_H
#define PFL_FIELD_FIELD_H

/**
 * @file Field.h
 * @brief Values sampled on a geometry, with a rule for values outside it
 *
 * A Field couples three immutable parts: the Geometry that says where the
 * values live, the value Tensor, and the Extrapolation that continues the
 * values beyond the sampled region. Copies share all three parts.
 *
 * A Field is staggered when its values carry the dual face dimension of its
 * geometry (`~vector` for grids, `~faces` for meshes); otherwise it is
 * centered. Faces whose values the boundary rule already fixes are not
 * stored, so the number of stored values depends on the boundary.
 *
 * Arithmetic between fields on the same geometry combines the values
 * pointwise and the boundary rules with the same operator. A field on a
 * different geometry is first resampled onto the left operand. Arithmetic
 * with plain numbers or tensors keeps the boundary rule unchanged.
 */

#include "pfl/Core/Types.h"
#include "pfl/Extrapolation/Extrapolation.h"
#include "pfl/Extrapolation/MixedExtrapolation.h"
#include "pfl/Geometry/Box.h"
#include "pfl/Geometry/Geometry.h"
#include "pfl/Math/Selection.h"
#include "pfl/Math/Tensor.h"

#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace pfl {
namespace field {

class Field;
class BoundDim;

using geometry::GeometryPtr;
using extrapolation::ExtrapolationPtr;

/// Where the values of a field are located
enum class SampleLocation : std::uint8_t {
    Center,
    Face
};

const char* to_string(SampleLocation at);

/// Aggregation of point values that fall into the same grid cell
enum class ScatterReduce : std::uint8_t {
    Mean,
    Sum
};

/**
 * @brief Options of the resampling engine
 */
struct SampleOptions {
    /// Indicator sampling ramps across the surface instead of a hard 0/1 step
    bool soft = false;
    /// Aggregation of point clouds scattered onto grid cells
    ScatterReduce reduce = ScatterReduce::Mean;
    /// Project vector values sampled at faces onto the face normals
    bool dot_face_normal = false;
};

/// Analytic initializer, evaluated at sample positions carrying `vector`
using Initializer = std::function<math::Tensor(const math::Tensor&)>;

/**
 * @brief Boundary argument of field construction
 *
 * Converts implicitly from a number (constant rule), any extrapolation, a
 * per-dimension map and another Field (embedded as the outside values).
 */
class Boundary {
public:
    /// Zero outside
    Boundary();
    Boundary(Real value);

    template<typename T,
             typename = std::enable_if_t<std::is_base_of_v<extrapolation::Extrapolation, T>>>
    Boundary(std::shared_ptr<T> rule) : rule_(std::move(rule)) {
        check_rule();
    }

    Boundary(const std::map<std::string, ExtrapolationPtr>& per_dim);
    Boundary(const std::map<std::string, extrapolation::MixedExtrapolation::Sides>& per_side);
    Boundary(const Field& embedded);

    const ExtrapolationPtr& get() const noexcept { return rule_; }

private:
    void check_rule() const;

    ExtrapolationPtr rule_;
};

/**
 * @brief Right-hand operand of field arithmetic
 *
 * A Field, a tensor, a number, or a list with one number per spatial axis.
 */
class Operand {
public:
    Operand(const Field& field);
    Operand(const math::Tensor& value);
    Operand(Real value);
    Operand(std::vector<Real> per_axis);
    Operand(std::initializer_list<Real> per_axis);

    bool is_field() const noexcept { return field_ != nullptr; }
    bool is_per_axis() const noexcept { return per_axis_; }
    const Field& field() const;
    const math::Tensor& tensor() const noexcept { return tensor_; }
    const std::vector<Real>& values() const noexcept { return values_; }

private:
    std::shared_ptr<const Field> field_;
    math::Tensor tensor_;
    std::vector<Real> values_;
    bool per_axis_ = false;
};

/**
 * @brief Options of Field::gradient
 */
struct GradientOptions {
    /// Rule of the result; derived from the field's rule when null
    ExtrapolationPtr boundary;
    /// Center gives a vector field, Face a staggered one
    SampleLocation at = SampleLocation::Center;
    /// Axes to differentiate along; every spatial axis when empty
    std::vector<std::string> dims;
    /// Order of accuracy
    int order = 2;
};

class Field {
public:
    /**
     * @brief Field from values
     *
     * Values missing spatial or instance dimensions of the geometry are
     * broadcast. Values carrying the dual face dimension are staggered;
     * otherwise `at` decides where under-specified values are placed.
     *
     * @throws InvalidArgumentException if `geometry` is null
     * @throws ShapeMismatchException if the values do not fit the sample points
     */
    Field(GeometryPtr geometry, math::Tensor values, Boundary boundary = Boundary(),
          SampleLocation at = SampleLocation::Center);

    /// Field from an analytic initializer evaluated at the sample points
    Field(GeometryPtr geometry, const Initializer& initializer, Boundary boundary = Boundary(),
          SampleLocation at = SampleLocation::Center, const SampleOptions& options = {});

    /// Indicator of `shape` (1 inside, 0 outside)
    Field(GeometryPtr geometry, const GeometryPtr& shape, Boundary boundary = Boundary(),
          SampleLocation at = SampleLocation::Center, const SampleOptions& options = {});

    /// `source` resampled onto `geometry`
    Field(GeometryPtr geometry, const Field& source, Boundary boundary = Boundary(),
          SampleLocation at = SampleLocation::Center, const SampleOptions& options = {});

    /// @name Parts
    /// @{
    const GeometryPtr& geometry() const noexcept { return geometry_; }
    const math::Tensor& values() const noexcept { return values_; }
    const ExtrapolationPtr& boundary() const noexcept { return boundary_; }
    /// @}

    /// @name Sampling layout
    /// @{
    bool is_staggered() const;
    bool is_centered() const { return !is_staggered(); }
    SampleLocation sampled_at() const { return is_staggered() ? SampleLocation::Face : SampleLocation::Center; }
    /// The geometry for centered fields, the stored faces as points for staggered ones
    GeometryPtr sampled_elements() const;
    /// Deprecated spelling of sampled_elements()
    GeometryPtr elements() const;
    /// Positions of the stored values
    math::Tensor center() const;
    math::Tensor points() const { return center(); }
    /// @}

    /// @name Properties
    /// @{
    /// Geometry shape and value dimensions; staggered grids list `vector`
    math::Shape shape() const;
    math::Shape resolution() const;
    int spatial_rank() const { return geometry_->spatial_rank(); }
    /// Axis-aligned box enclosing every element
    geometry::BoxPtr bounds() const;
    /// Cell size of grids, element diameter otherwise
    math::Tensor dx() const;
    bool is_grid() const;
    bool is_mesh() const;
    bool is_point_cloud() const;
    /// @}

    /// @name Resampling
    /// @{
    Field at_centers() const;
    /// Staggered copy; keeps this field's rule unless `boundary` is given
    Field at_faces(const ExtrapolationPtr& boundary = nullptr) const;
    /**
     * @brief Resample onto the geometry and sample location of `representation`
     *
     * Takes the rule of `representation` unless `keep_extrapolation` is set.
     */
    Field at(const Field& representation, bool keep_extrapolation = false) const;
    Field at(const GeometryPtr& geometry, SampleLocation location = SampleLocation::Center) const;
    /// Deprecated; values interpolated at `points`
    math::Tensor closest_values(const math::Tensor& points) const;
    /// @}

    /// @name Derived fields
    /// @{
    /// Same geometry and rule, new values
    Field with_values(const math::Tensor& values) const;
    /// Same geometry and rule, `source` resampled
    Field with_values(const Field& source) const;
    /// Geometry with the same non-batch shape
    Field with_geometry(const GeometryPtr& geometry) const;
    /**
     * @brief Replace the boundary rule
     *
     * Faces fixed by the old rule but not by the new one are restored from
     * the old rule; faces the new rule fixes are dropped.
     */
    Field with_boundary(const Boundary& boundary) const;
    Field shifted(const math::Tensor& delta) const;
    Field slice(const math::Selection& selection) const;
    /// Handle on a named dimension of shape()
    BoundDim dimension(const std::string& name) const;
    /// @}

    /// @name Values
    /// @{
    /**
     * @brief Stored faces normal to `axis`, with the faces fixed by the rule restored
     *
     * Has one entry more than there are cells along `axis`.
     */
    math::Tensor face_component(const std::string& axis) const;
    /**
     * @brief Staggered grid values as one dense tensor
     *
     * Every component is one entry larger than the resolution along every
     * axis; missing faces are filled by the rule. Components lie along `vector`.
     */
    math::Tensor staggered_tensor() const;
    /// values() for centered fields, staggered_tensor() for staggered grids
    math::Tensor uniform_values() const;
    /// @}

    /// @name Arithmetic
    /// @{
    Field map(math::UnaryOp op) const;
    Field negate() const { return map(math::UnaryOp::Neg); }
    Field abs() const { return map(math::UnaryOp::Abs); }
    Field sqrt() const { return map(math::UnaryOp::Sqrt); }

    Field add(const Operand& other) const { return combine(other, math::BinaryOp::Add, false); }
    Field subtract(const Operand& other) const { return combine(other, math::BinaryOp::Sub, false); }
    Field multiply(const Operand& other) const { return combine(other, math::BinaryOp::Mul, false); }
    Field divide(const Operand& other) const { return combine(other, math::BinaryOp::Div, false); }
    Field power(const Operand& other) const { return combine(other, math::BinaryOp::Pow, false); }
    Field minimum(const Operand& other) const { return combine(other, math::BinaryOp::Min, false); }
    Field maximum(const Operand& other) const { return combine(other, math::BinaryOp::Max, false); }
    Field greater_than(const Operand& other) const { return combine(other, math::BinaryOp::Greater, false); }
    Field greater_equal(const Operand& other) const { return combine(other, math::BinaryOp::GreaterEqual, false); }
    Field less_than(const Operand& other) const { return combine(other, math::BinaryOp::Less, false); }
    Field less_equal(const Operand& other) const { return combine(other, math::BinaryOp::LessEqual, false); }

    /**
     * @brief `this op other`, or `other op this` when `reversed`
     *
     * Two fields: `other` is resampled onto this geometry if needed, the
     * rules are combined and both operands are aligned to the combined
     * rule. Anything else: broadcast against the values, rule unchanged.
     */
    Field combine(const Operand& other, math::BinaryOp op, bool reversed) const;
    /// @}

    /// @name Differential operators
    /// Computed by the process-wide DifferentialOperators instance.
    /// @{
    Field gradient(const GradientOptions& options = {}) const;
    Field divergence(int order = 2) const;
    /// 2D curl of a staggered field, sampled at the cell corners
    Field curl() const;
    Field laplace(const std::vector<std::string>& dims = {}, int order = 2) const;
    /// Coarsen by `factor`, a power of two
    Field downsample(int factor) const;
    /// @}

    /// Same geometry variant and shape, equal rule, values close
    bool equals(const Field& other) const;
    std::string to_string() const;

private:
    void init(math::Tensor values, SampleLocation at);

    GeometryPtr geometry_;
    math::Tensor values_;
    ExtrapolationPtr boundary_;
};

inline bool operator==(const Field& a, const Field& b) { return a.equals(b); }
inline bool operator!=(const Field& a, const Field& b) { return !a.equals(b); }

inline Field operator-(const Field& f) { return f.negate(); }
inline Field operator+(const Field& a, const Operand& b) { return a.add(b); }
inline Field operator-(const Field& a, const Operand& b) { return a.subtract(b); }
inline Field operator*(const Field& a, const Operand& b) { return a.multiply(b); }
inline Field operator/(const Field& a, const Operand& b) { return a.divide(b); }
inline Field operator+(Real a, const Field& b) { return b.combine(a, math::BinaryOp::Add, true); }
inline Field operator-(Real a, const Field& b) { return b.combine(a, math::BinaryOp::Sub, true); }
inline Field operator*(Real a, const Field& b) { return b.combine(a, math::BinaryOp::Mul, true); }
inline Field operator/(Real a, const Field& b) { return b.combine(a, math::BinaryOp::Div, true); }

/// Deprecated spelling of `a.at(b)`
Field operator>>(const Field& a, const Field& b);

/// Faces of `geometry` fixed by `boundary`
std::vector<math::Selection> determined_faces(const geometry::Geometry& geometry,
                                              const extrapolation::Extrapolation& boundary);

} // namespace field
} // namespace pfl

#endif // PFL_FIELD_FIELD_H
