/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#include "pfl/Extrapolation/ConstantExtrapolation.h"
#include "pfl/Extrapolation/Constants.h"

#include <sstream>

namespace pfl {
namespace extrapolation {

using math::BinaryOp;

ExtrapolationPtr constant(Real value) {
    return std::make_shared<const ConstantExtrapolation>(value);
}

std::string ConstantExtrapolation::to_string() const {
    std::ostringstream oss;
    oss << value_;
    return oss.str();
}

bool ConstantExtrapolation::equals(const Extrapolation& other) const {
    const auto* c = dynamic_cast<const ConstantExtrapolation*>(&other);
    return c != nullptr && c->value_ == value_;
}

ExtrapolationPtr ConstantExtrapolation::spatial_gradient() const {
    return ZERO;
}

ExtrapolationPtr ConstantExtrapolation::transform(math::UnaryOp op) const {
    return constant(math::apply(op, value_));
}

ExtrapolationPtr ConstantExtrapolation::combine_with(const Extrapolation& other, BinaryOp op,
                                                     bool this_is_left) const {
    if (const auto* c = dynamic_cast<const ConstantExtrapolation*>(&other)) {
        return constant(this_is_left ? math::apply(op, value_, c->value_) : math::apply(op, c->value_, value_));
    }
    if (!other.copies_values()) {
        return nullptr;
    }
    ExtrapolationPtr copy = other.ptr();
    if (this_is_left) {
        // value_ op copy
        switch (op) {
            case BinaryOp::Add:
            case BinaryOp::Sub:
                return value_ == 0 ? copy : nullptr;
            case BinaryOp::Mul:
                if (value_ == 0) {
                    return ZERO;
                }
                return value_ == 1 ? copy : nullptr;
            case BinaryOp::Div:
                return value_ == 0 ? ZERO : nullptr;
            default:
                return nullptr;
        }
    }
    // copy op value_
    switch (op) {
        case BinaryOp::Add:
        case BinaryOp::Sub:
            return value_ == 0 ? copy : nullptr;
        case BinaryOp::Mul:
            if (value_ == 0) {
                return ZERO;
            }
            return value_ == 1 ? copy : nullptr;
        case BinaryOp::Div:
        case BinaryOp::Pow:
            return value_ == 1 ? copy : nullptr;
        default:
            return nullptr;
    }
}

math::Tensor ConstantExtrapolation::pad_slab(const math::Tensor& core, const std::string& dim, bool,
                                             Index width, const PadCoordinates*) const {
    return math::Tensor::full(core.shape().with_size(dim, width), value_);
}

} // namespace extrapolation
} // namespace pfl
