#include "linsolve/array.h"
#include "linsolve/errors.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <sstream>

namespace linsolve {

// ============================================================================
// DType Utilities
// ============================================================================

std::string dtypeName(DType dtype) {
    switch (dtype) {
        case DType::Untyped: return "untyped";
        case DType::Int8: return "int8";
        case DType::Int16: return "int16";
        case DType::Int32: return "int32";
        case DType::Int64: return "int64";
        case DType::Float32: return "float32";
        case DType::Float64: return "float64";
        case DType::Complex64: return "complex64";
        case DType::Complex128: return "complex128";
        default: return "unknown";
    }
}

DType parseDType(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "untyped") return DType::Untyped;
    if (lower == "int8") return DType::Int8;
    if (lower == "int16") return DType::Int16;
    if (lower == "int32") return DType::Int32;
    if (lower == "int64") return DType::Int64;
    if (lower == "float32") return DType::Float32;
    if (lower == "float64") return DType::Float64;
    if (lower == "complex64") return DType::Complex64;
    if (lower == "complex128") return DType::Complex128;
    throw LinsolveError("Unknown dtype: " + name);
}

bool isComplexType(DType dtype) {
    return dtype == DType::Complex64 || dtype == DType::Complex128;
}

bool isIntegerType(DType dtype) {
    return dtype == DType::Int8 || dtype == DType::Int16 ||
           dtype == DType::Int32 || dtype == DType::Int64;
}

DType realCounterpart(DType dtype) {
    switch (dtype) {
        case DType::Complex64: return DType::Float32;
        case DType::Complex128: return DType::Float64;
        default: return dtype;
    }
}

double dtypeResolution(DType dtype) {
    switch (dtype) {
        case DType::Float32:
        case DType::Complex64: return 1e-6;
        default: return 1e-15;
    }
}

DType complexCounterpart(DType dtype) {
    switch (dtype) {
        case DType::Float32: return DType::Complex64;
        case DType::Float64: return DType::Complex128;
        default: return dtype;
    }
}

// ============================================================================
// Shapes
// ============================================================================

std::string shapeToString(const Shape& shape) {
    std::ostringstream ss;
    ss << "(";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << shape[i];
    }
    if (shape.size() == 1) ss << ",";
    ss << ")";
    return ss.str();
}

std::size_t shapeSize(const Shape& shape) {
    std::size_t n = 1;
    for (auto dim : shape) n *= dim;
    return n;
}

Shape broadcastShapes(const Shape& a, const Shape& b) {
    const std::size_t ndim = std::max(a.size(), b.size());
    Shape result(ndim, 1);
    for (std::size_t i = 0; i < ndim; ++i) {
        // Align trailing dimensions
        std::size_t da = i < ndim - a.size() ? 1 : a[i - (ndim - a.size())];
        std::size_t db = i < ndim - b.size() ? 1 : b[i - (ndim - b.size())];
        if (da == db || db == 1) {
            result[i] = da;
        } else if (da == 1) {
            result[i] = db;
        } else {
            throw ShapeMismatch("Shapes " + shapeToString(a) + " and " + shapeToString(b) +
                                " cannot be broadcast together");
        }
    }
    return result;
}

// ============================================================================
// Array
// ============================================================================

// Round values to what the dtype can represent.
static Eigen::ArrayXcd normalize(Eigen::ArrayXcd values, DType dtype) {
    switch (dtype) {
        case DType::Float32:
            for (Eigen::Index i = 0; i < values.size(); ++i) {
                values(i) = std::complex<double>(static_cast<float>(values(i).real()), 0.0);
            }
            break;
        case DType::Float64:
            values = values.real().cast<std::complex<double>>();
            break;
        case DType::Complex64:
            for (Eigen::Index i = 0; i < values.size(); ++i) {
                values(i) = std::complex<double>(static_cast<float>(values(i).real()),
                                                 static_cast<float>(values(i).imag()));
            }
            break;
        case DType::Int8:
        case DType::Int16:
        case DType::Int32:
        case DType::Int64:
            for (Eigen::Index i = 0; i < values.size(); ++i) {
                values(i) = std::complex<double>(std::trunc(values(i).real()), 0.0);
            }
            break;
        default:
            break;
    }
    return values;
}

Array::Array() : Array(0.0) {}

Array::Array(double value, DType dtype) : Array(Scalar(value, 0.0), dtype) {}

Array::Array(Scalar value, DType dtype) : dtype_(dtype) {
    Eigen::ArrayXcd values(1);
    values(0) = value;
    values_ = std::make_shared<const Eigen::ArrayXcd>(normalize(std::move(values), dtype));
}

Array::Array(Shape shape, const std::vector<double>& values, DType dtype)
    : Array(std::move(shape),
            Eigen::Map<const Eigen::ArrayXd>(values.data(), static_cast<Eigen::Index>(values.size()))
                .cast<Scalar>(),
            dtype) {}

Array::Array(Shape shape, const std::vector<Scalar>& values, DType dtype)
    : Array(std::move(shape),
            Eigen::ArrayXcd(Eigen::Map<const Eigen::ArrayXcd>(values.data(),
                                                              static_cast<Eigen::Index>(values.size()))),
            dtype) {}

Array::Array(Shape shape, Eigen::ArrayXcd values, DType dtype)
    : shape_(std::move(shape)), dtype_(dtype) {
    if (shapeSize(shape_) != static_cast<std::size_t>(values.size())) {
        throw ShapeMismatch("Array of shape " + shapeToString(shape_) + " cannot hold " +
                            std::to_string(values.size()) + " values");
    }
    values_ = std::make_shared<const Eigen::ArrayXcd>(normalize(std::move(values), dtype));
}

Array Array::full(const Shape& shape, Scalar value, DType dtype) {
    Eigen::ArrayXcd values = Eigen::ArrayXcd::Constant(static_cast<Eigen::Index>(shapeSize(shape)), value);
    return Array(shape, std::move(values), dtype);
}

Array::Scalar Array::item() const {
    if (size() != 1) {
        throw ShapeMismatch("Array of shape " + shapeToString(shape_) + " is not a single value");
    }
    return (*values_)(0);
}

bool Array::isComplex() const {
    if (isComplexType(dtype_)) return true;
    if (dtype_ != DType::Untyped) return false;
    return (values_->imag().abs() > 0.0).any();
}

Array Array::astype(DType dtype) const {
    if (dtype == dtype_) return *this;
    return Array(shape_, *values_, dtype);
}

Array Array::broadcastTo(const Shape& target) const {
    if (target == shape_) return *this;
    if (broadcastShapes(shape_, target) != target) {
        throw ShapeMismatch("Cannot broadcast shape " + shapeToString(shape_) + " to " +
                            shapeToString(target));
    }

    const std::size_t ndim = target.size();
    const std::size_t offset = ndim - shape_.size();

    // Stride 0 along broadcast dimensions
    std::vector<std::size_t> strides(ndim, 0);
    std::size_t stride = 1;
    for (std::size_t d = shape_.size(); d-- > 0;) {
        strides[d + offset] = shape_[d] == 1 ? 0 : stride;
        stride *= shape_[d];
    }

    const std::size_t n = shapeSize(target);
    Eigen::ArrayXcd out(static_cast<Eigen::Index>(n));
    std::vector<std::size_t> index(ndim, 0);
    for (std::size_t i = 0; i < n; ++i) {
        std::size_t src = 0;
        for (std::size_t d = 0; d < ndim; ++d) src += index[d] * strides[d];
        out(static_cast<Eigen::Index>(i)) = (*values_)(static_cast<Eigen::Index>(src));
        for (std::size_t d = ndim; d-- > 0;) {
            if (++index[d] < target[d]) break;
            index[d] = 0;
        }
    }
    return Array(target, std::move(out), dtype_);
}

// Dtype of a real-valued result (abs, arg) computed from an array of this dtype.
static DType realResultType(DType dtype) {
    if (isIntegerType(dtype)) return DType::Float64;
    return realCounterpart(dtype);
}

Array Array::conj() const {
    return Array(shape_, values_->conjugate(), dtype_);
}

Array Array::abs() const {
    return Array(shape_, values_->abs().cast<Scalar>(), realResultType(dtype_));
}

Array Array::arg() const {
    return Array(shape_, values_->arg().cast<Scalar>(), realResultType(dtype_));
}

Array Array::log() const {
    DType dtype = isIntegerType(dtype_) ? DType::Float64 : dtype_;
    return Array(shape_, values_->log(), dtype);
}

Array Array::exp() const {
    DType dtype = isIntegerType(dtype_) ? DType::Float64 : dtype_;
    return Array(shape_, values_->exp(), dtype);
}

DType promoteTypes(const Array& a, const Array& b) {
    if (a.dtype() == DType::Untyped && b.dtype() == DType::Untyped) return DType::Untyped;
    return inferDtype(std::vector<const Array*>{&a, &b});
}

Array operator+(const Array& a, const Array& b) {
    Shape shape = broadcastShapes(a.shape(), b.shape());
    return Array(shape, a.broadcastTo(shape).values() + b.broadcastTo(shape).values(), promoteTypes(a, b));
}

Array operator-(const Array& a, const Array& b) {
    Shape shape = broadcastShapes(a.shape(), b.shape());
    return Array(shape, a.broadcastTo(shape).values() - b.broadcastTo(shape).values(), promoteTypes(a, b));
}

Array operator*(const Array& a, const Array& b) {
    Shape shape = broadcastShapes(a.shape(), b.shape());
    return Array(shape, a.broadcastTo(shape).values() * b.broadcastTo(shape).values(), promoteTypes(a, b));
}

Array operator-(const Array& a) {
    return Array(a.shape(), -a.values(), a.dtype());
}

// ============================================================================
// Precision Rules
// ============================================================================

DType inferDtype(const std::vector<const Array*>& values) {
    bool anyComplex = false;
    bool anyHigh = false;
    for (const Array* value : values) {
        switch (value->dtype()) {
            case DType::Untyped:
                anyComplex = anyComplex || value->isComplex();
                break;
            case DType::Float32:
                break;
            case DType::Complex64:
                anyComplex = true;
                break;
            case DType::Float64:
                anyHigh = true;
                break;
            case DType::Complex128:
                anyComplex = true;
                anyHigh = true;
                break;
            default:
                // Integer tags of any width
                anyHigh = true;
                break;
        }
    }
    if (anyComplex) return anyHigh ? DType::Complex128 : DType::Complex64;
    return anyHigh ? DType::Float64 : DType::Float32;
}

DType inferDtype(const std::vector<Array>& values) {
    std::vector<const Array*> ptrs;
    ptrs.reserve(values.size());
    for (const auto& value : values) ptrs.push_back(&value);
    return inferDtype(ptrs);
}

ArrayMap verifyWeights(const ArrayMap& weights, const std::vector<std::string>& keys) {
    if (weights.empty()) {
        ArrayMap result;
        for (const auto& key : keys) result.emplace(key, Array(1.0));
        return result;
    }

    std::set<std::string> expected(keys.begin(), keys.end());
    std::set<std::string> provided;
    for (const auto& [key, weight] : weights) provided.insert(key);
    if (expected != provided) {
        throw InvalidWeights("Weight keys do not match data keys (" + std::to_string(provided.size()) +
                             " weights for " + std::to_string(expected.size()) + " equations)");
    }

    for (const auto& [key, weight] : weights) {
        if (weight.isComplex()) {
            throw InvalidWeights("Weight for '" + key + "' is complex");
        }
    }
    return weights;
}

}  // namespace linsolve
