#pragma once

#include <Eigen/Dense>
#include <complex>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace linsolve {

// ============================================================================
// Numeric Types
// ============================================================================

/**
 * @brief Numeric type tag carried by every Array.
 *
 * Untyped marks a bare literal (a number written without an explicit type).
 * The integer tags only matter for precision inference; solutions are always
 * produced in one of the four floating-point working types.
 */
enum class DType {
    Untyped,
    Int8,
    Int16,
    Int32,
    Int64,
    Float32,
    Float64,
    Complex64,
    Complex128
};

std::string dtypeName(DType dtype);
DType parseDType(const std::string& name);

bool isComplexType(DType dtype);
bool isIntegerType(DType dtype);

// Float32 <-> Complex64, Float64 <-> Complex128
DType realCounterpart(DType dtype);
DType complexCounterpart(DType dtype);

// Smallest meaningful relative difference: 1e-6 single, 1e-15 double
double dtypeResolution(DType dtype);

using Shape = std::vector<std::size_t>;

std::string shapeToString(const Shape& shape);
std::size_t shapeSize(const Shape& shape);

// Broadcast two shapes; trailing dimensions must match or be 1. Throws ShapeMismatch.
Shape broadcastShapes(const Shape& a, const Shape& b);

// ============================================================================
// Array
// ============================================================================

/**
 * @brief Immutable n-dimensional numeric array with a dtype tag.
 *
 * Values are held as complex doubles in row-major order; storage is shared
 * between copies. Single-precision dtypes are rounded through float on
 * construction and real dtypes drop the imaginary part, so the stored values
 * always match what the tag promises. An empty shape denotes a scalar.
 */
class Array {
public:
    using Scalar = std::complex<double>;

    Array();
    Array(double value, DType dtype = DType::Untyped);
    Array(Scalar value, DType dtype = DType::Untyped);
    Array(Shape shape, const std::vector<double>& values, DType dtype = DType::Float64);
    Array(Shape shape, const std::vector<Scalar>& values, DType dtype = DType::Complex128);
    Array(Shape shape, Eigen::ArrayXcd values, DType dtype);

    static Array full(const Shape& shape, Scalar value, DType dtype);

    const Shape& shape() const { return shape_; }
    std::size_t size() const { return static_cast<std::size_t>(values_->size()); }
    DType dtype() const { return dtype_; }
    bool isScalar() const { return shape_.empty(); }

    const Eigen::ArrayXcd& values() const { return *values_; }
    Scalar operator[](std::size_t i) const { return (*values_)(static_cast<Eigen::Index>(i)); }

    // Value of a one-element array.
    Scalar item() const;

    // True if the tag is complex, or the array is untyped and some element
    // has a nonzero imaginary part.
    bool isComplex() const;

    Array astype(DType dtype) const;
    Array broadcastTo(const Shape& shape) const;

    Array conj() const;
    Array abs() const;
    Array arg() const;
    Array log() const;
    Array exp() const;

    friend Array operator+(const Array& a, const Array& b);
    friend Array operator-(const Array& a, const Array& b);
    friend Array operator*(const Array& a, const Array& b);
    friend Array operator-(const Array& a);

private:
    Shape shape_;
    DType dtype_ = DType::Untyped;
    std::shared_ptr<const Eigen::ArrayXcd> values_;
};

using ArrayMap = std::map<std::string, Array>;
using Solution = ArrayMap;

// Result dtype of elementwise arithmetic: untyped with untyped stays untyped,
// anything else follows inferDtype.
DType promoteTypes(const Array& a, const Array& b);

// ============================================================================
// Precision Rules
// ============================================================================

/**
 * @brief Infer the working dtype of a set of values.
 *
 * Each value is classified as (complex, high precision):
 * - untyped: low precision, complex only with a nonzero imaginary part
 * - Float32 / Complex64: low precision
 * - Float64 / Complex128 / any integer tag: high precision
 *
 * The result is complex if any value is complex and high precision if any
 * value is high precision.
 */
DType inferDtype(const std::vector<const Array*>& values);
DType inferDtype(const std::vector<Array>& values);

/**
 * @brief Validate weights against the data keys.
 *
 * An empty map yields a weight of 1 for every key. Otherwise the key sets
 * must match exactly and no weight may be complex; InvalidWeights is thrown
 * when either check fails.
 */
ArrayMap verifyWeights(const ArrayMap& weights, const std::vector<std::string>& keys);

}  // namespace linsolve
