/* ----------------------------------------------------------------------------
 * Copyright 2020, Massachusetts Institute of Technology, * Cambridge, MA 02139
 * All Rights Reserved
 * Authors: Yulun Tian, et al. (see README for the full author list)
 * See LICENSE for the license information
 * -------------------------------------------------------------------------- */

#ifndef MIXEDSTACK_H
#define MIXEDSTACK_H

#include <RGEO/RGEO_types.h>
#include <RGEO/manifold/MatrixStack.h>
#include <boost/variant.hpp>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

/*Define the namespace*/
namespace RGEO {

/**
 * @brief A matrix stack that is either real or complex, decided at run time.
 * Used as the common element type of products whose factors mix real and complex manifolds.
 * Arithmetic between a real and a complex stack throws std::invalid_argument.
 */
class MixedStack {
 public:
  MixedStack() = default;
  MixedStack(RealStack S) : data_(std::move(S)) {}
  MixedStack(ComplexStack S) : data_(std::move(S)) {}

  bool isComplex() const { return data_.which() == 1; }

  /**
   * @brief "real" or "complex"
   */
  std::string kind() const { return isComplex() ? "complex" : "real"; }

  /**
   * @brief Access the underlying stack. Throws std::invalid_argument if it holds the other kind.
   * @tparam Scalar double or Complex
   */
  template <typename Scalar>
  const MatrixStack<Scalar> &get() const {
    const MatrixStack<Scalar> *S = boost::get<MatrixStack<Scalar>>(&data_);
    if (!S) throwKindMismatch(std::is_same<Scalar, Complex>::value);
    return *S;
  }

  /**
   * @brief Frobenius norm over all blocks
   */
  double norm() const;

  MixedStack &operator+=(const MixedStack &other);
  MixedStack &operator-=(const MixedStack &other);
  MixedStack &operator*=(double alpha);
  MixedStack &operator/=(double alpha);

  MixedStack operator+(const MixedStack &other) const;
  MixedStack operator-(const MixedStack &other) const;
  MixedStack operator-() const;
  MixedStack operator*(double alpha) const;
  MixedStack operator/(double alpha) const;

  inline friend MixedStack operator*(double alpha, const MixedStack &S) {
    return S * alpha;
  }

 private:
  void throwKindMismatch(bool expectedComplex) const;

  boost::variant<RealStack, ComplexStack> data_;
};

}  // namespace RGEO

#endif
