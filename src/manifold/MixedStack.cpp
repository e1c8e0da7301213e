/* ----------------------------------------------------------------------------
 * Copyright 2020, Massachusetts Institute of Technology, * Cambridge, MA 02139
 * All Rights Reserved
 * Authors: Yulun Tian, et al. (see README for the full author list)
 * See LICENSE for the license information
 * -------------------------------------------------------------------------- */

#include <RGEO/manifold/MixedStack.h>
#include <sstream>

namespace RGEO {

namespace {

struct NormVisitor : public boost::static_visitor<double> {
  template <typename Stack>
  double operator()(const Stack &S) const {
    return S.norm();
  }
};

struct ScaleVisitor : public boost::static_visitor<void> {
  explicit ScaleVisitor(double a) : alpha(a) {}
  template <typename Stack>
  void operator()(Stack &S) const {
    S *= alpha;
  }
  double alpha;
};

// Applies an in-place update when both operands hold the same kind of stack
struct AddVisitor : public boost::static_visitor<bool> {
  explicit AddVisitor(double s) : sign(s) {}
  template <typename Stack>
  bool operator()(Stack &lhs, const Stack &rhs) const {
    if (sign > 0)
      lhs += rhs;
    else
      lhs -= rhs;
    return true;
  }
  template <typename Stack, typename Other>
  bool operator()(Stack &, const Other &) const {
    return false;
  }
  double sign;
};

}  // namespace

void MixedStack::throwKindMismatch(bool expectedComplex) const {
  std::stringstream ss;
  ss << "Matrix stack kind mismatch: expected " << (expectedComplex ? "complex" : "real")
     << ", got " << kind();
  throw std::invalid_argument(ss.str());
}

double MixedStack::norm() const {
  return boost::apply_visitor(NormVisitor(), data_);
}

MixedStack &MixedStack::operator+=(const MixedStack &other) {
  if (!boost::apply_visitor(AddVisitor(1), data_, other.data_)) {
    other.throwKindMismatch(isComplex());
  }
  return *this;
}

MixedStack &MixedStack::operator-=(const MixedStack &other) {
  if (!boost::apply_visitor(AddVisitor(-1), data_, other.data_)) {
    other.throwKindMismatch(isComplex());
  }
  return *this;
}

MixedStack &MixedStack::operator*=(double alpha) {
  ScaleVisitor visitor(alpha);
  boost::apply_visitor(visitor, data_);
  return *this;
}

MixedStack &MixedStack::operator/=(double alpha) {
  ScaleVisitor visitor(1.0 / alpha);
  boost::apply_visitor(visitor, data_);
  return *this;
}

MixedStack MixedStack::operator+(const MixedStack &other) const {
  MixedStack result(*this);
  result += other;
  return result;
}

MixedStack MixedStack::operator-(const MixedStack &other) const {
  MixedStack result(*this);
  result -= other;
  return result;
}

MixedStack MixedStack::operator-() const {
  return *this * -1.0;
}

MixedStack MixedStack::operator*(double alpha) const {
  MixedStack result(*this);
  result *= alpha;
  return result;
}

MixedStack MixedStack::operator/(double alpha) const {
  MixedStack result(*this);
  result /= alpha;
  return result;
}

}  // namespace RGEO
