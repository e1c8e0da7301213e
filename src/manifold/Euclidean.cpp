/* ----------------------------------------------------------------------------
 * Copyright 2020, Massachusetts Institute of Technology, * Cambridge, MA 02139
 * All Rights Reserved
 * Authors: Yulun Tian, et al. (see README for the full author list)
 * See LICENSE for the license information
 * -------------------------------------------------------------------------- */

#include <RGEO/manifold/Euclidean.h>
#include <RGEO/RGEO_utils.h>
#include <glog/logging.h>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace RGEO {

namespace {

unsigned int validatedDimension(unsigned int m, unsigned int n) {
  if (m < 1 || n < 1) {
    std::stringstream ss;
    ss << "Need m >= 1 and n >= 1. Values supplied were m = " << m << " and n = " << n;
    throw std::invalid_argument(ss.str());
  }
  return m * n;
}

std::string euclideanName(unsigned int m, unsigned int n) {
  std::stringstream ss;
  ss << "Euclidean manifold of " << m << "x" << n << " matrices";
  return ss.str();
}

}  // namespace

Euclidean::Euclidean(unsigned int m, unsigned int n)
    : Manifold<RealStack>(euclideanName(m, n), validatedDimension(m, n)), m_(m), n_(n) {
  VLOG(1) << "Constructed " << name() << " of dimension " << dimension();
}

void Euclidean::checkShape(const RealStack &S, const char *what) const {
  if (S.rows() != m_ || S.cols() != n_ || S.k() != 1) {
    std::stringstream ss;
    ss << name() << ": expected " << what << " of shape (" << m_ << " x " << n_ << "), got ("
       << S.k() << " x " << S.rows() << " x " << S.cols() << ")";
    throw std::invalid_argument(ss.str());
  }
}

double Euclidean::typicalDistance() const {
  return std::sqrt(static_cast<double>(dimension()));
}

double Euclidean::innerProduct(const RealStack &x, const RealStack &u, const RealStack &v) const {
  (void) x;
  checkShape(u, "tangent vector");
  checkShape(v, "tangent vector");
  return u.getData().cwiseProduct(v.getData()).sum();
}

double Euclidean::norm(const RealStack &x, const RealStack &v) const {
  (void) x;
  checkShape(v, "tangent vector");
  return v.norm();
}

double Euclidean::distance(const RealStack &a, const RealStack &b) const {
  checkShape(a, "point");
  checkShape(b, "point");
  return (a - b).norm();
}

RealStack Euclidean::projection(const RealStack &x, const RealStack &v) const {
  (void) x;
  checkShape(v, "ambient vector");
  return v;
}

RealStack Euclidean::retraction(const RealStack &x, const RealStack &v) const {
  return exponentialMap(x, v);
}

RealStack Euclidean::exponentialMap(const RealStack &x, const RealStack &v) const {
  checkShape(x, "point");
  checkShape(v, "tangent vector");
  return x + v;
}

RealStack Euclidean::logarithmMap(const RealStack &a, const RealStack &b) const {
  checkShape(a, "point");
  checkShape(b, "point");
  return b - a;
}

RealStack Euclidean::parallelTransport(const RealStack &a, const RealStack &b, const RealStack &v) const {
  (void) a;
  (void) b;
  checkShape(v, "tangent vector");
  return v;
}

RealStack Euclidean::randomPoint(RandomEngine &rng) const {
  return RealStack(randomNormalMatrix<double>(m_, n_, rng));
}

RealStack Euclidean::randomTangentVector(const RealStack &x, RandomEngine &rng) const {
  checkShape(x, "point");
  RealStack v(randomNormalMatrix<double>(m_, n_, rng));
  return v / v.norm();
}

RealStack Euclidean::zeroTangentVector(const RealStack &x) const {
  checkShape(x, "point");
  return RealStack::Zero(m_, n_);
}

RealStack Euclidean::ambientToRiemannianHessian(const RealStack &x,
                                                const RealStack &egrad,
                                                const RealStack &ehess,
                                                const RealStack &v) const {
  (void) x;
  (void) egrad;
  (void) v;
  checkShape(ehess, "ambient Hessian-vector product");
  return ehess;
}

RealStack Euclidean::pairMean(const RealStack &a, const RealStack &b) const {
  checkShape(a, "point");
  checkShape(b, "point");
  return 0.5 * (a + b);
}

}  // namespace RGEO
