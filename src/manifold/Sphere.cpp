/* ----------------------------------------------------------------------------
 * Copyright 2020, Massachusetts Institute of Technology, * Cambridge, MA 02139
 * All Rights Reserved
 * Authors: Yulun Tian, et al. (see README for the full author list)
 * See LICENSE for the license information
 * -------------------------------------------------------------------------- */

#include <RGEO/manifold/Sphere.h>
#include <RGEO/RGEO_utils.h>
#include <boost/math/constants/constants.hpp>
#include <boost/math/special_functions/sinc.hpp>
#include <glog/logging.h>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace RGEO {

namespace {

unsigned int validatedDimension(unsigned int n) {
  if (n < 2) {
    std::stringstream ss;
    ss << "Need n >= 2. Value supplied was n = " << n;
    throw std::invalid_argument(ss.str());
  }
  return n - 1;
}

std::string sphereName(unsigned int n) {
  std::stringstream ss;
  ss << "Sphere manifold of " << n << "-dimensional vectors";
  return ss.str();
}

}  // namespace

Sphere::Sphere(unsigned int n)
    : Manifold<RealStack>(sphereName(n), validatedDimension(n)), n_(n) {
  VLOG(1) << "Constructed " << name() << " of dimension " << dimension();
}

void Sphere::checkShape(const RealStack &S, const char *what) const {
  if (S.rows() != n_ || S.cols() != 1 || S.k() != 1) {
    std::stringstream ss;
    ss << name() << ": expected " << what << " of shape (" << n_ << " x 1), got ("
       << S.k() << " x " << S.rows() << " x " << S.cols() << ")";
    throw std::invalid_argument(ss.str());
  }
}

double Sphere::typicalDistance() const {
  return boost::math::constants::pi<double>();
}

double Sphere::innerProduct(const RealStack &x, const RealStack &u, const RealStack &v) const {
  (void) x;
  checkShape(u, "tangent vector");
  checkShape(v, "tangent vector");
  return u.getData().cwiseProduct(v.getData()).sum();
}

double Sphere::norm(const RealStack &x, const RealStack &v) const {
  (void) x;
  checkShape(v, "tangent vector");
  return v.norm();
}

double Sphere::distance(const RealStack &a, const RealStack &b) const {
  checkShape(a, "point");
  checkShape(b, "point");
  // |a - b| = 2 sin(theta / 2) and |a + b| = 2 cos(theta / 2) for unit vectors
  return 2 * std::atan2((a - b).norm(), (a + b).norm());
}

RealStack Sphere::projection(const RealStack &x, const RealStack &v) const {
  checkShape(x, "point");
  checkShape(v, "ambient vector");
  return v - innerProduct(x, x, v) * x;
}

RealStack Sphere::retraction(const RealStack &x, const RealStack &v) const {
  checkShape(x, "point");
  checkShape(v, "tangent vector");
  RealStack y = x + v;
  return y / y.norm();
}

RealStack Sphere::exponentialMap(const RealStack &x, const RealStack &v) const {
  checkShape(x, "point");
  const double theta = norm(x, v);
  // sin(theta) / theta, continuous at zero
  return std::cos(theta) * x + boost::math::sinc_pi(theta) * v;
}

RealStack Sphere::logarithmMap(const RealStack &a, const RealStack &b) const {
  const RealStack v = projection(a, b - a);
  const double dist = distance(a, b);
  const double eps = std::numeric_limits<double>::epsilon();
  const double factor = (dist + eps) / (v.norm() + eps);
  return factor * v;
}

RealStack Sphere::randomPoint(RandomEngine &rng) const {
  RealStack x(randomNormalMatrix<double>(n_, 1, rng));
  return x / x.norm();
}

RealStack Sphere::randomTangentVector(const RealStack &x, RandomEngine &rng) const {
  RealStack v = projection(x, RealStack(randomNormalMatrix<double>(n_, 1, rng)));
  return v / v.norm();
}

RealStack Sphere::zeroTangentVector(const RealStack &x) const {
  checkShape(x, "point");
  return RealStack::Zero(n_, 1);
}

RealStack Sphere::ambientToRiemannianHessian(const RealStack &x,
                                             const RealStack &egrad,
                                             const RealStack &ehess,
                                             const RealStack &v) const {
  checkShape(egrad, "ambient gradient");
  checkShape(v, "tangent vector");
  return projection(x, ehess) - innerProduct(x, x, egrad) * v;
}

RealStack Sphere::pairMean(const RealStack &a, const RealStack &b) const {
  checkShape(a, "point");
  checkShape(b, "point");
  RealStack m = a + b;
  const double mnorm = m.norm();
  if (!(mnorm > 100 * std::numeric_limits<double>::epsilon())) {
    std::stringstream ss;
    ss << name() << ": pair mean is undefined for antipodal points (|a + b| = " << mnorm << ")";
    VLOG(1) << ss.str();
    throw std::runtime_error(ss.str());
  }
  return m / mnorm;
}

}  // namespace RGEO
