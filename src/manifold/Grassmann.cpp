/* ----------------------------------------------------------------------------
 * Copyright 2020, Massachusetts Institute of Technology, * Cambridge, MA 02139
 * All Rights Reserved
 * Authors: Yulun Tian, et al. (see README for the full author list)
 * See LICENSE for the license information
 * -------------------------------------------------------------------------- */

#include <RGEO/manifold/Grassmann.h>
#include <RGEO/RGEO_multi.h>
#include <RGEO/RGEO_utils.h>
#include <Eigen/SVD>
#include <glog/logging.h>
#include <cmath>

namespace RGEO {

Grassmann::Grassmann(unsigned int n, unsigned int p, unsigned int k, const GrassmannParameters &params)
    : GrassmannBase<double>(n, p, k, 1, "Grassmann manifold", "Product Grassmann manifold", params) {}

double Grassmann::distance(const RealStack &a, const RealStack &b) const {
  checkShape(a, "point");
  checkShape(b, "point");
  double sumSq = 0;
  for (unsigned int i = 0; i < k_; ++i) {
    sumSq += principalAngles(a.block(i), b.block(i)).squaredNorm();
  }
  return std::sqrt(sumSq);
}

double Grassmann::innerProduct(const RealStack &x, const RealStack &u, const RealStack &v) const {
  (void) x;
  checkShape(u, "tangent vector");
  checkShape(v, "tangent vector");
  return u.getData().cwiseProduct(v.getData()).sum();
}

RealStack Grassmann::projection(const RealStack &x, const RealStack &v) const {
  checkShape(x, "point");
  checkShape(v, "ambient vector");
  return v - multiprod(x, multiprod(multitransp(x), v));
}

RealStack Grassmann::retraction(const RealStack &x, const RealStack &v) const {
  checkShape(x, "point");
  checkShape(v, "tangent vector");
  RealStack Y(n_, p_, k_);
  for (unsigned int i = 0; i < k_; ++i) {
    Y.block(i) = projectToStiefelManifold<double>(x.block(i) + v.block(i));
  }
  return Y;
}

RealStack Grassmann::exponentialMap(const RealStack &x, const RealStack &v) const {
  checkShape(x, "point");
  checkShape(v, "tangent vector");
  RealStack Y(n_, p_, k_);
  for (unsigned int i = 0; i < k_; ++i) {
    Eigen::JacobiSVD<Matrix> svd(v.block(i), Eigen::ComputeThinU | Eigen::ComputeThinV);
    const Matrix &U = svd.matrixU();
    const Matrix &V = svd.matrixV();
    const Vector cosS = svd.singularValues().array().cos().matrix();
    const Vector sinS = svd.singularValues().array().sin().matrix();
    const Matrix Yi = x.block(i) * V * cosS.asDiagonal() * V.transpose()
        + U * sinS.asDiagonal() * V.transpose();
    // Rounding errors accumulate quickly without re-orthonormalization
    Y.block(i) = orthonormalize<double>(Yi);
  }
  return Y;
}

RealStack Grassmann::logarithmMap(const RealStack &a, const RealStack &b) const {
  checkShape(a, "point");
  checkShape(b, "point");
  RealStack V(n_, p_, k_);
  for (unsigned int i = 0; i < k_; ++i) {
    const Matrix Bt = solveLogarithmSystem(a.block(i), b.block(i), i);
    Eigen::JacobiSVD<Matrix> svd(Bt.transpose(), Eigen::ComputeThinU | Eigen::ComputeThinV);
    const Vector arctanS = svd.singularValues().array().atan().matrix();
    V.block(i) = svd.matrixU() * arctanS.asDiagonal() * svd.matrixV().transpose();
  }
  return V;
}

RealStack Grassmann::randomPoint(RandomEngine &rng) const {
  RealStack X(n_, p_, k_);
  for (unsigned int i = 0; i < k_; ++i) {
    X.block(i) = orthonormalize<double>(randomNormalMatrix<double>(n_, p_, rng));
  }
  return X;
}

RealStack Grassmann::randomTangentVector(const RealStack &x, RandomEngine &rng) const {
  // For n = p the tangent space is {0} and the projection is pure rounding noise
  if (this->dimension() == 0) return zeroTangentVector(x);
  RealStack V = projection(x, randomAmbientVector(rng));
  return V / V.norm();
}

RealStack Grassmann::ambientToRiemannianHessian(const RealStack &x,
                                                const RealStack &egrad,
                                                const RealStack &ehess,
                                                const RealStack &v) const {
  checkShape(egrad, "ambient gradient");
  checkShape(v, "tangent vector");
  const RealStack PXehess = projection(x, ehess);
  const RealStack XtG = multiprod(multitransp(x), egrad);
  return PXehess - multiprod(v, XtG);
}

}  // namespace RGEO
