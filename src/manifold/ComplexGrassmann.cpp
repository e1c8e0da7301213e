/* ----------------------------------------------------------------------------
 * Copyright 2020, Massachusetts Institute of Technology, * Cambridge, MA 02139
 * All Rights Reserved
 * Authors: Yulun Tian, et al. (see README for the full author list)
 * See LICENSE for the license information
 * -------------------------------------------------------------------------- */

#include <RGEO/manifold/ComplexGrassmann.h>
#include <RGEO/RGEO_multi.h>
#include <RGEO/RGEO_utils.h>
#include <Eigen/SVD>
#include <glog/logging.h>
#include <cmath>

namespace RGEO {

ComplexGrassmann::ComplexGrassmann(unsigned int n, unsigned int p, unsigned int k,
                                   const GrassmannParameters &params)
    : GrassmannBase<Complex>(n, p, k, 2, "Complex Grassmann manifold",
                             "Product complex Grassmann manifold", params) {}

double ComplexGrassmann::distance(const ComplexStack &a, const ComplexStack &b) const {
  checkShape(a, "point");
  checkShape(b, "point");
  double sumSq = 0;
  for (unsigned int i = 0; i < k_; ++i) {
    // The angles are real even though the blocks are complex
    const Vector theta = principalAngles(a.block(i), b.block(i));
    sumSq += theta.squaredNorm();
  }
  return std::sqrt(sumSq);
}

double ComplexGrassmann::innerProduct(const ComplexStack &x, const ComplexStack &u, const ComplexStack &v) const {
  (void) x;
  checkShape(u, "tangent vector");
  checkShape(v, "tangent vector");
  return std::real(u.getData().conjugate().cwiseProduct(v.getData()).sum());
}

ComplexStack ComplexGrassmann::projection(const ComplexStack &x, const ComplexStack &v) const {
  checkShape(x, "point");
  checkShape(v, "ambient vector");
  return v - multiprod(x, multiprod(multihconj(x), v));
}

ComplexStack ComplexGrassmann::retraction(const ComplexStack &x, const ComplexStack &v) const {
  checkShape(x, "point");
  checkShape(v, "tangent vector");
  ComplexStack Y(n_, p_, k_);
  for (unsigned int i = 0; i < k_; ++i) {
    Y.block(i) = projectToStiefelManifold<Complex>(x.block(i) + v.block(i));
  }
  return Y;
}

ComplexStack ComplexGrassmann::exponentialMap(const ComplexStack &x, const ComplexStack &v) const {
  checkShape(x, "point");
  checkShape(v, "tangent vector");
  ComplexStack Y(n_, p_, k_);
  for (unsigned int i = 0; i < k_; ++i) {
    Eigen::JacobiSVD<ComplexMatrix> svd(v.block(i), Eigen::ComputeThinU | Eigen::ComputeThinV);
    const ComplexMatrix &U = svd.matrixU();
    const ComplexMatrix &V = svd.matrixV();
    const ComplexVector cosS = svd.singularValues().array().cos().matrix().cast<Complex>();
    const ComplexVector sinS = svd.singularValues().array().sin().matrix().cast<Complex>();
    const ComplexMatrix Yi = x.block(i) * V * cosS.asDiagonal() * V.adjoint()
        + U * sinS.asDiagonal() * V.adjoint();
    // Re-orthonormalize to remove accumulated rounding errors
    Y.block(i) = orthonormalize<Complex>(Yi);
  }
  return Y;
}

ComplexStack ComplexGrassmann::logarithmMap(const ComplexStack &a, const ComplexStack &b) const {
  checkShape(a, "point");
  checkShape(b, "point");
  ComplexStack V(n_, p_, k_);
  for (unsigned int i = 0; i < k_; ++i) {
    const ComplexMatrix BH = solveLogarithmSystem(a.block(i), b.block(i), i);
    Eigen::JacobiSVD<ComplexMatrix> svd(BH.adjoint(), Eigen::ComputeThinU | Eigen::ComputeThinV);
    const ComplexVector arctanS = svd.singularValues().array().atan().matrix().cast<Complex>();
    V.block(i) = svd.matrixU() * arctanS.asDiagonal() * svd.matrixV().adjoint();
  }
  return V;
}

ComplexStack ComplexGrassmann::randomPoint(RandomEngine &rng) const {
  ComplexStack X(n_, p_, k_);
  for (unsigned int i = 0; i < k_; ++i) {
    X.block(i) = orthonormalize<Complex>(randomNormalMatrix<Complex>(n_, p_, rng));
  }
  return X;
}

ComplexStack ComplexGrassmann::randomTangentVector(const ComplexStack &x, RandomEngine &rng) const {
  // For n = p the tangent space is {0} and the projection is pure rounding noise
  if (this->dimension() == 0) return zeroTangentVector(x);
  ComplexStack V = projection(x, randomAmbientVector(rng));
  return V / V.norm();
}

ComplexStack ComplexGrassmann::ambientToRiemannianHessian(const ComplexStack &x,
                                                          const ComplexStack &egrad,
                                                          const ComplexStack &ehess,
                                                          const ComplexStack &v) const {
  checkShape(egrad, "ambient gradient");
  checkShape(v, "tangent vector");
  const ComplexStack PXehess = projection(x, ehess);
  const ComplexStack XHG = multiprod(multihconj(x), egrad);
  return PXehess - multiprod(v, XHG);
}

}  // namespace RGEO
