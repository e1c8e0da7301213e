/* ----------------------------------------------------------------------------
 * Copyright 2020, Massachusetts Institute of Technology, * Cambridge, MA 02139
 * All Rights Reserved
 * Authors: Yulun Tian, et al. (see README for the full author list)
 * See LICENSE for the license information
 * -------------------------------------------------------------------------- */

#include <RGEO/manifold/GrassmannBase.h>
#include <RGEO/RGEO_utils.h>
#include <Eigen/LU>
#include <Eigen/SVD>
#include <glog/logging.h>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace RGEO {

namespace {

unsigned int validatedDimension(unsigned int n, unsigned int p, unsigned int k, unsigned int factor) {
  if (n < p || p < 1) {
    std::stringstream ss;
    ss << "Need n >= p >= 1. Values supplied were n = " << n << " and p = " << p;
    throw std::invalid_argument(ss.str());
  }
  if (k < 1) {
    std::stringstream ss;
    ss << "Need k >= 1. Value supplied was k = " << k;
    throw std::invalid_argument(ss.str());
  }
  return factor * k * (n * p - p * p);
}

std::string grassmannName(unsigned int n, unsigned int p, unsigned int k,
                          const std::string &label, const std::string &productLabel) {
  std::stringstream ss;
  if (k == 1) {
    ss << label << " Gr(" << n << "," << p << ")";
  } else {
    ss << productLabel << " Gr(" << n << "," << p << ")^" << k;
  }
  return ss.str();
}

}  // namespace

template <typename Scalar>
GrassmannBase<Scalar>::GrassmannBase(unsigned int n, unsigned int p, unsigned int k,
                                     unsigned int realDimensionFactor,
                                     const std::string &label,
                                     const std::string &productLabel,
                                     const GrassmannParameters &params)
    : Manifold<MatrixStack<Scalar>>(grassmannName(n, p, k, label, productLabel),
                                    validatedDimension(n, p, k, realDimensionFactor)),
      n_(n), p_(p), k_(k), params_(params) {
  VLOG(1) << "Constructed " << this->name() << " of dimension " << this->dimension();
  VLOG(2) << params_;
}

template <typename Scalar>
double GrassmannBase<Scalar>::typicalDistance() const {
  return std::sqrt(static_cast<double>(p_ * k_));
}

template <typename Scalar>
double GrassmannBase<Scalar>::norm(const Stack &x, const Stack &v) const {
  (void) x;
  checkShape(v, "tangent vector");
  return v.norm();
}

template <typename Scalar>
typename GrassmannBase<Scalar>::Stack GrassmannBase<Scalar>::zeroTangentVector(const Stack &x) const {
  checkShape(x, "point");
  return Stack::Zero(n_, p_, k_);
}

template <typename Scalar>
void GrassmannBase<Scalar>::checkShape(const Stack &S, const char *what) const {
  if (S.rows() != n_ || S.cols() != p_ || S.k() != k_) {
    std::stringstream ss;
    ss << this->name() << ": expected " << what << " of shape (" << k_ << " x " << n_ << " x " << p_
       << "), got (" << S.k() << " x " << S.rows() << " x " << S.cols() << ")";
    throw std::invalid_argument(ss.str());
  }
}

template <typename Scalar>
typename GrassmannBase<Scalar>::Stack GrassmannBase<Scalar>::randomAmbientVector(RandomEngine &rng) const {
  Stack G(n_, p_, k_);
  for (unsigned int i = 0; i < k_; ++i) {
    G.block(i) = randomNormalMatrix<Scalar>(n_, p_, rng);
  }
  return G;
}

template <typename Scalar>
typename GrassmannBase<Scalar>::BlockType GrassmannBase<Scalar>::solveLogarithmSystem(
    const BlockType &X, const BlockType &Y, unsigned int index) const {
  const BlockType YHX = Y.adjoint() * X;
  const BlockType AH = Y.adjoint() - YHX * X.adjoint();
  Eigen::PartialPivLU<BlockType> lu(YHX);
  const double rcond = lu.rcond();
  if (!(rcond >= params_.log_rcond_tol)) {
    std::stringstream ss;
    ss << this->name() << ": logarithm map is undefined for block " << index
       << ", Y^H X is numerically singular (rcond = " << rcond << ")";
    VLOG(1) << ss.str();
    throw std::runtime_error(ss.str());
  }
  const BlockType BH = lu.solve(AH);
  if (!BH.allFinite()) {
    std::stringstream ss;
    ss << this->name() << ": logarithm map of block " << index << " is not finite";
    VLOG(1) << ss.str();
    throw std::runtime_error(ss.str());
  }
  return BH;
}

template <typename Scalar>
Vector GrassmannBase<Scalar>::principalAngles(const BlockType &X, const BlockType &Y) const {
  // Singular values of X^H Y are the cosines. With X^H Y = U C V^H, the columns of
  // (I - X X^H) Y V are mutually orthogonal and their norms are the sines.
  const BlockType XHY = X.adjoint() * Y;
  Eigen::JacobiSVD<BlockType> svd(XHY, Eigen::ComputeThinU | Eigen::ComputeThinV);
  const BlockType YperpV = (Y - X * XHY) * svd.matrixV();
  Vector theta(svd.singularValues().size());
  for (Eigen::Index j = 0; j < theta.size(); ++j) {
    theta(j) = std::atan2(YperpV.col(j).norm(), svd.singularValues()(j));
  }
  return theta;
}

template class GrassmannBase<double>;
template class GrassmannBase<Complex>;

}  // namespace RGEO
