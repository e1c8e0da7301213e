/* ----------------------------------------------------------------------------
 * Copyright 2020, Massachusetts Institute of Technology, * Cambridge, MA 02139
 * All Rights Reserved
 * Authors: Yulun Tian, et al. (see README for the full author list)
 * See LICENSE for the license information
 * -------------------------------------------------------------------------- */

#include <RGEO/RGEO_utils.h>
#include <Eigen/QR>
#include <glog/logging.h>
#include <random>

namespace RGEO {

namespace {

template <typename Scalar>
struct NormalSampler;

template <>
struct NormalSampler<double> {
  static double sample(std::normal_distribution<double> &dist, RandomEngine &rng) {
    return dist(rng);
  }
};

template <>
struct NormalSampler<Complex> {
  static Complex sample(std::normal_distribution<double> &dist, RandomEngine &rng) {
    const double re = dist(rng);
    const double im = dist(rng);
    return {re, im};
  }
};

}  // namespace

RandomEngine &defaultRandomEngine() {
  thread_local RandomEngine rng{std::random_device{}()};
  return rng;
}

void seedDefaultRandomEngine(unsigned int seed) {
  defaultRandomEngine().seed(seed);
}

template <typename Scalar>
Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> randomNormalMatrix(unsigned int rows,
                                                                         unsigned int cols,
                                                                         RandomEngine &rng) {
  std::normal_distribution<double> dist(0.0, 1.0);
  Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> M(rows, cols);
  // Fill column by column so that the draw order is fixed for a given seed
  for (unsigned int j = 0; j < cols; ++j) {
    for (unsigned int i = 0; i < rows; ++i) {
      M(i, j) = NormalSampler<Scalar>::sample(dist, rng);
    }
  }
  return M;
}

template <typename Scalar>
Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> orthonormalize(
    const Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> &M) {
  typedef Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> BlockType;
  CHECK_GE(M.rows(), M.cols());
  Eigen::HouseholderQR<BlockType> qr(M);
  return qr.householderQ() * BlockType::Identity(M.rows(), M.cols());
}

template <typename Scalar>
Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> projectToStiefelManifold(
    const Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> &M) {
  typedef Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> BlockType;
  CHECK_GE(M.rows(), M.cols());
  Eigen::JacobiSVD<BlockType> svd(M, Eigen::ComputeThinU | Eigen::ComputeThinV);
  return svd.matrixU() * svd.matrixV().adjoint();
}

Matrix fixedStiefelVariable(unsigned d, unsigned r) {
  RandomEngine rng(1);
  return orthonormalize<double>(randomNormalMatrix<double>(r, d, rng));
}

template <typename Scalar>
double orthonormalityError(const Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> &Y) {
  typedef Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> BlockType;
  return (Y.adjoint() * Y - BlockType::Identity(Y.cols(), Y.cols())).norm();
}

#define RGEO_INSTANTIATE_UTILS(Scalar)                                                          \
  template Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> randomNormalMatrix<Scalar>(      \
      unsigned int, unsigned int, RandomEngine &);                                                \
  template Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> orthonormalize<Scalar>(          \
      const Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> &);                             \
  template Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> projectToStiefelManifold<Scalar>( \
      const Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> &);                             \
  template double orthonormalityError<Scalar>(const Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> &);

RGEO_INSTANTIATE_UTILS(double)
RGEO_INSTANTIATE_UTILS(Complex)

#undef RGEO_INSTANTIATE_UTILS

}  // namespace RGEO
