/* ----------------------------------------------------------------------------
 * Copyright 2020, Massachusetts Institute of Technology, * Cambridge, MA 02139
 * All Rights Reserved
 * Authors: Yulun Tian, et al. (see README for the full author list)
 * See LICENSE for the license information
 * -------------------------------------------------------------------------- */

#include <RGEO/RGEO_multi.h>
#include <Eigen/Dense>
#include <Eigen/Eigenvalues>
#include <unsupported/Eigen/MatrixFunctions>
#include <glog/logging.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace RGEO {

namespace {

template <typename Scalar>
void checkSquare(const MatrixStack<Scalar> &A, const std::string &caller) {
  if (A.rows() != A.cols()) {
    std::stringstream ss;
    ss << caller << ": blocks must be square, got " << A.rows() << " x " << A.cols();
    throw std::invalid_argument(ss.str());
  }
}

/**
 * Throw if the square matrix M has an eigenvalue on the closed negative real axis,
 * where the principal matrix logarithm is not defined.
 */
template <typename Scalar>
void checkLogarithmDomain(const Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> &M, unsigned int index) {
  const ComplexMatrix Mc = M.template cast<Complex>();
  Eigen::ComplexEigenSolver<ComplexMatrix> solver(Mc, false);
  if (solver.info() != Eigen::Success) {
    std::stringstream ss;
    ss << "multilogm: eigenvalue computation failed for block " << index;
    throw std::runtime_error(ss.str());
  }
  const double scale = std::max(1.0, M.norm());
  const double tol = 100 * std::numeric_limits<double>::epsilon() * scale;
  const ComplexVector &lambda = solver.eigenvalues();
  for (Eigen::Index j = 0; j < lambda.size(); ++j) {
    if (std::abs(lambda(j).imag()) <= tol && lambda(j).real() <= tol) {
      std::stringstream ss;
      ss << "multilogm: block " << index << " has eigenvalue " << lambda(j)
         << " on the non-positive real axis, matrix logarithm is undefined";
      VLOG(1) << ss.str();
      throw std::runtime_error(ss.str());
    }
  }
}

/**
 * V diag(f(w)) V^H for the eigendecomposition of a Hermitian block
 */
template <typename Scalar, typename Func>
Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> hermitianFunction(
    const Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> &M, Func f) {
  typedef Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> BlockType;
  Eigen::SelfAdjointEigenSolver<BlockType> solver(M);
  const BlockType &V = solver.eigenvectors();
  const Eigen::Matrix<Scalar, Eigen::Dynamic, 1> fw =
      solver.eigenvalues().unaryExpr(f).template cast<Scalar>();
  return V * fw.asDiagonal() * V.adjoint();
}

}  // namespace

template <typename Scalar>
MatrixStack<Scalar> multiprod(const MatrixStack<Scalar> &A, const MatrixStack<Scalar> &B) {
  if (A.k() != B.k() || A.cols() != B.rows()) {
    std::stringstream ss;
    ss << "multiprod: incompatible shapes (" << A.k() << " x " << A.rows() << " x " << A.cols()
       << ") and (" << B.k() << " x " << B.rows() << " x " << B.cols() << ")";
    throw std::invalid_argument(ss.str());
  }
  MatrixStack<Scalar> C(A.rows(), B.cols(), A.k());
  for (unsigned int i = 0; i < A.k(); ++i) {
    C.block(i).noalias() = A.block(i) * B.block(i);
  }
  return C;
}

template <typename Scalar>
MatrixStack<Scalar> multitransp(const MatrixStack<Scalar> &A) {
  MatrixStack<Scalar> At(A.cols(), A.rows(), A.k());
  for (unsigned int i = 0; i < A.k(); ++i) {
    At.block(i) = A.block(i).transpose();
  }
  return At;
}

template <typename Scalar>
MatrixStack<Scalar> multihconj(const MatrixStack<Scalar> &A) {
  MatrixStack<Scalar> AH(A.cols(), A.rows(), A.k());
  for (unsigned int i = 0; i < A.k(); ++i) {
    AH.block(i) = A.block(i).adjoint();
  }
  return AH;
}

template <typename Scalar>
MatrixStack<Scalar> multisym(const MatrixStack<Scalar> &A) {
  checkSquare(A, "multisym");
  return 0.5 * (A + multitransp(A));
}

template <typename Scalar>
MatrixStack<Scalar> multiskew(const MatrixStack<Scalar> &A) {
  checkSquare(A, "multiskew");
  return 0.5 * (A - multitransp(A));
}

template <typename Scalar>
MatrixStack<Scalar> multieye(unsigned int k, unsigned int n) {
  MatrixStack<Scalar> I(n, n, k);
  for (unsigned int i = 0; i < k; ++i) {
    I.block(i).setIdentity();
  }
  return I;
}

template <typename Scalar>
MatrixStack<Scalar> multilogm(const MatrixStack<Scalar> &A, bool positive_definite) {
  typedef typename MatrixStack<Scalar>::BlockType BlockType;
  checkSquare(A, "multilogm");
  MatrixStack<Scalar> L(A.rows(), A.cols(), A.k());
  for (unsigned int i = 0; i < A.k(); ++i) {
    const BlockType Ai = A.block(i);
    if (positive_definite) {
      L.block(i) = hermitianFunction<Scalar>(Ai, [](double w) { return std::log(w); });
    } else {
      checkLogarithmDomain<Scalar>(Ai, i);
      const BlockType Li = Ai.log();
      if (!Li.allFinite()) {
        std::stringstream ss;
        ss << "multilogm: matrix logarithm of block " << i << " is not finite";
        throw std::runtime_error(ss.str());
      }
      L.block(i) = Li;
    }
  }
  return L;
}

template <typename Scalar>
MatrixStack<Scalar> multiexpm(const MatrixStack<Scalar> &A, bool symmetric) {
  typedef typename MatrixStack<Scalar>::BlockType BlockType;
  checkSquare(A, "multiexpm");
  MatrixStack<Scalar> E(A.rows(), A.cols(), A.k());
  for (unsigned int i = 0; i < A.k(); ++i) {
    const BlockType Ai = A.block(i);
    if (symmetric) {
      E.block(i) = hermitianFunction<Scalar>(Ai, [](double w) { return std::exp(w); });
    } else {
      E.block(i) = Ai.exp();
    }
  }
  return E;
}

#define RGEO_INSTANTIATE_MULTI(Scalar)                                                                    \
  template MatrixStack<Scalar> multiprod<Scalar>(const MatrixStack<Scalar> &, const MatrixStack<Scalar> &); \
  template MatrixStack<Scalar> multitransp<Scalar>(const MatrixStack<Scalar> &);                           \
  template MatrixStack<Scalar> multihconj<Scalar>(const MatrixStack<Scalar> &);                            \
  template MatrixStack<Scalar> multisym<Scalar>(const MatrixStack<Scalar> &);                              \
  template MatrixStack<Scalar> multiskew<Scalar>(const MatrixStack<Scalar> &);                             \
  template MatrixStack<Scalar> multieye<Scalar>(unsigned int, unsigned int);                               \
  template MatrixStack<Scalar> multilogm<Scalar>(const MatrixStack<Scalar> &, bool);                       \
  template MatrixStack<Scalar> multiexpm<Scalar>(const MatrixStack<Scalar> &, bool);

RGEO_INSTANTIATE_MULTI(double)
RGEO_INSTANTIATE_MULTI(Complex)

#undef RGEO_INSTANTIATE_MULTI

}  // namespace RGEO
