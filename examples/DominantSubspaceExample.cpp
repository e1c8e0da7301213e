/* ----------------------------------------------------------------------------
 * Copyright 2020, Massachusetts Institute of Technology, * Cambridge, MA 02139
 * All Rights Reserved
 * Authors: Yulun Tian, et al. (see README for the full author list)
 * See LICENSE for the license information
 * -------------------------------------------------------------------------- */

#include <RGEO/RGEO_types.h>
#include <RGEO/RGEO_utils.h>
#include <RGEO/manifold/Grassmann.h>

#include <Eigen/Eigenvalues>
#include <glog/logging.h>

#include <cstdlib>
#include <iostream>

using namespace std;
using namespace RGEO;

/**
 * Cost -tr(X^T A X) on Gr(n, p). Its minimizers span the dominant p-dimensional
 * eigenspace of the symmetric matrix A.
 */
double cost(const Matrix &A, const RealStack &X) {
  return -(X.getData().transpose() * A * X.getData()).trace();
}

RealStack egrad(const Matrix &A, const RealStack &X) {
  return RealStack(Matrix(-2 * A * X.getData()));
}

RealStack ehess(const Matrix &A, const RealStack &U) {
  return RealStack(Matrix(-2 * A * U.getData()));
}

int main(int argc, char **argv) {
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = true;

  unsigned int n = 128;
  unsigned int p = 3;
  unsigned int seed = 42;
  if (argc > 1) seed = std::atoi(argv[1]);
  seedDefaultRandomEngine(seed);

  /**
  ###########################################
  Random symmetric data matrix
  ###########################################
  */
  Matrix B = randomNormalMatrix<double>(n, n, defaultRandomEngine());
  Matrix A = 0.5 * (B + B.transpose());

  Grassmann manifold(n, p);
  LOG(INFO) << "Working on " << manifold.name() << " (dimension " << manifold.dimension() << ").";

  /**
  ###########################################
  Riemannian gradient at a random point
  ###########################################
  */
  RealStack X = manifold.randomPoint();
  RealStack rgrad = manifold.ambientToRiemannianGradient(X, egrad(A, X));
  LOG(INFO) << "Random point: cost = " << cost(A, X)
            << ", Riemannian gradient norm = " << manifold.norm(X, rgrad);

  /**
  ###########################################
  Riemannian gradient on the dominant eigenspace
  ###########################################
  */
  Eigen::SelfAdjointEigenSolver<Matrix> eig(A);
  if (eig.info() != Eigen::Success) {
    LOG(ERROR) << "Eigendecomposition failed.";
    return EXIT_FAILURE;
  }
  // Eigenvalues are sorted in increasing order
  RealStack Xstar(Matrix(eig.eigenvectors().rightCols(p)));
  RealStack rgradStar = manifold.ambientToRiemannianGradient(Xstar, egrad(A, Xstar));
  LOG(INFO) << "Dominant eigenspace: cost = " << cost(A, Xstar)
            << " (expected " << -eig.eigenvalues().tail(p).sum() << ")"
            << ", Riemannian gradient norm = " << manifold.norm(Xstar, rgradStar);

  // Second order information: the Riemannian Hessian is positive semidefinite at the minimizer
  RealStack U = manifold.randomTangentVector(Xstar);
  RealStack HU = manifold.ambientToRiemannianHessian(Xstar, egrad(A, Xstar), ehess(A, U), U);
  LOG(INFO) << "Curvature <U, Hess[U]> along a random unit direction: " << manifold.innerProduct(Xstar, U, HU);

  LOG(INFO) << "Distance between the random point and the dominant eigenspace: "
            << manifold.distance(X, Xstar) << " (typical distance " << manifold.typicalDistance() << ")";

  exit(0);
}
