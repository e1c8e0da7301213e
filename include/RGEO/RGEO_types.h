/* ----------------------------------------------------------------------------
 * Copyright 2020, Massachusetts Institute of Technology, * Cambridge, MA 02139
 * All Rights Reserved
 * Authors: Yulun Tian, et al. (see README for the full author list)
 * See LICENSE for the license information
 * -------------------------------------------------------------------------- */

#ifndef RGEO_TYPES_H
#define RGEO_TYPES_H

#include <Eigen/Core>
#include <complex>
#include <iostream>
#include <random>
#include <string>

namespace RGEO {

typedef std::complex<double> Complex;
typedef Eigen::VectorXd Vector;
typedef Eigen::MatrixXd Matrix;
typedef Eigen::VectorXcd ComplexVector;
typedef Eigen::MatrixXcd ComplexMatrix;

// Pseudo-random engine used for sampling points and tangent vectors
typedef std::mt19937 RandomEngine;

/**
 * @brief Parameter settings for the (real and complex) Grassmann manifolds
 */
class GrassmannParameters {
 public:
  explicit GrassmannParameters(double logRcondTol = 1e-12)
      : log_rcond_tol(logRcondTol) {}

  // The logarithm map solves a p-by-p linear system with coefficient matrix Y^H X.
  // The map is rejected when the estimated reciprocal condition number of that
  // matrix falls below this threshold. Zero keeps only the check for non-finite output.
  double log_rcond_tol;

  inline friend std::ostream &operator<<(
      std::ostream &os, const GrassmannParameters &params) {
    os << "Grassmann manifold parameters: " << std::endl;
    os << "Logarithm map rcond tol: " << params.log_rcond_tol << std::endl;
    return os;
  }
};

}  // namespace RGEO

#endif
