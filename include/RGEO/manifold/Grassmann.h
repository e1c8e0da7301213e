/* ----------------------------------------------------------------------------
 * Copyright 2020, Massachusetts Institute of Technology, * Cambridge, MA 02139
 * All Rights Reserved
 * Authors: Yulun Tian, et al. (see README for the full author list)
 * See LICENSE for the license information
 * -------------------------------------------------------------------------- */

#ifndef GRASSMANN_H
#define GRASSMANN_H

#include <RGEO/RGEO_types.h>
#include <RGEO/manifold/GrassmannBase.h>

/*Define the namespace*/
namespace RGEO {

/**
 * @brief The Grassmann manifold Gr(n,p) of p-dimensional subspaces of R^n, or the product of k
 * copies of it.
 * Points are stacks of k n-by-p matrices with orthonormal columns. The geometry is the one of the
 * Riemannian quotient of the Stiefel manifold by the orthogonal group O(p): X and XQ represent the
 * same point for every orthogonal Q. Tangent vectors are horizontal, i.e. X^T V = 0 block-wise.
 */
class Grassmann : public GrassmannBase<double> {
 public:
  using GrassmannBase<double>::randomPoint;
  using GrassmannBase<double>::randomTangentVector;

  /**
   * @brief Constructor. Throws std::invalid_argument unless n >= p >= 1 and k >= 1.
   * @param n ambient dimension
   * @param p subspace dimension
   * @param k number of factors
   * @param params
   */
  Grassmann(unsigned int n, unsigned int p, unsigned int k = 1,
            const GrassmannParameters &params = GrassmannParameters());

  /**
   * @brief Euclidean norm of the vector of principal angles between the subspaces
   */
  double distance(const RealStack &a, const RealStack &b) const override;

  double innerProduct(const RealStack &x, const RealStack &u, const RealStack &v) const override;

  /**
   * @brief V - X (X^T V)
   */
  RealStack projection(const RealStack &x, const RealStack &v) const override;

  /**
   * @brief Polar factor of X + V. Signs of columns are irrelevant since only the column space matters.
   */
  RealStack retraction(const RealStack &x, const RealStack &v) const override;

  /**
   * @brief Geodesic step, followed by a QR re-orthonormalization of every block
   */
  RealStack exponentialMap(const RealStack &x, const RealStack &v) const override;

  /**
   * @brief Throws std::runtime_error if Y^T X is numerically singular for some block
   */
  RealStack logarithmMap(const RealStack &a, const RealStack &b) const override;

  RealStack randomPoint(RandomEngine &rng) const override;

  RealStack randomTangentVector(const RealStack &x, RandomEngine &rng) const override;

  /**
   * @brief Proj(ehess) - V (X^T egrad)
   */
  RealStack ambientToRiemannianHessian(const RealStack &x,
                                       const RealStack &egrad,
                                       const RealStack &ehess,
                                       const RealStack &v) const override;
};

}  // namespace RGEO

#endif
