/* ----------------------------------------------------------------------------
 * Copyright 2020, Massachusetts Institute of Technology, * Cambridge, MA 02139
 * All Rights Reserved
 * Authors: Yulun Tian, et al. (see README for the full author list)
 * See LICENSE for the license information
 * -------------------------------------------------------------------------- */

#ifndef COMPLEXGRASSMANN_H
#define COMPLEXGRASSMANN_H

#include <RGEO/RGEO_types.h>
#include <RGEO/manifold/GrassmannBase.h>

/*Define the namespace*/
namespace RGEO {

/**
 * @brief The complex Grassmann manifold of p-dimensional subspaces of C^n, or the product of k
 * copies of it.
 * Points are stacks of k n-by-p complex matrices with orthonormal columns, identified up to
 * right multiplication by a unitary p-by-p matrix. The Riemannian metric is the real part of the
 * Hermitian inner product, hence the real dimension 2k(np - p^2).
 */
class ComplexGrassmann : public GrassmannBase<Complex> {
 public:
  using GrassmannBase<Complex>::randomPoint;
  using GrassmannBase<Complex>::randomTangentVector;

  /**
   * @brief Constructor. Throws std::invalid_argument unless n >= p >= 1 and k >= 1.
   * @param n ambient dimension
   * @param p subspace dimension
   * @param k number of factors
   * @param params
   */
  ComplexGrassmann(unsigned int n, unsigned int p, unsigned int k = 1,
                   const GrassmannParameters &params = GrassmannParameters());

  double distance(const ComplexStack &a, const ComplexStack &b) const override;

  /**
   * @brief Re(trace(U^H V)) summed over all blocks
   */
  double innerProduct(const ComplexStack &x, const ComplexStack &u, const ComplexStack &v) const override;

  /**
   * @brief V - X (X^H V)
   */
  ComplexStack projection(const ComplexStack &x, const ComplexStack &v) const override;

  ComplexStack retraction(const ComplexStack &x, const ComplexStack &v) const override;

  ComplexStack exponentialMap(const ComplexStack &x, const ComplexStack &v) const override;

  /**
   * @brief Throws std::runtime_error if Y^H X is numerically singular for some block
   */
  ComplexStack logarithmMap(const ComplexStack &a, const ComplexStack &b) const override;

  ComplexStack randomPoint(RandomEngine &rng) const override;

  ComplexStack randomTangentVector(const ComplexStack &x, RandomEngine &rng) const override;

  /**
   * @brief Proj(ehess) - V (X^H egrad)
   */
  ComplexStack ambientToRiemannianHessian(const ComplexStack &x,
                                          const ComplexStack &egrad,
                                          const ComplexStack &ehess,
                                          const ComplexStack &v) const override;
};

}  // namespace RGEO

#endif
