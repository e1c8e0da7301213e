/* ----------------------------------------------------------------------------
 * Copyright 2020, Massachusetts Institute of Technology, * Cambridge, MA 02139
 * All Rights Reserved
 * Authors: Yulun Tian, et al. (see README for the full author list)
 * See LICENSE for the license information
 * -------------------------------------------------------------------------- */

#ifndef GRASSMANNBASE_H
#define GRASSMANNBASE_H

#include <RGEO/RGEO_types.h>
#include <RGEO/manifold/Manifold.h>
#include <RGEO/manifold/MatrixStack.h>

/*Define the namespace*/
namespace RGEO {

/**
 * @brief Functionality shared by the real and complex Grassmann manifolds.
 * A point is a stack of k n-by-p matrices with orthonormal columns; each block represents the
 * p-dimensional subspace spanned by its columns.
 */
template <typename Scalar>
class GrassmannBase : public Manifold<MatrixStack<Scalar>> {
 public:
  typedef MatrixStack<Scalar> Stack;
  typedef typename Stack::BlockType BlockType;

  /**
   * @brief Ambient dimension
   */
  unsigned int n() const { return n_; }
  /**
   * @brief Dimension of the subspaces
   */
  unsigned int p() const { return p_; }
  /**
   * @brief Number of Grassmann factors
   */
  unsigned int k() const { return k_; }
  /**
   * @brief Parameters this manifold was constructed with
   */
  const GrassmannParameters &parameters() const { return params_; }

  double typicalDistance() const override;

  double norm(const Stack &x, const Stack &v) const override;

  Stack zeroTangentVector(const Stack &x) const override;

 protected:
  /**
   * @brief Constructor
   * @param n ambient dimension
   * @param p subspace dimension
   * @param k number of factors
   * @param realDimensionFactor 1 for real, 2 for complex subspaces
   * @param label name prefix used when k = 1, e.g. "Grassmann manifold"
   * @param productLabel name prefix used when k > 1, e.g. "Product Grassmann manifold"
   * @param params
   */
  GrassmannBase(unsigned int n, unsigned int p, unsigned int k,
                unsigned int realDimensionFactor,
                const std::string &label,
                const std::string &productLabel,
                const GrassmannParameters &params);

  /**
   * @brief Throw std::invalid_argument unless S is a stack of k n-by-p matrices
   */
  void checkShape(const Stack &S, const char *what) const;

  /**
   * @brief Stack of k n-by-p matrices with i.i.d. standard normal entries
   */
  Stack randomAmbientVector(RandomEngine &rng) const;

  /**
   * @brief Solve (Y^H X) B^H = Y^H - (Y^H X) X^H for B^H, the linear system of the logarithm map
   * Throws std::runtime_error if Y^H X is numerically singular.
   * @param X block of the base point
   * @param Y block of the target point
   * @param index block index, used in error messages
   * @return B^H (p-by-n)
   */
  BlockType solveLogarithmSystem(const BlockType &X, const BlockType &Y, unsigned int index) const;

  /**
   * @brief Principal angles between the column spaces of two orthonormal n-by-p blocks,
   * computed as atan2(sin, cos) so that angles near zero keep full relative accuracy
   * @param X
   * @param Y
   * @return vector of p angles in [0, pi/2]
   */
  Vector principalAngles(const BlockType &X, const BlockType &Y) const;

  unsigned int n_, p_, k_;
  GrassmannParameters params_;
};

}  // namespace RGEO

#endif
