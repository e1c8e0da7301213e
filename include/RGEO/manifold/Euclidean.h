/* ----------------------------------------------------------------------------
 * Copyright 2020, Massachusetts Institute of Technology, * Cambridge, MA 02139
 * All Rights Reserved
 * Authors: Yulun Tian, et al. (see README for the full author list)
 * See LICENSE for the license information
 * -------------------------------------------------------------------------- */

#ifndef EUCLIDEAN_H
#define EUCLIDEAN_H

#include <RGEO/RGEO_types.h>
#include <RGEO/manifold/Manifold.h>
#include <RGEO/manifold/MatrixStack.h>

/*Define the namespace*/
namespace RGEO {

/**
 * @brief The Euclidean space of m-by-n real matrices with the Frobenius inner product
 */
class Euclidean : public Manifold<RealStack> {
 public:
  using Manifold<RealStack>::randomPoint;
  using Manifold<RealStack>::randomTangentVector;

  /**
   * @brief Constructor. Throws std::invalid_argument if m or n is zero.
   * @param m
   * @param n
   */
  explicit Euclidean(unsigned int m, unsigned int n = 1);

  unsigned int m() const { return m_; }
  unsigned int n() const { return n_; }

  double typicalDistance() const override;
  double innerProduct(const RealStack &x, const RealStack &u, const RealStack &v) const override;
  double norm(const RealStack &x, const RealStack &v) const override;
  double distance(const RealStack &a, const RealStack &b) const override;
  RealStack projection(const RealStack &x, const RealStack &v) const override;
  RealStack retraction(const RealStack &x, const RealStack &v) const override;
  RealStack exponentialMap(const RealStack &x, const RealStack &v) const override;
  RealStack logarithmMap(const RealStack &a, const RealStack &b) const override;
  RealStack parallelTransport(const RealStack &a, const RealStack &b, const RealStack &v) const override;
  RealStack randomPoint(RandomEngine &rng) const override;
  RealStack randomTangentVector(const RealStack &x, RandomEngine &rng) const override;
  RealStack zeroTangentVector(const RealStack &x) const override;
  RealStack ambientToRiemannianHessian(const RealStack &x,
                                       const RealStack &egrad,
                                       const RealStack &ehess,
                                       const RealStack &v) const override;
  RealStack pairMean(const RealStack &a, const RealStack &b) const override;

 private:
  void checkShape(const RealStack &S, const char *what) const;

  unsigned int m_, n_;
};

}  // namespace RGEO

#endif
