/* ----------------------------------------------------------------------------
 * Copyright 2020, Massachusetts Institute of Technology, * Cambridge, MA 02139
 * All Rights Reserved
 * Authors: Yulun Tian, et al. (see README for the full author list)
 * See LICENSE for the license information
 * -------------------------------------------------------------------------- */

#ifndef SPHERE_H
#define SPHERE_H

#include <RGEO/RGEO_types.h>
#include <RGEO/manifold/Manifold.h>
#include <RGEO/manifold/MatrixStack.h>

/*Define the namespace*/
namespace RGEO {

/**
 * @brief The unit sphere S^{n-1} in R^n, with the metric inherited from R^n.
 * Points and tangent vectors are n-by-1 stacks.
 */
class Sphere : public Manifold<RealStack> {
 public:
  using Manifold<RealStack>::randomPoint;
  using Manifold<RealStack>::randomTangentVector;

  /**
   * @brief Constructor. Throws std::invalid_argument if n < 2.
   * @param n dimension of the ambient space
   */
  explicit Sphere(unsigned int n);

  unsigned int n() const { return n_; }

  double typicalDistance() const override;
  double innerProduct(const RealStack &x, const RealStack &u, const RealStack &v) const override;
  double norm(const RealStack &x, const RealStack &v) const override;
  /**
   * @brief Great circle distance, the angle between a and b
   */
  double distance(const RealStack &a, const RealStack &b) const override;
  /**
   * @brief V - X <X, V>
   */
  RealStack projection(const RealStack &x, const RealStack &v) const override;
  /**
   * @brief (X + V) / ||X + V||
   */
  RealStack retraction(const RealStack &x, const RealStack &v) const override;
  RealStack exponentialMap(const RealStack &x, const RealStack &v) const override;
  RealStack logarithmMap(const RealStack &a, const RealStack &b) const override;
  RealStack randomPoint(RandomEngine &rng) const override;
  RealStack randomTangentVector(const RealStack &x, RandomEngine &rng) const override;
  RealStack zeroTangentVector(const RealStack &x) const override;
  /**
   * @brief Proj(ehess) - <X, egrad> V
   */
  RealStack ambientToRiemannianHessian(const RealStack &x,
                                       const RealStack &egrad,
                                       const RealStack &ehess,
                                       const RealStack &v) const override;
  /**
   * @brief (A + B) / ||A + B||, the midpoint of the shorter great circle arc.
   * Throws std::runtime_error for antipodal points, where the midpoint is not unique.
   */
  RealStack pairMean(const RealStack &a, const RealStack &b) const override;

 private:
  void checkShape(const RealStack &S, const char *what) const;

  unsigned int n_;
};

}  // namespace RGEO

#endif
