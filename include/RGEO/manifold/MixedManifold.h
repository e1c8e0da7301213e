/* ----------------------------------------------------------------------------
 * Copyright 2020, Massachusetts Institute of Technology, * Cambridge, MA 02139
 * All Rights Reserved
 * Authors: Yulun Tian, et al. (see README for the full author list)
 * See LICENSE for the license information
 * -------------------------------------------------------------------------- */

#ifndef MIXEDMANIFOLD_H
#define MIXEDMANIFOLD_H

#include <RGEO/RGEO_types.h>
#include <RGEO/manifold/Manifold.h>
#include <RGEO/manifold/MatrixStack.h>
#include <RGEO/manifold/MixedStack.h>
#include <RGEO/manifold/ProductManifold.h>
#include <memory>
#include <stdexcept>
#include <utility>

/*Define the namespace*/
namespace RGEO {

/**
 * @brief Presents a real or complex matrix manifold as a manifold over MixedStack,
 * so that it can share a product with manifolds of the other kind.
 * Name, dimension and every operation are those of the wrapped manifold. Passing an
 * element of the wrong kind throws std::invalid_argument.
 * @tparam Scalar double or Complex
 */
template <typename Scalar>
class MixedManifold : public Manifold<MixedStack> {
 public:
  typedef MatrixStack<Scalar> Stack;
  typedef Manifold<Stack> Wrapped;
  typedef std::shared_ptr<const Wrapped> WrappedPtr;

  using Manifold<MixedStack>::randomPoint;
  using Manifold<MixedStack>::randomTangentVector;

  /**
   * @brief Constructor. Throws std::invalid_argument if the manifold is null.
   */
  explicit MixedManifold(WrappedPtr manifold)
      : Manifold<MixedStack>(checked(manifold).name(), checked(manifold).dimension()),
        manifold_(std::move(manifold)) {}

  const Wrapped &wrapped() const { return *manifold_; }

  double typicalDistance() const override { return manifold_->typicalDistance(); }

  double innerProduct(const MixedStack &x, const MixedStack &u, const MixedStack &v) const override {
    return manifold_->innerProduct(x.get<Scalar>(), u.get<Scalar>(), v.get<Scalar>());
  }

  double norm(const MixedStack &x, const MixedStack &v) const override {
    return manifold_->norm(x.get<Scalar>(), v.get<Scalar>());
  }

  double distance(const MixedStack &a, const MixedStack &b) const override {
    return manifold_->distance(a.get<Scalar>(), b.get<Scalar>());
  }

  MixedStack projection(const MixedStack &x, const MixedStack &v) const override {
    return manifold_->projection(x.get<Scalar>(), v.get<Scalar>());
  }

  MixedStack retraction(const MixedStack &x, const MixedStack &v) const override {
    return manifold_->retraction(x.get<Scalar>(), v.get<Scalar>());
  }

  MixedStack exponentialMap(const MixedStack &x, const MixedStack &v) const override {
    return manifold_->exponentialMap(x.get<Scalar>(), v.get<Scalar>());
  }

  MixedStack logarithmMap(const MixedStack &a, const MixedStack &b) const override {
    return manifold_->logarithmMap(a.get<Scalar>(), b.get<Scalar>());
  }

  MixedStack parallelTransport(const MixedStack &a, const MixedStack &b, const MixedStack &v) const override {
    return manifold_->parallelTransport(a.get<Scalar>(), b.get<Scalar>(), v.get<Scalar>());
  }

  MixedStack randomPoint(RandomEngine &rng) const override { return manifold_->randomPoint(rng); }

  MixedStack randomTangentVector(const MixedStack &x, RandomEngine &rng) const override {
    return manifold_->randomTangentVector(x.get<Scalar>(), rng);
  }

  MixedStack zeroTangentVector(const MixedStack &x) const override {
    return manifold_->zeroTangentVector(x.get<Scalar>());
  }

  MixedStack ambientToRiemannianGradient(const MixedStack &x, const MixedStack &egrad) const override {
    return manifold_->ambientToRiemannianGradient(x.get<Scalar>(), egrad.get<Scalar>());
  }

  MixedStack ambientToRiemannianHessian(const MixedStack &x,
                                        const MixedStack &egrad,
                                        const MixedStack &ehess,
                                        const MixedStack &v) const override {
    return manifold_->ambientToRiemannianHessian(
        x.get<Scalar>(), egrad.get<Scalar>(), ehess.get<Scalar>(), v.get<Scalar>());
  }

  MixedStack pairMean(const MixedStack &a, const MixedStack &b) const override {
    return manifold_->pairMean(a.get<Scalar>(), b.get<Scalar>());
  }

 private:
  static const Wrapped &checked(const WrappedPtr &manifold) {
    if (!manifold) {
      throw std::invalid_argument("Cannot wrap a null manifold");
    }
    return *manifold;
  }

  WrappedPtr manifold_;
};

/**
 * @brief Product of manifolds that may mix real and complex factors
 */
typedef ProductManifold<MixedStack> MixedProductManifold;

/**
 * @brief Wrap a real or complex manifold as a factor of a MixedProductManifold
 */
MixedProductManifold::FactorPtr makeMixedFactor(std::shared_ptr<const Manifold<RealStack>> manifold);
MixedProductManifold::FactorPtr makeMixedFactor(std::shared_ptr<const Manifold<ComplexStack>> manifold);

extern template class MixedManifold<double>;
extern template class MixedManifold<Complex>;
extern template class ProductManifold<MixedStack>;

}  // namespace RGEO

#endif
