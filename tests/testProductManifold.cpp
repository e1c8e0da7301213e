#include <RGEO/manifold/ProductManifold.h>
#include <RGEO/manifold/MixedManifold.h>
#include <RGEO/manifold/Euclidean.h>
#include <RGEO/manifold/Grassmann.h>
#include <RGEO/manifold/ComplexGrassmann.h>
#include <RGEO/manifold/Sphere.h>
#include <RGEO/RGEO_utils.h>
#include <boost/math/constants/constants.hpp>
#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "gtest/gtest.h"

using namespace RGEO;

namespace {

RealProductManifold euclideanTimesSphere() {
  return RealProductManifold({std::make_shared<Euclidean>(100, 50), std::make_shared<Sphere>(50)});
}

}  // namespace

TEST(testRGEO, testProductConstruction) {
  RealProductManifold M = euclideanTimesSphere();
  ASSERT_EQ(M.numFactors(), 2);
  ASSERT_EQ(M.dimension(), 5049);
  ASSERT_EQ(M.name(),
            "Product manifold: [Euclidean manifold of 100x50 matrices] x "
            "[Sphere manifold of 50-dimensional vectors]");
  const double pi = boost::math::constants::pi<double>();
  ASSERT_NEAR(M.typicalDistance(), std::sqrt(5000 + pi * pi), 1e-10);

  std::vector<RealProductManifold::FactorPtr> none;
  ASSERT_THROW(RealProductManifold{none}, std::invalid_argument);
  std::vector<RealProductManifold::FactorPtr> withNull{std::make_shared<Sphere>(3), nullptr};
  ASSERT_THROW(RealProductManifold{withNull}, std::invalid_argument);
}

TEST(testRGEO, testProductDistance) {
  RealProductManifold M = euclideanTimesSphere();
  RandomEngine rng(1);
  ProductElement<RealStack> X = M.randomPoint(rng);
  ProductElement<RealStack> Y = M.randomPoint(rng);
  ASSERT_EQ(X.size(), 2);
  const double d0 = M.factor(0).distance(X[0], Y[0]);
  const double d1 = M.factor(1).distance(X[1], Y[1]);
  ASSERT_NEAR(M.distance(X, Y), std::sqrt(d0 * d0 + d1 * d1), 1e-10);
  ASSERT_NEAR(M.distance(X, Y), M.distance(Y, X), 1e-10);
  ASSERT_NEAR(M.distance(X, X), 0, 1e-12);
}

TEST(testRGEO, testProductInnerProduct) {
  RealProductManifold M = euclideanTimesSphere();
  RandomEngine rng(2);
  ProductElement<RealStack> X = M.randomPoint(rng);
  ProductElement<RealStack> U = M.randomTangentVector(X, rng);
  ProductElement<RealStack> V = M.randomTangentVector(X, rng);
  const double expected = M.factor(0).innerProduct(X[0], U[0], V[0])
      + M.factor(1).innerProduct(X[1], U[1], V[1]);
  ASSERT_NEAR(M.innerProduct(X, U, V), expected, 1e-10);
  ASSERT_NEAR(M.norm(X, U), std::sqrt(M.innerProduct(X, U, U)), 1e-12);
  ASSERT_NEAR(M.norm(X, M.zeroTangentVector(X)), 0, 1e-15);
}

TEST(testRGEO, testProductExpLog) {
  RealProductManifold M = euclideanTimesSphere();
  RandomEngine rng(3);
  ProductElement<RealStack> X = M.randomPoint(rng);
  ProductElement<RealStack> U = M.randomTangentVector(X, rng);
  ProductElement<RealStack> Y = M.exponentialMap(X, U);
  ProductElement<RealStack> W = M.logarithmMap(X, Y);
  ASSERT_LE((W[0] - U[0]).norm(), 1e-8);
  ASSERT_LE((W[1] - U[1]).norm(), 1e-8);

  ProductElement<RealStack> Z = M.randomPoint(rng);
  ProductElement<RealStack> Zhat = M.exponentialMap(X, M.logarithmMap(X, Z));
  ASSERT_NEAR(M.distance(Z, Zhat), 0, 1e-6);
}

TEST(testRGEO, testProductPairMean) {
  RealProductManifold M = euclideanTimesSphere();
  RandomEngine rng(4);
  ProductElement<RealStack> X = M.randomPoint(rng);
  ProductElement<RealStack> Y = M.randomPoint(rng);
  ProductElement<RealStack> Z = M.pairMean(X, Y);
  ProductElement<RealStack> Zexp = M.exponentialMap(X, 0.5 * M.logarithmMap(X, Y));
  ASSERT_NEAR(M.distance(Z, Zexp), 0, 1e-6);
  ASSERT_NEAR(M.distance(X, Z), M.distance(Z, Y), 1e-6);
}

TEST(testRGEO, testProductTangentVectorMultiplication) {
  std::vector<RealProductManifold::FactorPtr> factors{std::make_shared<Euclidean>(12),
                                                      std::make_shared<Grassmann>(12, 3)};
  RealProductManifold M(factors);
  ASSERT_EQ(M.dimension(), 12 + 3 * 9);
  RandomEngine rng(5);
  ProductElement<RealStack> X = M.randomPoint(rng);
  ProductElement<RealStack> U = M.randomTangentVector(X, rng);
  ProductElement<RealStack> V = 2.0 * U;
  ASSERT_NEAR(M.norm(X, V), 2 * M.norm(X, U), 1e-10);
  ProductElement<RealStack> G = M.projection(X, V + U);
  ASSERT_LE((G[1] - 3.0 * U[1]).norm(), 1e-10);
  ASSERT_LE((G[0] - 3.0 * U[0]).norm(), 1e-12);
}

TEST(testRGEO, testProductElementwiseOperations) {
  auto E = std::make_shared<Euclidean>(6);
  auto G = std::make_shared<Grassmann>(6, 2, 2);
  RealProductManifold M({E, G});
  RandomEngine rng(6);
  ProductElement<RealStack> X = M.randomPoint(rng);
  ProductElement<RealStack> Y = M.randomPoint(rng);
  ProductElement<RealStack> A{RealStack(Matrix::Random(6, 1)), RealStack(Matrix::Random(6, 4), 2)};
  ProductElement<RealStack> P = M.projection(X, A);
  ASSERT_LE((P[1] - G->projection(X[1], A[1])).norm(), 1e-12);
  ProductElement<RealStack> R = M.retraction(X, P);
  ASSERT_NEAR(G->distance(R[1], G->retraction(X[1], P[1])), 0, 1e-6);
  ProductElement<RealStack> T = M.parallelTransport(X, Y, P);
  ASSERT_LE((T[1] - G->projection(Y[1], P[1])).norm(), 1e-12);
  ProductElement<RealStack> egrad = M.ambientToRiemannianGradient(X, A);
  ASSERT_LE((egrad[0] - A[0]).norm(), 1e-12);
  ProductElement<RealStack> H = M.ambientToRiemannianHessian(X, A, A, P);
  ASSERT_LE((H[1] - G->ambientToRiemannianHessian(X[1], A[1], A[1], P[1])).norm(), 1e-12);

  ProductElement<RealStack> wrongArity{X[0]};
  ASSERT_THROW(M.distance(wrongArity, Y), std::invalid_argument);
  ASSERT_THROW(M.projection(X, wrongArity), std::invalid_argument);
}

TEST(testRGEO, testNestedComplexProduct) {
  auto inner = std::make_shared<ComplexProductManifold>(
      std::vector<ComplexProductManifold::FactorPtr>{std::make_shared<ComplexGrassmann>(5, 2),
                                                     std::make_shared<ComplexGrassmann>(4, 1)});
  ASSERT_EQ(inner->dimension(), 2 * 2 * 3 + 2 * 1 * 3);
  ProductManifold<ProductElement<ComplexStack>> outer({inner, inner});
  ASSERT_EQ(outer.dimension(), 2 * inner->dimension());
  ASSERT_NEAR(outer.typicalDistance(), std::sqrt(2.0) * inner->typicalDistance(), 1e-12);
  RandomEngine rng(7);
  auto X = outer.randomPoint(rng);
  auto U = outer.randomTangentVector(X, rng);
  auto Y = outer.exponentialMap(X, 0.3 * U);
  ASSERT_NEAR(outer.distance(X, Y), 0.3 * outer.norm(X, U), 1e-8);
}

TEST(testRGEO, testMixedStackArithmetic) {
  RandomEngine rng(9);
  MixedStack R(RealStack(randomNormalMatrix<double>(4, 2, rng)));
  MixedStack C(ComplexStack(randomNormalMatrix<Complex>(4, 2, rng)));
  ASSERT_FALSE(R.isComplex());
  ASSERT_TRUE(C.isComplex());
  ASSERT_EQ(C.kind(), "complex");
  ASSERT_NEAR((2.0 * C).norm(), 2 * C.norm(), 1e-12);
  ASSERT_LE((C - C).norm(), 1e-15);
  ASSERT_LE(((R + R) / 2.0 - R).norm(), 1e-15);
  ASSERT_LE((-R + R).norm(), 1e-15);
  ASSERT_NEAR(C.get<Complex>().norm(), C.norm(), 1e-15);
  ASSERT_THROW(R + C, std::invalid_argument);
  ASSERT_THROW(C -= R, std::invalid_argument);
  ASSERT_THROW(R.get<Complex>(), std::invalid_argument);
  ASSERT_THROW(C.get<double>(), std::invalid_argument);
}

TEST(testRGEO, testMixedRealComplexProduct) {
  auto G = std::make_shared<Grassmann>(5, 2);
  auto C = std::make_shared<ComplexGrassmann>(5, 2);
  MixedProductManifold M({makeMixedFactor(G), makeMixedFactor(C)});
  ASSERT_EQ(M.dimension(), 2 * 3 + 2 * 2 * 3);
  ASSERT_EQ(M.name(),
            "Product manifold: [Grassmann manifold Gr(5,2)] x [Complex Grassmann manifold Gr(5,2)]");

  RandomEngine rng(10);
  ProductElement<MixedStack> X = M.randomPoint(rng);
  ASSERT_FALSE(X[0].isComplex());
  ASSERT_TRUE(X[1].isComplex());
  ProductElement<MixedStack> U = 0.5 * M.randomTangentVector(X, rng);
  ProductElement<MixedStack> Y = M.exponentialMap(X, U);
  ASSERT_NEAR(M.distance(X, X), 0, 1e-12);
  ASSERT_NEAR(M.distance(X, Y), M.norm(X, U), 1e-8);
  const double d0 = G->distance(X[0].get<double>(), Y[0].get<double>());
  const double d1 = C->distance(X[1].get<Complex>(), Y[1].get<Complex>());
  ASSERT_NEAR(M.distance(X, Y), std::sqrt(d0 * d0 + d1 * d1), 1e-12);

  ProductElement<MixedStack> W = M.logarithmMap(X, Y);
  ASSERT_LE((W[0] - U[0]).norm(), 1e-8);
  ASSERT_LE((W[1] - U[1]).norm(), 1e-8);
  ProductElement<MixedStack> Z = M.pairMean(X, Y);
  ASSERT_NEAR(M.distance(X, Z), M.distance(Z, Y), 1e-8);

  // Components must match the kind of their factor
  ProductElement<MixedStack> swapped{X[1], X[0]};
  ASSERT_THROW(M.distance(swapped, Y), std::invalid_argument);
  std::shared_ptr<const Manifold<RealStack>> none;
  ASSERT_THROW(makeMixedFactor(none), std::invalid_argument);
}
