#include <RGEO/manifold/Euclidean.h>
#include <RGEO/manifold/Sphere.h>
#include <RGEO/RGEO_utils.h>
#include <boost/math/constants/constants.hpp>
#include <cmath>
#include <iostream>
#include <stdexcept>

#include "gtest/gtest.h"

using namespace RGEO;

TEST(testRGEO, testEuclideanConstruction) {
  ASSERT_THROW(Euclidean(0), std::invalid_argument);
  ASSERT_THROW(Euclidean(3, 0), std::invalid_argument);
  Euclidean E(100, 50);
  ASSERT_EQ(E.dimension(), 5000);
  ASSERT_EQ(E.name(), "Euclidean manifold of 100x50 matrices");
  ASSERT_NEAR(E.typicalDistance(), std::sqrt(5000.0), 1e-12);
}

TEST(testRGEO, testEuclideanGeometry) {
  Euclidean E(4, 3);
  RandomEngine rng(1);
  RealStack a = E.randomPoint(rng);
  RealStack b = E.randomPoint(rng);
  ASSERT_EQ(a.rows(), 4);
  ASSERT_EQ(a.cols(), 3);
  ASSERT_NEAR(E.distance(a, b), (a - b).norm(), 1e-12);
  ASSERT_LE((E.logarithmMap(a, b) - (b - a)).norm(), 1e-12);
  ASSERT_LE((E.exponentialMap(a, E.logarithmMap(a, b)) - b).norm(), 1e-12);
  ASSERT_LE((E.retraction(a, b) - (a + b)).norm(), 1e-12);
  ASSERT_LE((E.pairMean(a, b) - 0.5 * (a + b)).norm(), 1e-12);
  ASSERT_LE((E.projection(a, b) - b).norm(), 1e-12);
  ASSERT_LE((E.parallelTransport(a, b, a) - a).norm(), 1e-12);
  RealStack u = E.randomTangentVector(a, rng);
  ASSERT_NEAR(E.norm(a, u), 1, 1e-12);
  ASSERT_NEAR(E.innerProduct(a, u, b), (u.getData().transpose() * b.getData()).trace(), 1e-12);
  ASSERT_LE((E.ambientToRiemannianHessian(a, b, u, a) - u).norm(), 1e-12);
  ASSERT_LE(E.zeroTangentVector(a).norm(), 1e-15);
  ASSERT_THROW(E.distance(a, RealStack(Matrix::Random(3, 4))), std::invalid_argument);
}

TEST(testRGEO, testSphereConstruction) {
  ASSERT_THROW(Sphere(1), std::invalid_argument);
  Sphere S(50);
  ASSERT_EQ(S.dimension(), 49);
  ASSERT_EQ(S.name(), "Sphere manifold of 50-dimensional vectors");
  ASSERT_NEAR(S.typicalDistance(), boost::math::constants::pi<double>(), 1e-12);
}

TEST(testRGEO, testSphereGeometry) {
  Sphere S(5);
  RandomEngine rng(3);
  for (int trial = 0; trial < 20; ++trial) {
    RealStack x = S.randomPoint(rng);
    RealStack y = S.randomPoint(rng);
    ASSERT_NEAR(x.norm(), 1, 1e-12);
    ASSERT_NEAR(S.distance(x, x), 0, 1e-12);
    ASSERT_NEAR(S.distance(x, y), S.distance(y, x), 1e-12);

    RealStack u = S.randomTangentVector(x, rng);
    ASSERT_NEAR(S.norm(x, u), 1, 1e-12);
    ASSERT_NEAR(S.innerProduct(x, x, u), 0, 1e-12);

    // Geodesics have constant speed
    RealStack v = 0.7 * u;
    RealStack z = S.exponentialMap(x, v);
    ASSERT_NEAR(z.norm(), 1, 1e-12);
    ASSERT_NEAR(S.distance(x, z), 0.7, 1e-10);
    ASSERT_LE((S.logarithmMap(x, z) - v).norm(), 1e-8);

    RealStack w = S.logarithmMap(x, y);
    ASSERT_NEAR(S.norm(x, w), S.distance(x, y), 1e-8);
    ASSERT_LE((S.exponentialMap(x, w) - y).norm(), 1e-8);

    RealStack m = S.pairMean(x, y);
    ASSERT_NEAR(S.distance(x, m), S.distance(m, y), 1e-10);
    ASSERT_NEAR(S.retraction(x, v).norm(), 1, 1e-12);
  }
  // Zero tangent vector maps to the base point
  RealStack x = S.randomPoint();
  ASSERT_LE((S.exponentialMap(x, S.zeroTangentVector(x)) - x).norm(), 1e-15);
  ASSERT_LE(S.logarithmMap(x, x).norm(), 1e-8);
}

TEST(testRGEO, testSpherePairMeanAntipodal) {
  Sphere S(3);
  RealStack x = S.randomPoint();
  ASSERT_THROW(S.pairMean(x, -x), std::runtime_error);
  // Nearly antipodal points still have a well defined midpoint
  Matrix a(3, 1), b(3, 1);
  a << 1, 0, 0;
  b << -std::cos(0.01), std::sin(0.01), 0;
  RealStack m = S.pairMean(RealStack(a), RealStack(b));
  ASSERT_NEAR(m.norm(), 1, 1e-12);
  ASSERT_NEAR(S.distance(RealStack(a), m), S.distance(m, RealStack(b)), 1e-10);
}

TEST(testRGEO, testSphereHessian) {
  // f(x) = x^T A x with egrad = 2 A x and ehess[u] = 2 A u
  unsigned int n = 4;
  Sphere S(n);
  RandomEngine rng(5);
  Matrix B = randomNormalMatrix<double>(n, n, rng);
  Matrix A = B + B.transpose();
  RealStack x = S.randomPoint(rng);
  RealStack u = S.randomTangentVector(x, rng);
  RealStack egrad(Matrix(2 * A * x.getData()));
  RealStack ehess(Matrix(2 * A * u.getData()));
  RealStack H = S.ambientToRiemannianHessian(x, egrad, ehess, u);
  const double xAx = (x.getData().transpose() * A * x.getData())(0, 0);
  Matrix expected = 2 * A * u.getData() - 2 * x.getData() * (x.getData().transpose() * A * u.getData())
      - 2 * xAx * u.getData();
  ASSERT_LE((H.getData() - expected).norm(), 1e-10);
}
