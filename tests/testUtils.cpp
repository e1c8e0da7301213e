#include <RGEO/RGEO_types.h>
#include <RGEO/RGEO_utils.h>
#include <iostream>
#include <random>

#include "gtest/gtest.h"

using namespace RGEO;

TEST(testRGEO, testStiefelGeneration) {
  Matrix Y = fixedStiefelVariable(3, 5);
  ASSERT_EQ(Y.rows(), 5);
  ASSERT_EQ(Y.cols(), 3);
  ASSERT_LE(orthonormalityError<double>(Y), 1e-10);
}

TEST(testRGEO, testStiefelRepeat) {
  Matrix Y = fixedStiefelVariable(3, 5);
  for (size_t i = 0; i < 10; ++i) {
    Matrix Y_ = fixedStiefelVariable(3, 5);
    ASSERT_LE((Y_ - Y).norm(), 1e-12);
  }
}

TEST(testRGEO, testStiefelProjection) {
  size_t d = 3;
  size_t r = 5;
  for (size_t j = 0; j < 50; ++j) {
    Matrix M = Matrix::Random(r, d);
    Matrix Y = projectToStiefelManifold<double>(M);
    ASSERT_LE(orthonormalityError<double>(Y), 1e-10);
    // The polar factor of an orthonormal frame is the frame itself
    ASSERT_LE((projectToStiefelManifold<double>(Y) - Y).norm(), 1e-10);
  }
}

TEST(testRGEO, testOrthonormalizeSpansSameSubspace) {
  RandomEngine rng(3);
  for (size_t j = 0; j < 20; ++j) {
    ComplexMatrix M = randomNormalMatrix<Complex>(6, 2, rng);
    ComplexMatrix Q = orthonormalize<Complex>(M);
    ASSERT_LE(orthonormalityError<Complex>(Q), 1e-10);
    // M lies in the column space of Q
    ASSERT_LE((M - Q * (Q.adjoint() * M)).norm(), 1e-10);
  }
}

TEST(testRGEO, testRandomNormalMatrixSeeded) {
  RandomEngine rng1(42);
  RandomEngine rng2(42);
  Matrix A = randomNormalMatrix<double>(4, 3, rng1);
  Matrix B = randomNormalMatrix<double>(4, 3, rng2);
  ASSERT_LE((A - B).norm(), 1e-15);

  ComplexMatrix C = randomNormalMatrix<Complex>(50, 50, rng1);
  // Independent real and imaginary parts
  ASSERT_GT(C.imag().norm(), 1.0);
  ASSERT_GT(C.real().norm(), 1.0);

  seedDefaultRandomEngine(5);
  Matrix D = randomNormalMatrix<double>(2, 2, defaultRandomEngine());
  seedDefaultRandomEngine(5);
  Matrix E = randomNormalMatrix<double>(2, 2, defaultRandomEngine());
  ASSERT_LE((D - E).norm(), 1e-15);
}
