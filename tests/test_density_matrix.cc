/**
 * @file test_density_matrix.cc
 * @brief Repair steps and physical validation of small density matrices
 */

#include <gtest/gtest.h>
#include <math.h>
#include <vector>
#include <gsl/gsl_complex_math.h>

#include "include/density_matrix.h"

class DensityMatrixTest : public ::testing::Test {
 protected:
  // (|g1> + |g2>)/sqrt(2)
  Density_Matrix superposition() const {
    Density_Matrix rho(3);
    rho.set(0, 0, gsl_complex_rect(0.5, 0.0));
    rho.set(1, 1, gsl_complex_rect(0.5, 0.0));
    rho.set(0, 1, gsl_complex_rect(0.5, 0.0));
    rho.set(1, 0, gsl_complex_rect(0.5, 0.0));
    return rho;
  }
};

// ============================================================================
// Validation
// ============================================================================

TEST_F(DensityMatrixTest, PureStateIsValid) {
  dm_validation report = superposition().validate();
  EXPECT_TRUE(report.hermitian);
  EXPECT_TRUE(report.trace_one);
  EXPECT_TRUE(report.positive_semidefinite);
  EXPECT_TRUE(report.valid);
}

TEST_F(DensityMatrixTest, FlagsEachFailure) {
  Density_Matrix rho = superposition();
  rho.set(0, 1, gsl_complex_rect(0.5, 0.1));
  dm_validation report = rho.validate();
  EXPECT_FALSE(report.hermitian);
  EXPECT_FALSE(report.valid);

  Density_Matrix doubled(3);
  doubled.set(0, 0, gsl_complex_rect(2.0, 0.0));
  report = doubled.validate();
  EXPECT_TRUE(report.hermitian);
  EXPECT_FALSE(report.trace_one);
  EXPECT_TRUE(report.positive_semidefinite);

  Density_Matrix negative(3);
  negative.set(0, 0, gsl_complex_rect(1.2, 0.0));
  negative.set(1, 1, gsl_complex_rect(-0.2, 0.0));
  report = negative.validate();
  EXPECT_TRUE(report.trace_one);
  EXPECT_FALSE(report.positive_semidefinite);
  EXPECT_FALSE(report.valid);
}

TEST_F(DensityMatrixTest, EigenvaluesAscending) {
  Density_Matrix rho(3);
  rho.set(0, 0, gsl_complex_rect(0.6, 0.0));
  rho.set(1, 1, gsl_complex_rect(0.1, 0.0));
  rho.set(2, 2, gsl_complex_rect(0.3, 0.0));
  std::vector<double> values = rho.eigenvalues();
  ASSERT_EQ(values.size(), 3u);
  EXPECT_NEAR(values[0], 0.1, 1e-12);
  EXPECT_NEAR(values[1], 0.3, 1e-12);
  EXPECT_NEAR(values[2], 0.6, 1e-12);
}

// ============================================================================
// Repair
// ============================================================================

TEST_F(DensityMatrixTest, HermitizeAveragesOffDiagonal) {
  Density_Matrix rho(3);
  rho.set(0, 1, gsl_complex_rect(1.0, 1.0));
  Density_Matrix h = rho.hermitize();
  EXPECT_NEAR(GSL_REAL(h.get(0, 1)), 0.5, 1e-15);
  EXPECT_NEAR(GSL_IMAG(h.get(0, 1)), 0.5, 1e-15);
  EXPECT_NEAR(GSL_REAL(h.get(1, 0)), 0.5, 1e-15);
  EXPECT_NEAR(GSL_IMAG(h.get(1, 0)), -0.5, 1e-15);
  // Original untouched
  EXPECT_EQ(GSL_REAL(rho.get(1, 0)), 0.0);
}

TEST_F(DensityMatrixTest, ZeroTraceBecomesFullyMixed) {
  Density_Matrix zero(3);
  Density_Matrix mixed = zero.renormalize();
  for (int i = 0; i < 3; i++) {
    EXPECT_NEAR(mixed.population(i), 1.0/3.0, 1e-15) << "level " << i;
  }
  EXPECT_TRUE(mixed.validate().valid);
}

TEST_F(DensityMatrixTest, RenormalizeScalesTrace) {
  Density_Matrix rho(3);
  rho.set(0, 0, gsl_complex_rect(3.0, 0.0));
  rho.set(2, 2, gsl_complex_rect(1.0, 0.0));
  Density_Matrix out = rho.renormalize();
  EXPECT_NEAR(out.population(0), 0.75, 1e-15);
  EXPECT_NEAR(out.population(2), 0.25, 1e-15);
  EXPECT_NEAR(GSL_REAL(out.trace()), 1.0, 1e-15);
}

TEST_F(DensityMatrixTest, ClampRemovesNegativeEigenvalue) {
  Density_Matrix rho(3);
  rho.set(0, 0, gsl_complex_rect(1.2, 0.0));
  rho.set(1, 1, gsl_complex_rect(-0.2, 0.0));
  Density_Matrix out = rho.clamp_eigenvalues();
  EXPECT_NEAR(out.population(0), 1.0, 1e-12);
  EXPECT_NEAR(out.population(1), 0.0, 1e-12);
  EXPECT_TRUE(out.validate().valid);
}

TEST_F(DensityMatrixTest, RepairFixesEverythingAtOnce) {
  Density_Matrix rho(3);
  rho.set(0, 0, gsl_complex_rect(0.9, 0.0));
  rho.set(1, 1, gsl_complex_rect(0.4, 0.0));
  rho.set(2, 2, gsl_complex_rect(-0.05, 0.0));
  rho.set(0, 1, gsl_complex_rect(0.3, 0.2));
  rho.set(1, 0, gsl_complex_rect(0.1, 0.0));
  Density_Matrix out = rho.repair();
  dm_validation report = out.validate(1e-10);
  EXPECT_TRUE(report.hermitian);
  EXPECT_TRUE(report.trace_one);
  EXPECT_TRUE(report.positive_semidefinite);
  EXPECT_GE(out.eigenvalues().front(), -1e-12);
}

TEST_F(DensityMatrixTest, RepairLeavesValidMatrixAlone) {
  Density_Matrix rho = superposition();
  Density_Matrix out = rho.repair();
  EXPECT_LT(out.max_deviation(rho), 1e-12);
}

TEST_F(DensityMatrixTest, TwoLevelSize) {
  Density_Matrix rho(2);
  EXPECT_EQ(rho.size(), 2);
  EXPECT_EQ(rho.eigenvalues().size(), 2u);
}
