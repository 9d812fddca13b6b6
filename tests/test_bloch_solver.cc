/**
 * @file test_bloch_solver.cc
 * @brief Steady state of the double-lambda optical Bloch equations
 */

#include <gtest/gtest.h>
#include <math.h>
#include <gsl/gsl_complex_math.h>
#include <gsl/gsl_errno.h>

#include "include/bloch_solver.h"
#include "include/fwm_data_structures.h"
#include "include/rubidium.h"
#include "include/two_level_solver.h"
#include "include/units.h"

class BlochSolverTest : public ::testing::Test {
 protected:
  void SetUp() override {
    gamma = 2.0*M_PI * 6.0666 * _MHz;
  }

  // Rb87 D2 F=1, F=2 --> F'=2 branching is 1/2, 1/2
  system_parameters lambda_system(double pump, double probe) const {
    system_parameters p;
    p.pump_rabi = pump;
    p.probe_rabi = probe;
    p.gamma_e1 = gamma/2.0;
    p.gamma_e2 = gamma/2.0;
    p.ground_dephasing = 2.0*M_PI * 1.0 * _kHz;
    return p;
  }

  double gamma;
};

// ============================================================================
// Residual function
// ============================================================================

TEST_F(BlochSolverTest, ResidualVanishesAtAnalyticTwoLevelState) {
  system_parameters p;
  p.pump_rabi = 0.8 * gamma;
  p.pump_detune = 0.3 * gamma;
  p.gamma_e1 = gamma;
  Two_Level_Solver tls(p.pump_rabi, p.pump_detune, gamma);

  double rho[kNumOBETerms] = {0.0};
  rho[kRhoEE] = tls.excited_population();
  rho[kRho11] = 1.0 - rho[kRhoEE];
  rho[kRe1e] = GSL_REAL(tls.coherence());
  rho[kIm1e] = GSL_IMAG(tls.coherence());

  double drho[kNumOBETerms];
  Bloch_Solver::obe_residuals(rho, p, drho);
  for (int i = 0; i < kNumOBETerms; i++) {
    EXPECT_NEAR(drho[i] / gamma, 0.0, 1e-12) << "term " << i;
  }
}

TEST_F(BlochSolverTest, ResidualConservesTrace) {
  system_parameters p = lambda_system(0.5 * gamma, 0.2 * gamma);
  double rho[kNumOBETerms] = {0.3, 0.4, 0.3, 0.05, -0.02, 0.1, 0.07, -0.03,
                              0.04};
  double drho[kNumOBETerms];
  Bloch_Solver::obe_residuals(rho, p, drho);
  EXPECT_NEAR((drho[kRho11] + drho[kRho22] + drho[kRhoEE]) / gamma, 0.0,
              1e-14);
}

// ============================================================================
// Steady state
// ============================================================================

TEST_F(BlochSolverTest, ValidAcrossRegimes) {
  Bloch_Solver solver;
  const double pumps[] = {0.01, 0.5, 2.0, 10.0};
  const double probes[] = {0.001, 0.1, 1.0};
  const double detunes[] = {-5.0, 0.0, 1.5};
  for (int i = 0; i < 4; i++) {
    for (int j = 0; j < 3; j++) {
      for (int k = 0; k < 3; k++) {
        system_parameters p = lambda_system(pumps[i]*gamma, probes[j]*gamma);
        p.probe_detune = detunes[k]*gamma;
        steady_state s = solver.solve(p);
        EXPECT_TRUE(s.converged) << pumps[i] << " " << probes[j] << " "
                                 << detunes[k];
        EXPECT_TRUE(s.report.valid) << pumps[i] << " " << probes[j] << " "
                                    << detunes[k];
        EXPECT_NEAR(GSL_REAL(s.rho.trace()), 1.0, 1e-9);
      }
    }
  }
}

TEST_F(BlochSolverTest, UndrivenAtomStaysInSeed) {
  system_parameters p = lambda_system(0.0, 0.0);
  steady_state s = Bloch_Solver().solve(p);
  EXPECT_TRUE(s.converged);
  EXPECT_EQ(s.iterations, 0u);
  EXPECT_NEAR(s.rho.population(0), 1.0, 1e-12);
  EXPECT_NEAR(s.rho.population(2), 0.0, 1e-12);

  solver_options options;
  options.seed_population_g1 = 0.0;
  steady_state s2 = Bloch_Solver(options).solve(p);
  EXPECT_NEAR(s2.rho.population(1), 1.0, 1e-12);
  EXPECT_NEAR(s2.rho.population(0), 0.0, 1e-12);
}

TEST_F(BlochSolverTest, MatchesTwoLevelWithProbeOff) {
  Bloch_Solver solver;
  const double rabi = 2.0*M_PI * 5.0 * _MHz;
  for (int i = 0; i <= 20; i++) {
    double detune = 2.0*M_PI * (-50.0 + 5.0*i) * _MHz;
    system_parameters p;
    p.pump_rabi = rabi;
    p.pump_detune = detune;
    p.gamma_e1 = gamma;
    p.gamma_e2 = 0.0;
    p.ground_dephasing = 2.0*M_PI * 1.0 * _kHz;
    steady_state s = solver.solve(p);
    ASSERT_TRUE(s.converged) << "Delta = " << detune/_2pi_MHz << " MHz";

    Two_Level_Solver tls(rabi, detune, gamma);
    double ee = tls.excited_population();
    gsl_complex ge = tls.coherence();
    EXPECT_NEAR(s.rho.population(2), ee, 1e-4*ee + 1e-12)
        << "Delta = " << detune/_2pi_MHz << " MHz";
    EXPECT_NEAR(GSL_REAL(s.rho.get(0, 2)), GSL_REAL(ge),
                1e-4*gsl_complex_abs(ge) + 1e-12)
        << "Delta = " << detune/_2pi_MHz << " MHz";
    EXPECT_NEAR(GSL_IMAG(s.rho.get(0, 2)), GSL_IMAG(ge),
                1e-4*gsl_complex_abs(ge) + 1e-12)
        << "Delta = " << detune/_2pi_MHz << " MHz";
    EXPECT_NEAR(s.rho.population(1), 0.0, 1e-10);
  }
}

TEST_F(BlochSolverTest, CoherentPopulationTrapping) {
  // Equal fields on two-photon resonance pump everything into
  // (|g1> - |g2>)/sqrt(2), which does not couple to |e>
  system_parameters p = lambda_system(0.5 * gamma, 0.5 * gamma);
  p.ground_dephasing = 0.0;
  steady_state s = Bloch_Solver().solve(p);
  ASSERT_TRUE(s.converged);
  EXPECT_NEAR(s.rho.population(2), 0.0, 1e-8);
  EXPECT_NEAR(s.rho.population(0), 0.5, 1e-6);
  EXPECT_NEAR(s.rho.population(1), 0.5, 1e-6);
  EXPECT_NEAR(GSL_REAL(s.rho.get(0, 1)), -0.5, 1e-6);
  EXPECT_NEAR(GSL_IMAG(s.rho.get(0, 1)), 0.0, 1e-6);
}

TEST_F(BlochSolverTest, StrongPumpEmptiesPumpedLevel) {
  system_parameters p = lambda_system(2.0 * gamma, 0.01 * gamma);
  p.probe_detune = 3.0 * gamma;
  steady_state s = Bloch_Solver().solve(p);
  ASSERT_TRUE(s.converged);
  EXPECT_GT(s.rho.population(1), 0.9);
}

TEST_F(BlochSolverTest, NonConvergenceIsReportedNotThrown) {
  solver_options options;
  options.epsabs = 1e-300;
  options.max_iterations = 2;
  Bloch_Solver solver(options);
  system_parameters p = lambda_system(0.7 * gamma, 0.3 * gamma);
  p.probe_detune = 0.4 * gamma;
  steady_state s;
  ASSERT_NO_THROW(s = solver.solve(p));
  EXPECT_FALSE(s.converged);
  EXPECT_NE(s.status, GSL_SUCCESS);
  EXPECT_LE(s.iterations, 2u);
  // Still repaired
  EXPECT_TRUE(s.rho.validate(1e-9).valid);
}

TEST_F(BlochSolverTest, WallClockCapStopsSolve) {
  // The iteration budget is never reached, only the time limit
  solver_options options;
  options.epsabs = 1e-300;
  options.max_iterations = 1000000;
  options.max_seconds = 1e-12;
  Bloch_Solver solver(options);
  system_parameters p = lambda_system(0.7 * gamma, 0.3 * gamma);
  p.probe_detune = 0.4 * gamma;
  steady_state s;
  ASSERT_NO_THROW(s = solver.solve(p));
  EXPECT_FALSE(s.converged);
  EXPECT_EQ(s.status, GSL_EMAXITER) << gsl_strerror(s.status);
  EXPECT_LT(s.iterations, options.max_iterations);
  EXPECT_TRUE(s.rho.validate(1e-9).valid);
  EXPECT_NEAR(GSL_REAL(s.rho.trace()), 1.0, 1e-9);
}

TEST_F(BlochSolverTest, SettingsFixedAtConstruction) {
  solver_options options;
  options.seed_population_g1 = 0.25;
  options.max_seconds = 3.0;
  Bloch_Solver solver(options);
  EXPECT_EQ(solver.settings().seed_population_g1, 0.25);
  EXPECT_EQ(solver.settings().max_seconds, 3.0);
  EXPECT_NEAR(solver.seed_state().population(1), 0.75, 1e-15);

  solver_options bad;
  bad.max_seconds = 0.0;
  EXPECT_THROW(Bloch_Solver solver2(bad), FWM_Error);
  bad.max_seconds = -1.0;
  EXPECT_THROW(Bloch_Solver solver3(bad), FWM_Error);

  solver_options seed;
  seed.seed_population_g1 = 2.0;
  EXPECT_THROW(Bloch_Solver solver4(seed), FWM_Error);
}

TEST_F(BlochSolverTest, RejectsUnphysicalInput) {
  Bloch_Solver solver;
  system_parameters p = lambda_system(-1.0, 0.1 * gamma);
  EXPECT_THROW(solver.solve(p), FWM_Error);

  p = lambda_system(gamma, gamma);
  p.gamma_e1 = p.gamma_e2 = 0.0;
  EXPECT_THROW(solver.solve(p), FWM_Error);

  p = lambda_system(gamma, gamma);
  p.ground_dephasing = -1.0;
  EXPECT_THROW(solver.solve(p), FWM_Error);

  solver_options bad;
  bad.max_iterations = 0;
  EXPECT_THROW(Bloch_Solver solver2(bad), FWM_Error);
}

TEST_F(BlochSolverTest, Rubidium85Lambda) {
  Rubidium rb;
  lambda_data lambda;
  ASSERT_EQ(rb.setupDoubleLambda("Rb85", 3, 4, 6, 6, &lambda), 0);
  system_parameters p;
  p.pump_rabi = 2.0*M_PI * 10.0 * _MHz;
  p.probe_rabi = 2.0*M_PI * 1.0 * _MHz;
  p.gamma_e1 = lambda.gamma_e1;
  p.gamma_e2 = lambda.gamma_e2;
  p.ground_dephasing = 2.0*M_PI * 1.0 * _kHz;
  p.probe_detune = 2.0*M_PI * 2.0 * _MHz;
  steady_state s = Bloch_Solver().solve(p);
  EXPECT_TRUE(s.converged);
  EXPECT_TRUE(s.report.valid);
}

TEST_F(BlochSolverTest, Deterministic) {
  system_parameters p = lambda_system(1.3 * gamma, 0.2 * gamma);
  p.pump_detune = -0.4 * gamma;
  p.probe_detune = 0.9 * gamma;
  Bloch_Solver solver;
  steady_state a = solver.solve(p);
  steady_state b = solver.solve(p);
  EXPECT_EQ(a.rho.max_deviation(b.rho), 0.0);
  EXPECT_EQ(a.iterations, b.iterations);
}
