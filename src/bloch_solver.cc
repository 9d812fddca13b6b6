// Authors: Benjamin Fenker 2013
// Copyright 2013 Benjamin Fenker

#include <math.h>
#include <stdio.h>
#include <algorithm>
#include <chrono>
#include <mutex>

#include <gsl/gsl_blas.h>
#include <gsl/gsl_complex.h>
#include <gsl/gsl_complex_math.h>
#include <gsl/gsl_errno.h>      // GSL Reserves error codes -2 to 32 (succes = 0)
#include <gsl/gsl_math.h>
#include <gsl/gsl_multiroots.h>
#include <gsl/gsl_sys.h>

#include "include/bloch_solver.h"

extern bool fwm_verbose;

namespace {
const size_t kNumUnknowns = 8;

// The default GSL handler aborts.  Every status is checked here instead
std::once_flag gsl_handler_flag;
void switch_off_gsl_handler() { gsl_set_error_handler_off(); }
}  // namespace

solver_options::solver_options()
    : epsabs(1e-12), max_iterations(1000), max_seconds(10.0),
      tolerance(1e-6), seed_population_g1(1.0) {}

Bloch_Solver::Bloch_Solver() {}

Bloch_Solver::Bloch_Solver(solver_options set_options)
    : options(set_options) {
  if (!(options.epsabs > 0.0) || !(options.tolerance > 0.0)) {
    throw FWM_Error(GSL_EINVAL, "solver tolerances must be > 0");
  }
  if (options.max_iterations == 0 || !(options.max_seconds > 0.0)) {
    throw FWM_Error(GSL_EINVAL, "solver needs a positive iteration budget");
  }
  if (!(options.seed_population_g1 >= 0.0 &&
        options.seed_population_g1 <= 1.0)) {
    throw FWM_Error(GSL_EINVAL, "seed population must be in [0, 1]");
  }
}

Density_Matrix Bloch_Solver::seed_state() const {
  Density_Matrix seed(3);
  seed.set(0, 0, gsl_complex_rect(options.seed_population_g1, 0.0));
  seed.set(1, 1, gsl_complex_rect(1.0 - options.seed_population_g1, 0.0));
  return seed;
}

void Bloch_Solver::obe_residuals(const double rho[],
                                 const system_parameters &params,
                                 double drho[]) {
  const double r11 = rho[kRho11];
  const double r22 = rho[kRho22];
  const double ree = rho[kRhoEE];
  gsl_complex r12 = gsl_complex_rect(rho[kRe12], rho[kIm12]);
  gsl_complex r1e = gsl_complex_rect(rho[kRe1e], rho[kIm1e]);
  gsl_complex r2e = gsl_complex_rect(rho[kRe2e], rho[kIm2e]);

  const double a = params.pump_rabi / 2.0;
  const double b = params.probe_rabi / 2.0;
  const double gamma = params.total_decay();
  // Optical coherences decay at half the population rate plus dephasing
  const double G = gamma/2.0 + params.optical_dephasing;
  const double g12 = params.ground_dephasing;
  const double delta = params.two_photon_detune();

  // Populations: -i[H, rho] plus spontaneous decay into each ground level
  drho[kRho11] = params.gamma_e1*ree - params.pump_rabi*GSL_IMAG(r1e);
  drho[kRho22] = params.gamma_e2*ree - params.probe_rabi*GSL_IMAG(r2e);
  drho[kRhoEE] = -gamma*ree + params.pump_rabi*GSL_IMAG(r1e) +
      params.probe_rabi*GSL_IMAG(r2e);

  // d(rho_1e) = -(i Delta_p + G) rho_1e - i a (rho_ee - rho_11) + i b rho_12
  gsl_complex d1e = gsl_complex_mul(gsl_complex_rect(-G, -params.pump_detune),
                                    r1e);
  d1e = gsl_complex_add(d1e, gsl_complex_rect(0.0, -a*(ree - r11)));
  d1e = gsl_complex_add(d1e, gsl_complex_mul_imag(r12, b));

  // d(rho_2e) = -(i Delta_c + G) rho_2e - i b (rho_ee - rho_22)
  //             + i a rho_21
  gsl_complex d2e = gsl_complex_mul(gsl_complex_rect(-G, -params.probe_detune),
                                    r2e);
  d2e = gsl_complex_add(d2e, gsl_complex_rect(0.0, -b*(ree - r22)));
  d2e = gsl_complex_add(d2e,
                        gsl_complex_mul_imag(gsl_complex_conjugate(r12), a));

  // d(rho_12) = -(i delta + gamma_12) rho_12 - i a rho_e2 + i b rho_1e
  gsl_complex d12 = gsl_complex_mul(gsl_complex_rect(-g12, -delta), r12);
  d12 = gsl_complex_add(d12,
                        gsl_complex_mul_imag(gsl_complex_conjugate(r2e), -a));
  d12 = gsl_complex_add(d12, gsl_complex_mul_imag(r1e, b));

  drho[kRe12] = GSL_REAL(d12);
  drho[kIm12] = GSL_IMAG(d12);
  drho[kRe1e] = GSL_REAL(d1e);
  drho[kIm1e] = GSL_IMAG(d1e);
  drho[kRe2e] = GSL_REAL(d2e);
  drho[kIm2e] = GSL_IMAG(d2e);
}

int Bloch_Solver::steady_state_gsl(const gsl_vector *x, void *data,
                                   gsl_vector *f) {
  obe_data_for_gsl *d = static_cast<obe_data_for_gsl *>(data);

  double rho[kNumOBETerms];
  rho[kRho11] = gsl_vector_get(x, 0);
  rho[kRho22] = gsl_vector_get(x, 1);
  rho[kRhoEE] = 1.0 - rho[kRho11] - rho[kRho22];
  for (size_t i = 2; i < kNumUnknowns; i++) {
    rho[kRe12 + i - 2] = gsl_vector_get(x, i);
  }

  double drho[kNumOBETerms];
  obe_residuals(rho, d->params, drho);

  // Once the trace is fixed the excited-state equation is minus the sum of
  // the two ground equations, so it carries no information
  double out[kNumUnknowns] = {drho[kRho11], drho[kRho22],
                              drho[kRe12], drho[kIm12],
                              drho[kRe1e], drho[kIm1e],
                              drho[kRe2e], drho[kIm2e]};
  for (size_t i = 0; i < kNumUnknowns; i++) out[i] /= d->rate_scale;
  if (d->pin_g1) out[0] = rho[kRho11] - d->seed_g1;
  if (d->pin_g2) out[1] = rho[kRho22] - d->seed_g2;

  for (size_t i = 0; i < kNumUnknowns; i++) {
    if (!gsl_finite(out[i])) return GSL_EBADFUNC;
    gsl_vector_set(f, i, out[i]);
  }
  return GSL_SUCCESS;
}

Density_Matrix Bloch_Solver::to_density_matrix(const double rho[]) {
  Density_Matrix dm(3);
  dm.set(0, 0, gsl_complex_rect(rho[kRho11], 0.0));
  dm.set(1, 1, gsl_complex_rect(rho[kRho22], 0.0));
  dm.set(2, 2, gsl_complex_rect(rho[kRhoEE], 0.0));

  gsl_complex r12 = gsl_complex_rect(rho[kRe12], rho[kIm12]);
  gsl_complex r1e = gsl_complex_rect(rho[kRe1e], rho[kIm1e]);
  gsl_complex r2e = gsl_complex_rect(rho[kRe2e], rho[kIm2e]);
  dm.set(0, 1, r12);
  dm.set(1, 0, gsl_complex_conjugate(r12));
  dm.set(0, 2, r1e);
  dm.set(2, 0, gsl_complex_conjugate(r1e));
  dm.set(1, 2, r2e);
  dm.set(2, 1, gsl_complex_conjugate(r2e));
  return dm;
}

double Bloch_Solver::rate_scale(const system_parameters &params) {
  double scale = params.total_decay();
  scale = std::max(scale, params.pump_rabi);
  scale = std::max(scale, params.probe_rabi);
  scale = std::max(scale, fabs(params.pump_detune));
  scale = std::max(scale, fabs(params.probe_detune));
  scale = std::max(scale, params.ground_dephasing);
  scale = std::max(scale, params.optical_dephasing);
  return scale;
}

steady_state Bloch_Solver::solve(const system_parameters &params) const {
  params.validate();
  std::call_once(gsl_handler_flag, switch_off_gsl_handler);

  steady_state result;
  const double seed_g1 = options.seed_population_g1;
  const double seed_g2 = 1.0 - seed_g1;

  if (params.pump_rabi == 0.0 && params.probe_rabi == 0.0) {
    // Nothing drives the atom so it stays where it was put
    result.rho = seed_state().repair();
    result.report = result.rho.validate(options.tolerance);
    result.converged = true;
    result.status = GSL_SUCCESS;
    result.iterations = 0;
    result.residual = 0.0;
    return result;
  }

  obe_data_for_gsl data;
  data.params = params;
  data.rate_scale = rate_scale(params);
  data.pin_g1 = (params.pump_rabi == 0.0 && params.gamma_e1 == 0.0);
  data.pin_g2 = (params.probe_rabi == 0.0 && params.gamma_e2 == 0.0);
  data.seed_g1 = seed_g1;
  data.seed_g2 = seed_g2;

  gsl_multiroot_function F = {&Bloch_Solver::steady_state_gsl, kNumUnknowns,
                              &data};
  gsl_vector *x = gsl_vector_calloc(kNumUnknowns);
  gsl_vector_set(x, 0, seed_g1);
  gsl_vector_set(x, 1, seed_g2);

  gsl_multiroot_fsolver *s =
      gsl_multiroot_fsolver_alloc(gsl_multiroot_fsolver_hybrids, kNumUnknowns);

  double unknowns[kNumUnknowns];
  for (size_t i = 0; i < kNumUnknowns; i++) unknowns[i] = gsl_vector_get(x, i);

  size_t iter = 0;
  int status = gsl_multiroot_fsolver_set(s, &F, x);
  if (status == GSL_SUCCESS) {
    std::chrono::steady_clock::time_point start =
        std::chrono::steady_clock::now();
    double elapsed = 0.0;
    do {
      iter++;
      // Returns GSL_ENOPROG(J) when stuck or GSL_EBADFUNC on a non-finite
      // trial point; s->x still holds the best point found
      status = gsl_multiroot_fsolver_iterate(s);
      if (status != GSL_SUCCESS) break;
      status = gsl_multiroot_test_residual(s->f, options.epsabs);
      elapsed = std::chrono::duration<double>(
          std::chrono::steady_clock::now() - start).count();
    } while (status == GSL_CONTINUE && iter < options.max_iterations &&
             elapsed < options.max_seconds);
    if (status == GSL_CONTINUE) status = GSL_EMAXITER;

    gsl_vector *root = gsl_multiroot_fsolver_root(s);
    for (size_t i = 0; i < kNumUnknowns; i++) {
      unknowns[i] = gsl_vector_get(root, i);
    }
    result.residual = gsl_blas_dnrm2(s->f);
    result.converged =
        (gsl_multiroot_test_residual(s->f, options.epsabs) == GSL_SUCCESS);
  } else {
    result.residual = GSL_POSINF;
    result.converged = false;
  }
  gsl_multiroot_fsolver_free(s);
  gsl_vector_free(x);

  if (result.converged) status = GSL_SUCCESS;
  result.status = status;
  result.iterations = iter;

  double rho[kNumOBETerms];
  rho[kRho11] = unknowns[0];
  rho[kRho22] = unknowns[1];
  rho[kRhoEE] = 1.0 - unknowns[0] - unknowns[1];
  for (size_t i = 2; i < kNumUnknowns; i++) rho[kRe12 + i - 2] = unknowns[i];

  result.rho = to_density_matrix(rho).repair();
  result.report = result.rho.validate(options.tolerance);
  if (!result.converged && fwm_verbose) {
    printf("Steady state not converged: %s after %zu iterations ",
           gsl_strerror(status), iter);
    printf("(|f| = %8.4G)\n", result.residual);
    printf("Repaired density matrix (real\t\timaginary):\n");
    result.rho.print_density_matrix(stdout);
  }
  return result;
}
