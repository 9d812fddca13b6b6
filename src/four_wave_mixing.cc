// Authors: Benjamin Fenker 2013
// Copyright 2013 Benjamin Fenker

#include <stdio.h>
#include <string.h>
#include <math.h>
#include <gsl/gsl_errno.h>      // GSL Reserves error codes -2 to 32 (succes = 0)

#include "include/four_wave_mixing.h"
#include "include/bloch_solver.h"
#include "include/rubidium.h"
#include "include/spectra_export.h"
#include "include/susceptibility.h"
#include "include/units.h"

using std::string;

void FourWaveMixing::setup(const fwm_parameters &params,
                           const lambda_data &lambda, system_parameters *sys,
                           medium_parameters *medium) {
  system_parameters s;
  s.pump_detune = params.pump_detune;
  s.probe_detune = params.probe_detune;
  s.gamma_e1 = lambda.gamma_e1;
  s.gamma_e2 = lambda.gamma_e2;
  s.ground_dephasing = params.ground_dephasing;
  s.optical_dephasing = params.optical_dephasing;
  if (params.rabi_from_intensity) {
    Laser_data pump(params.pump_intensity, params.pump_detune,
                    lambda.dipole_pump);
    Laser_data probe(params.probe_intensity, params.probe_detune,
                     lambda.dipole_probe);
    s.pump_rabi = pump.rabi;
    s.probe_rabi = probe.rabi;
  } else {
    s.pump_rabi = params.pump_rabi;
    s.probe_rabi = params.probe_rabi;
  }
  s.validate();

  medium_parameters m;
  m.number_density = params.number_density;
  m.dipole_moment = lambda.dipole_probe;
  m.pump_intensity = params.pump_intensity;
  m.probe_intensity = params.probe_intensity;
  m.interaction_length = params.interaction_length;
  m.regularization = params.regularization;
  // Generated field: two pump photons in, one probe photon out
  double omega_p = lambda.omega_pump + params.pump_detune;
  double omega_c = lambda.omega_probe + params.probe_detune;
  m.signal_frequency = 2.0*omega_p - omega_c;
  m.validate();

  *sys = s;
  *medium = m;
}

Sweep_Specification FourWaveMixing::specification(
    const fwm_parameters &params, const system_parameters &sys) {
  Sweep_Axis primary = Sweep_Axis::linspace(params.sweep, params.sweep_min,
                                            params.sweep_max,
                                            params.sweep_points);
  if (params.sweep2 == "none") {
    return Sweep_Specification(sys, primary);
  }
  Sweep_Axis secondary = Sweep_Axis::linspace(params.sweep2,
                                              params.sweep2_min,
                                              params.sweep2_max,
                                              params.sweep2_points);
  return Sweep_Specification(sys, primary, secondary);
}

solver_options FourWaveMixing::options(const fwm_parameters &params) {
  solver_options opt;
  if (params.max_iterations < 1) {
    throw FWM_Error(GSL_EINVAL, "max_iterations must be >= 1");
  }
  opt.max_iterations = static_cast<size_t>(params.max_iterations);
  opt.max_seconds = params.max_seconds;
  opt.tolerance = params.tolerance;
  return opt;
}

int FourWaveMixing::run(fwm_parameters params) {
  bool verbose = (params.verbosity > 0);
  Rubidium rb;
  lambda_data lambda;
  int status = rb.setupDoubleLambda(params.isotope, params.Je2, params.Fg1_2,
                                    params.Fg2_2, params.Fe2, &lambda);
  if (status != 0) return status;

  try {
    system_parameters sys;
    medium_parameters medium;
    setup(params, lambda, &sys, &medium);
    Sweep_Specification spec = specification(params, sys);
    Bloch_Solver solver(options(params));
    Susceptibility_Engine engine(medium);
    Sweep_Orchestrator orchestrator(FWM_Calculator(solver, engine));

    if (verbose) {
      printf("** FOUR-WAVE MIXING **\n");
      printf("Double lambda in %s D%d\n", lambda.isotope.c_str(),
             (lambda.Je2 == 1) ? 1 : 2);
      if (lambda.I2 % 2 == 0) {
        printf("\tNuclear spin: %d \n", lambda.I2/2);
      } else {
        printf("\tNuclear spin: %d/2 \n", lambda.I2);
      }
      printf("\tPump:  |F=%d/2> ---> |F'=%d/2>  %14.10G MHz\n",
             lambda.Fg1_2, lambda.Fe2, lambda.omega_pump/_2pi_MHz);
      printf("\tProbe: |F=%d/2> ---> |F'=%d/2>  %14.10G MHz\n",
             lambda.Fg2_2, lambda.Fe2, lambda.omega_probe/_2pi_MHz);
      printf("\tgamma_spon = %6.4G MHz\n\n", lambda.gamma_spon/_2pi_MHz);
      sys.print(stdout);
      printf("\tIntensity: pump = %6.4G mW/cm^2\tprobe = %6.4G mW/cm^2\n",
             medium.pump_intensity/(_mW/_cm2),
             medium.probe_intensity/(_mW/_cm2));
      printf("\tDensity = %6.4G cm^-3\tLength = %6.4G cm\n\n",
             medium.number_density*_cm3, medium.interaction_length/_cm);
      for (int a = 0; a < spec.dimensions(); a++) {
        const Sweep_Axis &axis = spec.axes[a];
        printf("Sweeping %s from %+8.4G to %+8.4G MHz (%zu points)\n",
               axis.name.c_str(), axis.values.front()/_2pi_MHz,
               axis.values.back()/_2pi_MHz, axis.values.size());
      }
    }

    Sweep_Result result = orchestrator.run(spec);
    status = FWMExport::WriteCSV(result, params.out_file);
    if (verbose && status == FWMExport::success) {
      printf("Wrote %zu points to %s\n", result.num_points(),
             params.out_file.c_str());
    }
  }
  catch (const FWM_Error &e) {
    printf("Error: %s\n", e.what());
    return e.code();
  }
  return status;
}
