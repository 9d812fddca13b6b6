// Authors: Benjamin Fenker 2013
// Copyright 2013 Benjamin Fenker

#include <stdio.h>
#include <stdlib.h>
#include <string>

#include "./fwm_data_structures.h"
#include "./fwm_parameters.h"
#include "./parameter_sweep.h"

#ifndef INCLUDE_FOUR_WAVE_MIXING_H_
#define INCLUDE_FOUR_WAVE_MIXING_H_

using std::string;

class FourWaveMixing {
 public:
  // Returns 0 on success.  Atomic data problems give the Rubidium status,
  // bad physical input the GSL error code and file problems the
  // FWMExport status.
  int run(fwm_parameters params);

  // Fills the fixed point of the sweep and the medium from the input.
  // Throws FWM_Error if the input is unphysical
  void setup(const fwm_parameters &params, const lambda_data &lambda,
             system_parameters *sys, medium_parameters *medium);
  Sweep_Specification specification(const fwm_parameters &params,
                                    const system_parameters &sys);
  solver_options options(const fwm_parameters &params);
};
#endif  // INCLUDE_FOUR_WAVE_MIXING_H_
