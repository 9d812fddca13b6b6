// Authors: Benjamin Fenker 2013
// Copyright 2012 Benjamin Fenker

#ifndef INCLUDE_RUBIDIUM_H_
#define INCLUDE_RUBIDIUM_H_

#include <string>
#include "./fwm_data_structures.h"

using std::string;

// Atomic data for the rubidium D lines and the double-lambda systems built
// from them.  Angular momenta are passed doubled (I2 = 2I, Je2 = 2J', ...)
// so half-integers stay integers.
class Rubidium {
 public:
  // Returns 0 on success, 1 for an unknown isotope, 2 for an unknown line.
  // Frequencies and hyperfine constants in Hz, gamma in rad/s, dipole in C m
  int lookupParameters(string isotope, int Je2, int* I2, double* Aj_g,
                       double* Aj_e, double* Bj_e, double* nu_excited,
                       double* gamma, double* reduced_dipole);

  // Hyperfine energy shift / h of level F [Hz]
  double hyperfineShift(int I2, int J2, int F2, double A, double B);

  // Fraction of the J --> J' line strength in F --> F' (sums to 1 over F')
  double relativeStrength(int I2, int Jg2, int Je2, int Fg2, int Fe2);
  // Fraction of decays from F' that end in F (sums to 1 over F)
  double branchingRatio(int I2, int Jg2, int Je2, int Fg2, int Fe2);

  // Default lambda: the two ground levels and the excited level both of
  // them can reach.  Returns non-zero for an unknown isotope
  int defaultLambda(string isotope, int* Fg1_2, int* Fg2_2, int* Fe2);

  // Returns 0 on success, the lookupParameters status for bad isotope/line,
  // 3 for F values that do not exist and 4 for forbidden transitions
  int setupDoubleLambda(string isotope, int Je2, int Fg1_2, int Fg2_2,
                        int Fe2, lambda_data* lambda);
};

#endif  // INCLUDE_RUBIDIUM_H_
