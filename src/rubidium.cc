// Authors: Benjamin Fenker 2013

// Copyright Benjamin Fenker 2013

#include <stdio.h>
#include <math.h>
#include <stdlib.h>
#include <string.h>

#include <gsl/gsl_sf_coupling.h>

#include "include/rubidium.h"
#include "include/units.h"

extern bool fwm_verbose;

using std::string;

int Rubidium::lookupParameters(string isotope, int Je2, int* I2,
                               double* Aj_g, double* Aj_e, double* Bj_e,
                               double* nu_excited, double* gamma,
                               double* reduced_dipole) {
  int status = 0;
  int set_I2 = 0;
  double set_Aj_g = 0;
  double set_Aj_e = 0;
  double set_Bj_e = 0;
  double lambda = 0;
  // Line properties are the same for both isotopes at this precision
  double set_gamma = 0;
  double set_dipole = 0;
  if (Je2 == 1) {
    set_gamma = 2.0*M_PI * 5.7500 * _MHz;        // Steck2008
    set_dipole = 2.537e-29 * _Cm;                 // Steck2008
  } else if (Je2 == 3) {
    set_gamma = 2.0*M_PI * 6.0666 * _MHz;        // Steck2008
    set_dipole = 3.584e-29 * _Cm;                 // Steck2008
  } else {
    status = 2;
  }

  if (strcmp(isotope.c_str(), "Rb87") == 0 ||
      strcmp(isotope.c_str(), "87Rb") == 0) {
    set_I2 = 3;
    set_Aj_g = 3417.341305452145 * _MHz;          // Bize1999
    set_Aj_e = 408.328 * _MHz;                    // Barwood1991
    lambda = 794.978851156 * _nm;                 // Steck2008
    if (Je2 == 3) {
      set_Aj_e = 84.7185 * _MHz;                  // Ye1996
      set_Bj_e = 12.4965 * _MHz;                  // Ye1996
      lambda = 780.241209686 * _nm;               // Steck2008
    }
  } else if (strcmp(isotope.c_str(), "Rb85") == 0 ||
             strcmp(isotope.c_str(), "85Rb") == 0) {
    set_I2 = 5;
    set_Aj_g = 1011.910813 * _MHz;                // Arimondo1977
    set_Aj_e = 120.527 * _MHz;                    // Barwood1991
    lambda = 794.979014933 * _nm;                 // Steck2008
    if (Je2 == 3) {
      set_Aj_e = 25.0020 * _MHz;                  // Rapol2003
      set_Bj_e = 25.790 * _MHz;                   // Rapol2003
      lambda = 780.241368271 * _nm;               // Steck2008
    }
  } else {
    status = 1;
  }
  if (status != 0) {
    set_I2 = 0;
    set_Aj_g = set_Aj_e = set_Bj_e = set_gamma = set_dipole = 0.0;
    lambda = 0.0;
  }

  *I2 = set_I2;
  *Aj_g = set_Aj_g;
  *Aj_e = set_Aj_e;
  *Bj_e = set_Bj_e;
  *nu_excited = (lambda > 0.0) ? _speed_of_light / lambda : 0.0;
  *gamma = set_gamma;
  *reduced_dipole = set_dipole;
  return status;
}

double Rubidium::hyperfineShift(int I2, int J2, int F2, double A, double B) {
  double I = I2 / 2.0;
  double J = J2 / 2.0;
  double F = F2 / 2.0;
  double K = F*(F+1) - I*(I+1) - J*(J+1);
  double shift = 0.5 * A * K;
  // Electric quadrupole only exists for I, J >= 1
  if (I2 >= 2 && J2 >= 2) {
    double num = 1.5*K*(K+1) - 2.0*I*(I+1)*J*(J+1);
    double den = 2.0*I*(2.0*I - 1.0) * 2.0*J*(2.0*J - 1.0);
    shift += B * num / den;
  }
  return shift;
}

double Rubidium::relativeStrength(int I2, int Jg2, int Je2, int Fg2,
                                  int Fe2) {
  // S_FF' = (2F' + 1)(2J + 1) {J J' 1; F' F I}^2
  double sixj = gsl_sf_coupling_6j(Jg2, Je2, 2, Fe2, Fg2, I2);
  return (Fe2 + 1) * (Jg2 + 1) * sixj * sixj;
}

double Rubidium::branchingRatio(int I2, int Jg2, int Je2, int Fg2, int Fe2) {
  // (2F + 1)(2J' + 1) {J J' 1; F' F I}^2
  double sixj = gsl_sf_coupling_6j(Jg2, Je2, 2, Fe2, Fg2, I2);
  return (Fg2 + 1) * (Je2 + 1) * sixj * sixj;
}

int Rubidium::defaultLambda(string isotope, int* Fg1_2, int* Fg2_2,
                            int* Fe2) {
  if (isotope == "Rb87" || isotope == "87Rb") {
    *Fg1_2 = 2;                 // 5S_1/2, F = 1
    *Fg2_2 = 4;                 // 5S_1/2, F = 2
    *Fe2 = 4;                   // 5P, F' = 2
  } else if (isotope == "Rb85" || isotope == "85Rb") {
    *Fg1_2 = 4;                 // 5S_1/2, F = 2
    *Fg2_2 = 6;                 // 5S_1/2, F = 3
    *Fe2 = 6;                   // 5P, F' = 3
  } else {
    return 1;
  }
  return 0;
}

int Rubidium::setupDoubleLambda(string isotope, int Je2, int Fg1_2,
                                int Fg2_2, int Fe2, lambda_data* lambda) {
  const int Jg2 = 1;            // 5S_1/2
  int I2;
  double Aj_g, Aj_e, Bj_e, nu_excited, gamma, reduced_dipole;
  int status = lookupParameters(isotope, Je2, &I2, &Aj_g, &Aj_e, &Bj_e,
                                &nu_excited, &gamma, &reduced_dipole);
  if (status != 0) {
    printf("Parameter lookup failed.\n");
    printf("Isotope = %s \t Je2 = %d\n", isotope.c_str(), Je2);
    return status;
  }

  // Ground F = I +/- 1/2, excited F' = |I - J'| ... I + J'
  bool g1_ok = (Fg1_2 == I2 - 1 || Fg1_2 == I2 + 1);
  bool g2_ok = (Fg2_2 == I2 - 1 || Fg2_2 == I2 + 1);
  bool e_ok = (Fe2 >= abs(I2 - Je2) && Fe2 <= I2 + Je2 &&
               (Fe2 - abs(I2 - Je2)) % 2 == 0);
  if (!g1_ok || !g2_ok || !e_ok || Fg1_2 == Fg2_2) {
    printf("No lambda system with 2F = %d, %d and 2F' = %d in %s\n",
           Fg1_2, Fg2_2, Fe2, isotope.c_str());
    return 3;
  }

  double S1 = relativeStrength(I2, Jg2, Je2, Fg1_2, Fe2);
  double S2 = relativeStrength(I2, Jg2, Je2, Fg2_2, Fe2);
  // Also catches F = 0 --> F' = 0 and |F - F'| > 1 since the 6j vanishes
  if (abs(Fg1_2 - Fe2) > 2 || abs(Fg2_2 - Fe2) > 2 || S1 <= 0.0 ||
      S2 <= 0.0) {
    printf("Transition 2F = %d or %d --> 2F' = %d is forbidden\n", Fg1_2,
           Fg2_2, Fe2);
    return 4;
  }

  double shift_e = hyperfineShift(I2, Je2, Fe2, Aj_e, Bj_e);
  double shift_g1 = hyperfineShift(I2, Jg2, Fg1_2, Aj_g, 0.0);
  double shift_g2 = hyperfineShift(I2, Jg2, Fg2_2, Aj_g, 0.0);

  lambda_data out;
  out.isotope = isotope;
  out.I2 = I2;
  out.Je2 = Je2;
  out.Fg1_2 = Fg1_2;
  out.Fg2_2 = Fg2_2;
  out.Fe2 = Fe2;
  out.gamma_spon = gamma;
  out.gamma_e1 = gamma * branchingRatio(I2, Jg2, Je2, Fg1_2, Fe2);
  out.gamma_e2 = gamma * branchingRatio(I2, Jg2, Je2, Fg2_2, Fe2);
  out.dipole_pump = reduced_dipole * sqrt(S1);
  out.dipole_probe = reduced_dipole * sqrt(S2);
  out.omega_pump = 2.0*M_PI * (nu_excited + shift_e - shift_g1);
  out.omega_probe = 2.0*M_PI * (nu_excited + shift_e - shift_g2);
  out.ground_splitting = 2.0*M_PI * (shift_g2 - shift_g1);
  *lambda = out;

  if (fwm_verbose) {
    printf("%s lambda: |F=%d/2> , |F=%d/2> --> |F'=%d/2>\n", isotope.c_str(),
           Fg1_2, Fg2_2, Fe2);
    printf("\tBranching: %6.4f / %6.4f\n", out.gamma_e1/gamma,
           out.gamma_e2/gamma);
    printf("\tGround splitting = %10.6f MHz\n",
           out.ground_splitting/_2pi_MHz);
  }
  return 0;
}
