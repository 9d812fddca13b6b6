// Authors: Benjamin Fenker 2013
// Copyright Benjamin Fenker 2013

#ifndef INCLUDE_UNITS_H_
#define INCLUDE_UNITS_H_

#include <math.h>
#include <gsl/gsl_const_mksa.h>

// Everything inside the solver is SI with angular frequencies in rad/s.
// These are only used to convert input and output at the edges.

/* Length [m] */
#define _cm (1e-2)              /* centimeters */
#define _nm (1e-9)              /* nanometers */

/* Volume [m^3] */
#define _cm3 (1e-6)             /* cubic centimeters */

/* Time [s]*/
#define _s (1e0)                /* seconds */

/* Area [m^2] */
#define _cm2 (1e-4)             /* square-centimeters */

/* Frequency [s^-1] */
#define _kHz (1e3)              /* kilohertz */
#define _MHz (1e6)              /* megahertz */

/* Angular frequency [rad/s] */
#define _2pi_MHz (2.0*M_PI*_MHz)     /* 2 pi x megahertz */

/* Power [W = kg*m^2/s^3] */
#define _mW (1e-3)              /* milliwatts */

/* Electric dipole moment [C*m = couloumb-meter] */
#define _Cm (1e0)                        /* couloumb-meters */

/* Physical constants */
#define _speed_of_light (GSL_CONST_MKSA_SPEED_OF_LIGHT)  /* m/s */
#define _planck_hbar (GSL_CONST_MKSA_PLANCKS_CONSTANT_HBAR) /* J s */
#define _epsilon_0 (GSL_CONST_MKSA_VACUUM_PERMITTIVITY)  /* F/m */
#endif  // INCLUDE_UNITS_H_
