// Authors: Benjamin Fenker 2013
// Copyright 2013 Benjamin Fenker

#ifndef INCLUDE_PARAMETER_SWEEP_H_
#define INCLUDE_PARAMETER_SWEEP_H_

#include <stddef.h>
#include <map>
#include <string>
#include <vector>
#include <gsl/gsl_complex.h>

#include "./bloch_solver.h"
#include "./fwm_data_structures.h"
#include "./susceptibility.h"

using std::map;
using std::string;
using std::vector;

// One named parameter and the values it takes.  The name is stored in its
// canonical form (see canonical_name).
class Sweep_Axis {
 public:
  // Throws FWM_Error for unknown names, empty or non-monotonic values
  Sweep_Axis(string set_name, vector<double> set_values);
  // num_points evenly spaced values from min to max inclusive
  static Sweep_Axis linspace(string set_name, double min, double max,
                             int num_points);

  // Maps a user name or alias onto the parameter it controls.  Returns
  // false for names that are not sweepable
  static bool canonical_name(string name, string *canonical);
  static void apply(const string &canonical, double value,
                    system_parameters *params);

  string name;
  vector<double> values;
};

// What to sweep and what to hold fixed.  One axis for a 1D sweep, two for a
// 2D grid with the first axis varying slowest.
class Sweep_Specification {
 public:
  Sweep_Specification(system_parameters set_fixed, Sweep_Axis primary);
  // Throws FWM_Error if both axes control the same parameter
  Sweep_Specification(system_parameters set_fixed, Sweep_Axis primary,
                      Sweep_Axis secondary);

  int dimensions() const { return static_cast<int>(axes.size()); }
  size_t num_points() const;
  // Parameters at grid point (i, j).  j is ignored for 1D sweeps
  system_parameters point(size_t i, size_t j = 0) const;

  system_parameters fixed;
  vector<Sweep_Axis> axes;
};

struct sweep_metadata {
  sweep_metadata();
  string units;              // of the swept parameters
  string timestamp;          // ISO-8601, UTC
  int unconverged_points;
};

// Flat, default-constructible form of a Sweep_Result.  Results are written
// from it and read back into it by FWMExport.  Arrays are row-major.
struct sweep_record {
  vector<string> parameter_names;
  vector<vector<double> > parameter_values;
  vector<gsl_complex> chi3;
  vector<double> intensity;
  map<string, double> fixed_parameters;
  sweep_metadata metadata;
};

// Parameter values with the chi3 and four-wave-mixing intensity at every
// grid point.  The shapes are checked when it is built and it cannot be
// changed afterwards.
class Sweep_Result {
 public:
  // 1D.  Throws FWM_Error (GSL_EBADLEN) if the sizes disagree
  Sweep_Result(string name, vector<double> values, vector<gsl_complex> chi3,
               vector<double> intensity, map<string, double> fixed,
               sweep_metadata set_metadata);
  // 2D, arrays indexed [i][j] with i along name1.  Throws FWM_Error
  // (GSL_EBADLEN) if either array is not len(values1) x len(values2)
  Sweep_Result(string name1, vector<double> values1, string name2,
               vector<double> values2, vector<vector<gsl_complex> > chi3,
               vector<vector<double> > intensity, map<string, double> fixed,
               sweep_metadata set_metadata);
  explicit Sweep_Result(const sweep_record &record);

  int dimensions() const { return static_cast<int>(names.size()); }
  vector<size_t> shape() const;
  size_t num_points() const { return intensity_flat.size(); }
  const string &parameter_name(int axis = 0) const { return names[axis]; }
  const vector<double> &parameter_values(int axis = 0) const {
    return values[axis];
  }
  gsl_complex chi3(size_t i, size_t j = 0) const;
  double intensity(size_t i, size_t j = 0) const;
  const vector<gsl_complex> &chi3_values() const { return chi3_flat; }
  const vector<double> &intensity_values() const { return intensity_flat; }
  const map<string, double> &fixed_parameters() const { return fixed; }
  const sweep_metadata &metadata() const { return meta; }
  sweep_record to_record() const;

 private:
  void check_shape() const;
  size_t flat_index(size_t i, size_t j) const;

  vector<string> names;
  vector<vector<double> > values;
  vector<gsl_complex> chi3_flat;
  vector<double> intensity_flat;
  map<string, double> fixed;
  sweep_metadata meta;
};

struct fwm_point {
  steady_state state;
  gsl_complex chi1, chi3;
  double intensity;
};

// The solver and susceptibility engine used at every sweep point
class FWM_Calculator {
 public:
  FWM_Calculator(Bloch_Solver set_solver, Susceptibility_Engine set_engine);
  // Throws FWM_Error for parameters the pipeline can not handle
  void check(const system_parameters &params) const;
  fwm_point evaluate(const system_parameters &params) const;

  Bloch_Solver solver;
  Susceptibility_Engine engine;
};

class Sweep_Orchestrator {
 public:
  explicit Sweep_Orchestrator(FWM_Calculator set_calculator);

  Sweep_Result sweep_1d(const Sweep_Specification &spec) const;
  Sweep_Result sweep_2d(const Sweep_Specification &spec) const;
  // Picks sweep_1d or sweep_2d
  Sweep_Result run(const Sweep_Specification &spec) const;

  Sweep_Result sweep_probe_detuning(system_parameters fixed, double min,
                                    double max, int num_points) const;
  Sweep_Result sweep_pump_rabi(system_parameters fixed, double min,
                               double max, int num_points) const;
  Sweep_Result sweep_pump_detuning(system_parameters fixed, double min,
                                   double max, int num_points) const;

  // Every system and medium parameter that is not swept, by name
  map<string, double> fixed_parameters(const Sweep_Specification &spec) const;

  FWM_Calculator calculator;

 private:
  // Independent solves, one per grid point, in the same order as grid
  vector<fwm_point> evaluate_grid(const vector<system_parameters> &grid,
                                  int *unconverged) const;
  sweep_metadata make_metadata(int unconverged) const;
};

#endif  // INCLUDE_PARAMETER_SWEEP_H_
