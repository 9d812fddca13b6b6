// Authors: Benjamin Fenker 2013
// Copyright 2013 Benjamin Fenker

#include <stdio.h>
#include <time.h>
#include <string>
#include <vector>

#include <gsl/gsl_errno.h>
#include <gsl/gsl_sys.h>
#include <boost/algorithm/string.hpp>

#include "include/parameter_sweep.h"

extern bool fwm_verbose;

namespace {
// User name --> parameter it controls
const char *kSweepNames[][2] = {
  {"pump_rabi", "pump_rabi"},
  {"pump_rabi_frequency", "pump_rabi"},
  {"probe_rabi", "probe_rabi"},
  {"probe_rabi_frequency", "probe_rabi"},
  {"pump_detuning", "pump_detuning"},
  {"coupling_detuning", "pump_detuning"},
  {"probe_detuning", "probe_detuning"},
  {"ground_dephasing", "ground_dephasing"},
  {"optical_dephasing", "optical_dephasing"}
};
const int kNumSweepNames = sizeof(kSweepNames) / sizeof(kSweepNames[0]);

template <typename T>
string describe_shape(const vector<vector<T> > &array) {
  char buffer[64];
  if (array.empty()) {
    snprintf(buffer, sizeof(buffer), "(0, 0)");
    return string(buffer);
  }
  for (size_t i = 1; i < array.size(); i++) {
    if (array[i].size() != array[0].size()) {
      snprintf(buffer, sizeof(buffer), "(%zu, ragged)", array.size());
      return string(buffer);
    }
  }
  snprintf(buffer, sizeof(buffer), "(%zu, %zu)", array.size(),
           array[0].size());
  return string(buffer);
}

template <typename T>
vector<T> flatten(const vector<vector<T> > &array, size_t n1, size_t n2,
                  const char *what) {
  bool ok = (array.size() == n1);
  for (size_t i = 0; ok && i < n1; i++) ok = (array[i].size() == n2);
  if (!ok) {
    char grid[64];
    snprintf(grid, sizeof(grid), "(%zu, %zu)", n1, n2);
    throw FWM_Error(GSL_EBADLEN, string(what) + " array has shape " +
                    describe_shape(array) + " but the parameter grid is " +
                    grid);
  }
  vector<T> flat;
  flat.reserve(n1*n2);
  for (size_t i = 0; i < n1; i++) {
    flat.insert(flat.end(), array[i].begin(), array[i].end());
  }
  return flat;
}
}  // namespace

// ****************************** Sweep_Axis ******************************

Sweep_Axis::Sweep_Axis(string set_name, vector<double> set_values)
    : values(set_values) {
  if (!canonical_name(set_name, &name)) {
    throw FWM_Error(GSL_EINVAL, "unknown sweep parameter '" + set_name + "'");
  }
  if (values.empty()) {
    throw FWM_Error(GSL_EINVAL, "sweep of " + name + " has no points");
  }
  for (size_t i = 0; i < values.size(); i++) {
    if (!gsl_finite(values[i])) {
      throw FWM_Error(GSL_EINVAL, "sweep of " + name + " is not finite");
    }
  }
  if (values.size() > 1) {
    bool rising = values[1] > values[0];
    for (size_t i = 1; i < values.size(); i++) {
      bool ok = rising ? (values[i] > values[i-1]) : (values[i] < values[i-1]);
      if (!ok) {
        throw FWM_Error(GSL_EINVAL,
                        "sweep of " + name + " is not strictly monotonic");
      }
    }
  }
}

Sweep_Axis Sweep_Axis::linspace(string set_name, double min, double max,
                                int num_points) {
  if (num_points < 1) {
    throw FWM_Error(GSL_EINVAL, "sweep of " + set_name + " has no points");
  }
  vector<double> v(num_points, min);
  for (int i = 1; i < num_points; i++) {
    v[i] = min + (max - min) * i / (num_points - 1);
  }
  if (num_points > 1) v[num_points - 1] = max;
  return Sweep_Axis(set_name, v);
}

bool Sweep_Axis::canonical_name(string name, string *canonical) {
  boost::algorithm::trim(name);
  boost::algorithm::to_lower(name);
  for (int i = 0; i < kNumSweepNames; i++) {
    if (name == kSweepNames[i][0]) {
      *canonical = kSweepNames[i][1];
      return true;
    }
  }
  return false;
}

void Sweep_Axis::apply(const string &canonical, double value,
                       system_parameters *params) {
  if (canonical == "pump_rabi") {
    params->pump_rabi = value;
  } else if (canonical == "probe_rabi") {
    params->probe_rabi = value;
  } else if (canonical == "pump_detuning") {
    params->pump_detune = value;
  } else if (canonical == "probe_detuning") {
    params->probe_detune = value;
  } else if (canonical == "ground_dephasing") {
    params->ground_dephasing = value;
  } else if (canonical == "optical_dephasing") {
    params->optical_dephasing = value;
  } else {
    throw FWM_Error(GSL_EINVAL, "unknown sweep parameter '" + canonical + "'");
  }
}

// ************************** Sweep_Specification **************************

Sweep_Specification::Sweep_Specification(system_parameters set_fixed,
                                         Sweep_Axis primary)
    : fixed(set_fixed), axes(1, primary) {}

Sweep_Specification::Sweep_Specification(system_parameters set_fixed,
                                         Sweep_Axis primary,
                                         Sweep_Axis secondary)
    : fixed(set_fixed) {
  if (primary.name == secondary.name) {
    throw FWM_Error(GSL_EINVAL,
                    "both sweep axes control " + primary.name);
  }
  axes.push_back(primary);
  axes.push_back(secondary);
}

size_t Sweep_Specification::num_points() const {
  size_t n = 1;
  for (size_t a = 0; a < axes.size(); a++) n *= axes[a].values.size();
  return n;
}

system_parameters Sweep_Specification::point(size_t i, size_t j) const {
  system_parameters p = fixed;
  Sweep_Axis::apply(axes[0].name, axes[0].values.at(i), &p);
  if (axes.size() > 1) Sweep_Axis::apply(axes[1].name, axes[1].values.at(j), &p);
  return p;
}

// ****************************** Sweep_Result ******************************

sweep_metadata::sweep_metadata()
    : units("rad/s"), timestamp(""), unconverged_points(0) {}

Sweep_Result::Sweep_Result(string name, vector<double> set_values,
                           vector<gsl_complex> chi3,
                           vector<double> intensity,
                           map<string, double> set_fixed,
                           sweep_metadata set_metadata)
    : names(1, name), values(1, set_values), chi3_flat(chi3),
      intensity_flat(intensity), fixed(set_fixed), meta(set_metadata) {
  check_shape();
}

Sweep_Result::Sweep_Result(string name1, vector<double> values1,
                           string name2, vector<double> values2,
                           vector<vector<gsl_complex> > chi3,
                           vector<vector<double> > intensity,
                           map<string, double> set_fixed,
                           sweep_metadata set_metadata)
    : fixed(set_fixed), meta(set_metadata) {
  names.push_back(name1);
  names.push_back(name2);
  values.push_back(values1);
  values.push_back(values2);
  chi3_flat = flatten(chi3, values1.size(), values2.size(), "chi3");
  intensity_flat = flatten(intensity, values1.size(), values2.size(),
                           "intensity");
  check_shape();
}

Sweep_Result::Sweep_Result(const sweep_record &record)
    : names(record.parameter_names), values(record.parameter_values),
      chi3_flat(record.chi3), intensity_flat(record.intensity),
      fixed(record.fixed_parameters), meta(record.metadata) {
  check_shape();
}

void Sweep_Result::check_shape() const {
  if (names.empty() || names.size() > 2 || values.size() != names.size()) {
    throw FWM_Error(GSL_EBADLEN, "sweep results must be 1D or 2D");
  }
  if (names.size() == 2 && names[0] == names[1]) {
    throw FWM_Error(GSL_EINVAL, "both sweep axes are named " + names[0]);
  }
  size_t n = 1;
  for (size_t a = 0; a < values.size(); a++) {
    if (names[a].empty()) {
      throw FWM_Error(GSL_EINVAL, "sweep parameter has no name");
    }
    string canonical;
    if (!Sweep_Axis::canonical_name(names[a], &canonical)) {
      throw FWM_Error(GSL_EINVAL, "cannot sweep " + names[a]);
    }
    if (values[a].empty()) {
      throw FWM_Error(GSL_EBADLEN, "sweep of " + names[a] + " has no points");
    }
    n *= values[a].size();
  }
  if (chi3_flat.size() != n) {
    char buffer[128];
    snprintf(buffer, sizeof(buffer),
             "chi3 array has %zu values but the parameter grid has %zu",
             chi3_flat.size(), n);
    throw FWM_Error(GSL_EBADLEN, buffer);
  }
  if (intensity_flat.size() != n) {
    char buffer[128];
    snprintf(buffer, sizeof(buffer),
             "intensity array has %zu values but the parameter grid has %zu",
             intensity_flat.size(), n);
    throw FWM_Error(GSL_EBADLEN, buffer);
  }
}

vector<size_t> Sweep_Result::shape() const {
  vector<size_t> s;
  for (size_t a = 0; a < values.size(); a++) s.push_back(values[a].size());
  return s;
}

size_t Sweep_Result::flat_index(size_t i, size_t j) const {
  if (names.size() == 1) return i;
  return i*values[1].size() + j;
}

gsl_complex Sweep_Result::chi3(size_t i, size_t j) const {
  return chi3_flat.at(flat_index(i, j));
}

double Sweep_Result::intensity(size_t i, size_t j) const {
  return intensity_flat.at(flat_index(i, j));
}

sweep_record Sweep_Result::to_record() const {
  sweep_record record;
  record.parameter_names = names;
  record.parameter_values = values;
  record.chi3 = chi3_flat;
  record.intensity = intensity_flat;
  record.fixed_parameters = fixed;
  record.metadata = meta;
  return record;
}

// ***************************** FWM_Calculator *****************************

FWM_Calculator::FWM_Calculator(Bloch_Solver set_solver,
                               Susceptibility_Engine set_engine)
    : solver(set_solver), engine(set_engine) {}

void FWM_Calculator::check(const system_parameters &params) const {
  params.validate();
  if (!(params.probe_rabi > 0.0)) {
    throw FWM_Error(GSL_EINVAL, "probe Rabi frequency must be > 0");
  }
}

fwm_point FWM_Calculator::evaluate(const system_parameters &params) const {
  fwm_point point;
  point.state = solver.solve(params);
  point.chi1 = engine.linear_susceptibility(point.state.rho, params);
  point.chi3 = engine.third_order_susceptibility(point.state.rho, params);
  point.intensity = engine.fwm_intensity(point.chi3);
  return point;
}

// *************************** Sweep_Orchestrator ***************************

Sweep_Orchestrator::Sweep_Orchestrator(FWM_Calculator set_calculator)
    : calculator(set_calculator) {}

vector<fwm_point> Sweep_Orchestrator::evaluate_grid(
    const vector<system_parameters> &grid, int *unconverged) const {
  // Reject the whole sweep before any work is done
  for (size_t i = 0; i < grid.size(); i++) calculator.check(grid[i]);

  vector<fwm_point> points(grid.size());
  const int n = static_cast<int>(grid.size());
  // Each solve owns its root-finder state; nothing in the loop throws
  // because every point was checked above
#pragma omp parallel for schedule(dynamic)
  for (int i = 0; i < n; i++) {
    points[i] = calculator.evaluate(grid[i]);
  }

  int count = 0;
  for (size_t i = 0; i < points.size(); i++) {
    if (!points[i].state.converged) count++;
  }
  if (count > 0) {
    printf("WARNING: %d of %zu sweep points did not converge\n", count,
           points.size());
  }
  *unconverged = count;
  return points;
}

sweep_metadata Sweep_Orchestrator::make_metadata(int unconverged) const {
  sweep_metadata meta;
  time_t now = time(NULL);
  struct tm utc;
  gmtime_r(&now, &utc);
  char buffer[32];
  strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
  meta.timestamp = buffer;
  meta.unconverged_points = unconverged;
  return meta;
}

map<string, double> Sweep_Orchestrator::fixed_parameters(
    const Sweep_Specification &spec) const {
  map<string, double> fixed;
  const system_parameters &p = spec.fixed;
  fixed["pump_rabi"] = p.pump_rabi;
  fixed["probe_rabi"] = p.probe_rabi;
  fixed["pump_detuning"] = p.pump_detune;
  fixed["probe_detuning"] = p.probe_detune;
  fixed["ground_dephasing"] = p.ground_dephasing;
  fixed["optical_dephasing"] = p.optical_dephasing;
  fixed["gamma_e1"] = p.gamma_e1;
  fixed["gamma_e2"] = p.gamma_e2;

  const medium_parameters &m = calculator.engine.medium;
  fixed["number_density"] = m.number_density;
  fixed["dipole_moment"] = m.dipole_moment;
  fixed["pump_intensity"] = m.pump_intensity;
  fixed["probe_intensity"] = m.probe_intensity;
  fixed["interaction_length"] = m.interaction_length;
  fixed["signal_frequency"] = m.signal_frequency;
  fixed["regularization"] = m.regularization;

  for (size_t a = 0; a < spec.axes.size(); a++) fixed.erase(spec.axes[a].name);
  return fixed;
}

Sweep_Result Sweep_Orchestrator::sweep_1d(
    const Sweep_Specification &spec) const {
  if (spec.dimensions() != 1) {
    throw FWM_Error(GSL_EINVAL, "sweep_1d needs exactly one sweep axis");
  }
  const Sweep_Axis &axis = spec.axes[0];
  vector<system_parameters> grid;
  for (size_t i = 0; i < axis.values.size(); i++) grid.push_back(spec.point(i));

  int unconverged = 0;
  vector<fwm_point> points = evaluate_grid(grid, &unconverged);

  vector<gsl_complex> chi3(points.size());
  vector<double> intensity(points.size(), 0.0);
  for (size_t i = 0; i < points.size(); i++) {
    chi3[i] = points[i].chi3;
    intensity[i] = points[i].intensity;
  }
  if (fwm_verbose) {
    printf("Swept %s over %zu points\n", axis.name.c_str(), points.size());
  }
  return Sweep_Result(axis.name, axis.values, chi3, intensity,
                      fixed_parameters(spec), make_metadata(unconverged));
}

Sweep_Result Sweep_Orchestrator::sweep_2d(
    const Sweep_Specification &spec) const {
  if (spec.dimensions() != 2) {
    throw FWM_Error(GSL_EINVAL, "sweep_2d needs exactly two sweep axes");
  }
  const Sweep_Axis &first = spec.axes[0];
  const Sweep_Axis &second = spec.axes[1];
  const size_t n1 = first.values.size();
  const size_t n2 = second.values.size();

  // Row-major: grid[i*n2 + j] is (first[i], second[j])
  vector<system_parameters> grid;
  grid.reserve(n1*n2);
  for (size_t i = 0; i < n1; i++) {
    for (size_t j = 0; j < n2; j++) grid.push_back(spec.point(i, j));
  }

  int unconverged = 0;
  vector<fwm_point> points = evaluate_grid(grid, &unconverged);

  vector<vector<gsl_complex> > chi3(n1, vector<gsl_complex>(n2));
  vector<vector<double> > intensity(n1, vector<double>(n2, 0.0));
  for (size_t i = 0; i < n1; i++) {
    for (size_t j = 0; j < n2; j++) {
      chi3[i][j] = points[i*n2 + j].chi3;
      intensity[i][j] = points[i*n2 + j].intensity;
    }
  }
  if (fwm_verbose) {
    printf("Swept %s x %s over %zu x %zu points\n", first.name.c_str(),
           second.name.c_str(), n1, n2);
  }
  return Sweep_Result(first.name, first.values, second.name, second.values,
                      chi3, intensity, fixed_parameters(spec),
                      make_metadata(unconverged));
}

Sweep_Result Sweep_Orchestrator::run(const Sweep_Specification &spec) const {
  if (spec.dimensions() == 2) return sweep_2d(spec);
  return sweep_1d(spec);
}

Sweep_Result Sweep_Orchestrator::sweep_probe_detuning(
    system_parameters fixed, double min, double max, int num_points) const {
  Sweep_Axis axis = Sweep_Axis::linspace("probe_detuning", min, max,
                                         num_points);
  return sweep_1d(Sweep_Specification(fixed, axis));
}

Sweep_Result Sweep_Orchestrator::sweep_pump_rabi(
    system_parameters fixed, double min, double max, int num_points) const {
  Sweep_Axis axis = Sweep_Axis::linspace("pump_rabi", min, max, num_points);
  return sweep_1d(Sweep_Specification(fixed, axis));
}

Sweep_Result Sweep_Orchestrator::sweep_pump_detuning(
    system_parameters fixed, double min, double max, int num_points) const {
  Sweep_Axis axis = Sweep_Axis::linspace("pump_detuning", min, max,
                                         num_points);
  return sweep_1d(Sweep_Specification(fixed, axis));
}
