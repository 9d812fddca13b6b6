/**
 * @file test_parameter_sweep.cc
 * @brief Sweep axes, grid shapes and the orchestrated 1D/2D sweeps
 */

#include <gtest/gtest.h>
#include <math.h>
#include <string.h>
#include <map>
#include <string>
#include <vector>
#include <gsl/gsl_complex_math.h>
#include <gsl/gsl_errno.h>

#include "include/parameter_sweep.h"
#include "include/units.h"

class ParameterSweepTest : public ::testing::Test {
 protected:
  void SetUp() override {
    double gamma = 2.0*M_PI * 6.0666 * _MHz;
    fixed.pump_rabi = 2.0*M_PI * 10.0 * _MHz;
    fixed.probe_rabi = 2.0*M_PI * 1.0 * _MHz;
    fixed.gamma_e1 = gamma/2.0;
    fixed.gamma_e2 = gamma/2.0;
    fixed.ground_dephasing = 2.0*M_PI * 1.0 * _kHz;
  }

  Sweep_Orchestrator orchestrator() const {
    return Sweep_Orchestrator(FWM_Calculator(Bloch_Solver(),
                                             Susceptibility_Engine(medium)));
  }

  system_parameters fixed;
  medium_parameters medium;
};

// ============================================================================
// Axes and specifications
// ============================================================================

TEST_F(ParameterSweepTest, AxisNamesAreCanonical) {
  std::vector<double> v(3, 0.0);
  v[1] = 1.0;
  v[2] = 2.0;
  EXPECT_EQ(Sweep_Axis("Probe_Detuning", v).name, "probe_detuning");
  EXPECT_EQ(Sweep_Axis(" coupling_detuning ", v).name, "pump_detuning");
  EXPECT_EQ(Sweep_Axis("pump_rabi_frequency", v).name, "pump_rabi");
  EXPECT_THROW(Sweep_Axis("magnetic_field", v), FWM_Error);
}

TEST_F(ParameterSweepTest, AxisValuesChecked) {
  EXPECT_THROW(Sweep_Axis("probe_detuning", std::vector<double>()),
               FWM_Error);
  std::vector<double> repeated(3, 1.0);
  EXPECT_THROW(Sweep_Axis("probe_detuning", repeated), FWM_Error);
  std::vector<double> zigzag(3, 0.0);
  zigzag[1] = 2.0;
  zigzag[2] = 1.0;
  EXPECT_THROW(Sweep_Axis("probe_detuning", zigzag), FWM_Error);
  // Falling is fine
  std::vector<double> falling(3, 3.0);
  falling[1] = 2.0;
  falling[2] = 1.0;
  EXPECT_NO_THROW(Sweep_Axis("probe_detuning", falling));
}

TEST_F(ParameterSweepTest, LinspaceEndpoints) {
  Sweep_Axis axis = Sweep_Axis::linspace("pump_rabi", 1.0, 3.0, 5);
  ASSERT_EQ(axis.values.size(), 5u);
  EXPECT_EQ(axis.values.front(), 1.0);
  EXPECT_EQ(axis.values.back(), 3.0);
  EXPECT_DOUBLE_EQ(axis.values[2], 2.0);
  EXPECT_THROW(Sweep_Axis::linspace("pump_rabi", 1.0, 3.0, 0), FWM_Error);

  // (max - min) * i / (n - 1) does not land on max for these
  const double lo = 0.1, hi = 0.7;
  for (int n = 2; n <= 200; n++) {
    Sweep_Axis a = Sweep_Axis::linspace("probe_detuning", lo, hi, n);
    EXPECT_EQ(a.values.front(), lo) << "n = " << n;
    EXPECT_EQ(a.values.back(), hi) << "n = " << n;
  }
  Sweep_Axis d = Sweep_Axis::linspace("pump_detuning",
                                      -2.0*M_PI * 20.0 * _MHz,
                                      2.0*M_PI * 13.3 * _MHz, 37);
  EXPECT_EQ(d.values.back(), 2.0*M_PI * 13.3 * _MHz);
}

TEST_F(ParameterSweepTest, DuplicateAxesRejected) {
  Sweep_Axis a = Sweep_Axis::linspace("pump_detuning", -1.0, 1.0, 3);
  Sweep_Axis b = Sweep_Axis::linspace("coupling_detuning", -1.0, 1.0, 3);
  EXPECT_THROW(Sweep_Specification(fixed, a, b), FWM_Error);
}

TEST_F(ParameterSweepTest, SpecificationPoints) {
  Sweep_Axis a = Sweep_Axis::linspace("pump_rabi", 1.0, 2.0, 2);
  Sweep_Axis b = Sweep_Axis::linspace("probe_detuning", -5.0, 5.0, 3);
  Sweep_Specification spec(fixed, a, b);
  EXPECT_EQ(spec.dimensions(), 2);
  EXPECT_EQ(spec.num_points(), 6u);
  system_parameters p = spec.point(1, 2);
  EXPECT_EQ(p.pump_rabi, 2.0);
  EXPECT_EQ(p.probe_detune, 5.0);
  EXPECT_EQ(p.probe_rabi, fixed.probe_rabi);
}

// ============================================================================
// Results
// ============================================================================

TEST_F(ParameterSweepTest, ResultShapeMismatch) {
  std::vector<double> v1(25), v2(20);
  for (int i = 0; i < 25; i++) v1[i] = i;
  for (int j = 0; j < 20; j++) v2[j] = j;
  std::vector<std::vector<gsl_complex> > chi3(
      25, std::vector<gsl_complex>(20, gsl_complex_rect(0.0, 0.0)));
  std::vector<std::vector<double> > good(25, std::vector<double>(20, 0.0));
  std::vector<std::vector<double> > bad(25, std::vector<double>(19, 0.0));
  std::map<std::string, double> none;

  Sweep_Result ok("pump_rabi", v1, "probe_detuning", v2, chi3, good, none,
                  sweep_metadata());
  ASSERT_EQ(ok.shape().size(), 2u);
  EXPECT_EQ(ok.shape()[0], 25u);
  EXPECT_EQ(ok.shape()[1], 20u);

  try {
    Sweep_Result wrong("pump_rabi", v1, "probe_detuning", v2, chi3, bad, none,
                       sweep_metadata());
    FAIL() << "(25, 19) intensity accepted on a (25, 20) grid";
  }
  catch (const FWM_Error &e) {
    EXPECT_EQ(e.code(), GSL_EBADLEN);
    EXPECT_TRUE(strstr(e.what(), "(25, 19)") != NULL) << e.what();
    EXPECT_TRUE(strstr(e.what(), "(25, 20)") != NULL) << e.what();
  }

  std::vector<gsl_complex> short_chi3(24, gsl_complex_rect(0.0, 0.0));
  std::vector<double> intensity(25, 0.0);
  EXPECT_THROW(Sweep_Result("pump_rabi", v1, short_chi3, intensity, none,
                            sweep_metadata()),
               FWM_Error);
}

TEST_F(ParameterSweepTest, ResultNamesMustBeSweepable) {
  std::vector<double> v(3, 0.0);
  std::vector<gsl_complex> chi3(3, gsl_complex_rect(0.0, 0.0));
  std::map<std::string, double> none;

  sweep_record record;
  record.parameter_names.push_back("magnetic_field");
  record.parameter_values.push_back(v);
  record.chi3 = chi3;
  record.intensity = v;
  try {
    Sweep_Result r(record);
    FAIL() << "accepted a result swept over magnetic_field";
  }
  catch (const FWM_Error &e) {
    EXPECT_EQ(e.code(), GSL_EINVAL);
    EXPECT_TRUE(strstr(e.what(), "magnetic_field") != NULL) << e.what();
  }

  EXPECT_THROW(Sweep_Result("laser_power", v, chi3, v, none,
                            sweep_metadata()),
               FWM_Error);
  EXPECT_NO_THROW(Sweep_Result("probe_detuning", v, chi3, v, none,
                               sweep_metadata()));
}

TEST_F(ParameterSweepTest, OneDimensionalSweep) {
  Sweep_Result r = orchestrator().sweep_probe_detuning(
      fixed, -2.0*M_PI * 20.0 * _MHz, 2.0*M_PI * 20.0 * _MHz, 41);
  EXPECT_EQ(r.dimensions(), 1);
  EXPECT_EQ(r.num_points(), 41u);
  EXPECT_EQ(r.parameter_name(), "probe_detuning");
  EXPECT_EQ(r.metadata().units, "rad/s");
  EXPECT_EQ(r.metadata().unconverged_points, 0);
  EXPECT_EQ(r.metadata().timestamp.size(), 20u);   // 2013-01-01T00:00:00Z
  for (size_t i = 0; i < r.num_points(); i++) {
    EXPECT_GE(r.intensity(i), 0.0);
  }
}

TEST_F(ParameterSweepTest, PumpRabiSweep) {
  const double lo = 2.0*M_PI * 1.0 * _MHz, hi = 2.0*M_PI * 12.0 * _MHz;
  Sweep_Result r = orchestrator().sweep_pump_rabi(fixed, lo, hi, 12);
  EXPECT_EQ(r.dimensions(), 1);
  EXPECT_EQ(r.parameter_name(), "pump_rabi");
  ASSERT_EQ(r.num_points(), 12u);
  EXPECT_EQ(r.parameter_values().front(), lo);
  EXPECT_EQ(r.parameter_values().back(), hi);
  EXPECT_EQ(r.fixed_parameters().count("pump_rabi"), 0u);
  ASSERT_EQ(r.fixed_parameters().count("probe_rabi"), 1u);
  EXPECT_EQ(r.fixed_parameters().find("pump_detuning")->second,
            fixed.pump_detune);
  EXPECT_EQ(r.metadata().unconverged_points, 0);
  for (size_t i = 0; i < r.num_points(); i++) {
    EXPECT_GE(r.intensity(i), 0.0) << "point " << i;
  }
}

TEST_F(ParameterSweepTest, PumpDetuningSweep) {
  const double span = 2.0*M_PI * 15.0 * _MHz;
  Sweep_Result r = orchestrator().sweep_pump_detuning(fixed, -span, span, 31);
  EXPECT_EQ(r.dimensions(), 1);
  EXPECT_EQ(r.parameter_name(), "pump_detuning");
  ASSERT_EQ(r.num_points(), 31u);
  EXPECT_EQ(r.parameter_values().front(), -span);
  EXPECT_EQ(r.parameter_values().back(), span);
  EXPECT_EQ(r.fixed_parameters().count("pump_detuning"), 0u);
  ASSERT_EQ(r.fixed_parameters().count("pump_rabi"), 1u);
  EXPECT_EQ(r.fixed_parameters().find("pump_rabi")->second, fixed.pump_rabi);
  EXPECT_EQ(r.metadata().unconverged_points, 0);
  for (size_t i = 0; i < r.num_points(); i++) {
    EXPECT_GE(r.intensity(i), 0.0) << "point " << i;
  }
}

TEST_F(ParameterSweepTest, TwoDimensionalSweepShape) {
  Sweep_Axis rabi = Sweep_Axis::linspace("pump_rabi", 2.0*M_PI * 1.0 * _MHz,
                                         2.0*M_PI * 10.0 * _MHz, 25);
  Sweep_Axis detune = Sweep_Axis::linspace(
      "probe_detuning", -2.0*M_PI * 10.0 * _MHz, 2.0*M_PI * 10.0 * _MHz, 20);
  Sweep_Result r = orchestrator().run(Sweep_Specification(fixed, rabi,
                                                          detune));
  EXPECT_EQ(r.dimensions(), 2);
  ASSERT_EQ(r.shape().size(), 2u);
  EXPECT_EQ(r.shape()[0], 25u);
  EXPECT_EQ(r.shape()[1], 20u);
  EXPECT_EQ(r.chi3_values().size(), 500u);
  EXPECT_EQ(r.parameter_name(0), "pump_rabi");
  EXPECT_EQ(r.parameter_name(1), "probe_detuning");
}

TEST_F(ParameterSweepTest, SweepIsDeterministic) {
  Sweep_Axis rabi = Sweep_Axis::linspace("pump_rabi", 2.0*M_PI * 2.0 * _MHz,
                                         2.0*M_PI * 8.0 * _MHz, 4);
  Sweep_Axis detune = Sweep_Axis::linspace(
      "probe_detuning", -2.0*M_PI * 5.0 * _MHz, 2.0*M_PI * 5.0 * _MHz, 5);
  Sweep_Specification spec(fixed, rabi, detune);
  Sweep_Result a = orchestrator().sweep_2d(spec);
  Sweep_Result b = orchestrator().sweep_2d(spec);
  for (size_t i = 0; i < a.num_points(); i++) {
    gsl_complex d = gsl_complex_sub(a.chi3_values()[i], b.chi3_values()[i]);
    double scale = gsl_complex_abs(a.chi3_values()[i]);
    EXPECT_LE(gsl_complex_abs(d), 1e-10 * scale) << "point " << i;
    EXPECT_LE(fabs(a.intensity_values()[i] - b.intensity_values()[i]),
              1e-10 * a.intensity_values()[i]) << "point " << i;
  }
}

TEST_F(ParameterSweepTest, FixedParametersExcludeSweptOnes) {
  Sweep_Axis rabi = Sweep_Axis::linspace("pump_rabi", 1.0e6, 2.0e6, 2);
  Sweep_Specification spec(fixed, rabi);
  std::map<std::string, double> f = orchestrator().fixed_parameters(spec);
  EXPECT_EQ(f.count("pump_rabi"), 0u);
  ASSERT_EQ(f.count("probe_rabi"), 1u);
  EXPECT_EQ(f["probe_rabi"], fixed.probe_rabi);
  EXPECT_EQ(f.count("number_density"), 1u);
  EXPECT_EQ(f.count("regularization"), 1u);
}

TEST_F(ParameterSweepTest, WholeSweepRejectedBeforeSolving) {
  // A zero probe Rabi frequency somewhere in the grid
  Sweep_Axis probe = Sweep_Axis::linspace("probe_rabi", 0.0, 1.0e6, 3);
  EXPECT_THROW(orchestrator().sweep_1d(Sweep_Specification(fixed, probe)),
               FWM_Error);
  EXPECT_THROW(orchestrator().sweep_2d(Sweep_Specification(fixed, probe)),
               FWM_Error);
}
