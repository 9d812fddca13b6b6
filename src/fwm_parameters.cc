// Authors: Benjamin Fenker 2013
// Copyright 2013 Benjamin Fenker

#include <stdio.h>
#include <stdlib.h>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

// boost includes
#include <boost/algorithm/string.hpp>

#include "include/fwm_parameters.h"
#include "include/rubidium.h"
#include "include/units.h"

using std::string;

namespace {
bool ReadDouble(const string &word, double *value) {
  try {
    size_t used = 0;
    *value = std::stod(word, &used);
    return used == word.size();
  }
  catch (const std::invalid_argument &) {
    return false;
  }
  catch (const std::out_of_range &) {
    return false;
  }
}

bool ReadInt(const string &word, int *value) {
  try {
    size_t used = 0;
    *value = std::stoi(word, &used);
    return used == word.size();
  }
  catch (const std::invalid_argument &) {
    return false;
  }
  catch (const std::out_of_range &) {
    return false;
  }
}
}  // namespace

fwm_parameters::fwm_parameters()
    : out_file("fwmData.csv"),
      isotope("Rb87"),
      Je2(3),
      Fg1_2(2), Fg2_2(4), Fe2(4),
      pump_rabi(10.0 * _2pi_MHz), probe_rabi(1.0 * _2pi_MHz),
      pump_detune(0.0), probe_detune(0.0),
      ground_dephasing(0.001 * _2pi_MHz), optical_dephasing(0.0),
      rabi_from_intensity(false),
      pump_intensity(100.0 * _mW/_cm2), probe_intensity(10.0 * _mW/_cm2),
      number_density(1.0e11 / _cm3),
      interaction_length(1.0 * _cm),
      regularization(1.0e-6),
      sweep("probe_detuning"),
      sweep_min(-20.0 * _2pi_MHz), sweep_max(20.0 * _2pi_MHz),
      sweep_points(101),
      sweep2("none"),
      sweep2_min(-20.0 * _2pi_MHz), sweep2_max(20.0 * _2pi_MHz),
      sweep2_points(21),
      tolerance(1.0e-6),
      max_iterations(1000),
      max_seconds(10.0),
      verbosity(0),
      levels_given(false) {}

int fwm_parameters::SetValue(string key, string value) {
  boost::algorithm::to_lower(key);
  double d = 0.0;
  int i = 0;
  bool ok = true;

  if (key == "file") {
    out_file = value;
  } else if (key == "isotope") {
    isotope = value;
  } else if (key == "sweep") {
    sweep = value;
  } else if (key == "sweep2") {
    boost::algorithm::to_lower(value);
    sweep2 = value;
  } else if (key == "je2" || key == "fg1_2" || key == "fg2_2" ||
             key == "fe2" || key == "sweep_points" ||
             key == "sweep2_points" || key == "max_iterations" ||
             key == "verbosity" || key == "rabi_from_intensity") {
    ok = ReadInt(value, &i);
    if (ok) {
      if (key == "je2") Je2 = i;
      if (key == "fg1_2") Fg1_2 = i;
      if (key == "fg2_2") Fg2_2 = i;
      if (key == "fe2") Fe2 = i;
      if (key == "sweep_points") sweep_points = i;
      if (key == "sweep2_points") sweep2_points = i;
      if (key == "max_iterations") max_iterations = i;
      if (key == "verbosity") verbosity = i;
      if (key == "rabi_from_intensity") rabi_from_intensity = (i != 0);
      if (key == "fg1_2" || key == "fg2_2" || key == "fe2") {
        levels_given = true;
      }
    }
  } else {
    ok = ReadDouble(value, &d);
    if (!ok) return input_bad_value;
    // Have to get the units right!
    if (key == "pump_rabi") {
      pump_rabi = d * _2pi_MHz;
    } else if (key == "probe_rabi") {
      probe_rabi = d * _2pi_MHz;
    } else if (key == "pump_detune") {
      pump_detune = d * _2pi_MHz;
    } else if (key == "probe_detune") {
      probe_detune = d * _2pi_MHz;
    } else if (key == "ground_dephasing") {
      ground_dephasing = d * _2pi_MHz;
    } else if (key == "optical_dephasing") {
      optical_dephasing = d * _2pi_MHz;
    } else if (key == "pump_intensity") {
      pump_intensity = d * _mW/_cm2;
    } else if (key == "probe_intensity") {
      probe_intensity = d * _mW/_cm2;
    } else if (key == "number_density") {
      number_density = d / _cm3;
    } else if (key == "interaction_length") {
      interaction_length = d * _cm;
    } else if (key == "regularization") {
      regularization = d;
    } else if (key == "sweep_min") {
      sweep_min = d * _2pi_MHz;
    } else if (key == "sweep_max") {
      sweep_max = d * _2pi_MHz;
    } else if (key == "sweep2_min") {
      sweep2_min = d * _2pi_MHz;
    } else if (key == "sweep2_max") {
      sweep2_max = d * _2pi_MHz;
    } else if (key == "tolerance") {
      tolerance = d;
    } else if (key == "max_seconds") {
      max_seconds = d * _s;
    } else {
      return input_unknown_key;
    }
  }
  return ok ? input_success : input_bad_value;
}

int fwm_parameters::FinishLambda() {
  if (levels_given) return input_success;
  Rubidium rb;
  if (rb.defaultLambda(isotope, &Fg1_2, &Fg2_2, &Fe2) != 0) {
    printf("Unknown isotope %s\n", isotope.c_str());
    return input_bad_value;
  }
  return input_success;
}

int fwm_parameters::ReadFromFile(string fname) {
  std::ifstream ifs(fname.c_str(), std::ifstream::in);
  if (!ifs.is_open()) {
    printf("File %s does not exist\n", fname.c_str());
    return input_bad_file;
  }

  string line;
  std::vector<string> word;
  int line_number = 0;
  while (std::getline(ifs, line)) {
    line_number++;
    size_t comment = line.find('#');
    if (comment != string::npos) line.erase(comment);
    boost::algorithm::trim(line);
    if (line.empty()) continue;

    boost::split(word, line, boost::is_any_of(" \t"),
                 boost::token_compress_on);
    if (word.size() != 2) {
      std::cout << "Expected 'key value' on line " << line_number << " of "
                << fname << std::endl;
      return input_bad_value;
    }
    int status = SetValue(word[0], word[1]);
    if (status == input_unknown_key) {
      std::cout << "Unexpected line in input file: " << line << std::endl;
      return status;
    }
    if (status != input_success) {
      std::cout << "Could not read value for " << word[0] << " in file "
                << fname << std::endl;
      return status;
    }
  }
  ifs.close();
  return FinishLambda();
}

int fwm_parameters::ReadFromCommandLine(int argc, char* argv[]) {
  const char *keys[] = {"isotope", "Je2", "pump_rabi", "probe_rabi",
                        "pump_detune", "file"};
  const int num_keys = 6;
  if (argc - 1 > num_keys) {
    printf("Too many arguments (%d).  fourWaveMixing -h for help\n",
           argc - 1);
    return input_bad_value;
  }
  for (int a = 1; a < argc; a++) {
    int status = SetValue(keys[a-1], argv[a]);
    if (status != input_success) {
      printf("Could not read %s from '%s'\n", keys[a-1], argv[a]);
      return status;
    }
  }
  return FinishLambda();
}

int fwm_parameters::PrintToFile(string fname) const {
  FILE *file = fopen(fname.c_str(), "w");
  if (file == NULL) {
    printf("Could not open %s for writing\n", fname.c_str());
    return input_bad_file;
  }

  fprintf(file, "file %s\n", out_file.c_str());
  fprintf(file, "isotope %s\n", isotope.c_str());
  fprintf(file, "Je2 %d\n", Je2);
  fprintf(file, "Fg1_2 %d\n", Fg1_2);
  fprintf(file, "Fg2_2 %d\n", Fg2_2);
  fprintf(file, "Fe2 %d\n", Fe2);
  fprintf(file, "pump_rabi %.17g\n", pump_rabi/_2pi_MHz);
  fprintf(file, "probe_rabi %.17g\n", probe_rabi/_2pi_MHz);
  fprintf(file, "pump_detune %.17g\n", pump_detune/_2pi_MHz);
  fprintf(file, "probe_detune %.17g\n", probe_detune/_2pi_MHz);
  fprintf(file, "ground_dephasing %.17g\n", ground_dephasing/_2pi_MHz);
  fprintf(file, "optical_dephasing %.17g\n", optical_dephasing/_2pi_MHz);
  fprintf(file, "rabi_from_intensity %d\n", rabi_from_intensity ? 1 : 0);
  fprintf(file, "pump_intensity %.17g\n", pump_intensity/(_mW/_cm2));
  fprintf(file, "probe_intensity %.17g\n", probe_intensity/(_mW/_cm2));
  fprintf(file, "number_density %.17g\n", number_density*_cm3);
  fprintf(file, "interaction_length %.17g\n", interaction_length/_cm);
  fprintf(file, "regularization %.17g\n", regularization);
  fprintf(file, "sweep %s\n", sweep.c_str());
  fprintf(file, "sweep_min %.17g\n", sweep_min/_2pi_MHz);
  fprintf(file, "sweep_max %.17g\n", sweep_max/_2pi_MHz);
  fprintf(file, "sweep_points %d\n", sweep_points);
  fprintf(file, "sweep2 %s\n", sweep2.c_str());
  fprintf(file, "sweep2_min %.17g\n", sweep2_min/_2pi_MHz);
  fprintf(file, "sweep2_max %.17g\n", sweep2_max/_2pi_MHz);
  fprintf(file, "sweep2_points %d\n", sweep2_points);
  fprintf(file, "tolerance %.17g\n", tolerance);
  fprintf(file, "max_iterations %d\n", max_iterations);
  fprintf(file, "max_seconds %.17g\n", max_seconds/_s);
  fprintf(file, "verbosity %d\n", verbosity);
  fprintf(file, "\n");
  fprintf(file, "# Units are 2pi MHz, mW/cm^2, cm^-3 and cm where appropriate\n");
  fprintf(file, "# Rabi frequencies are replaced by values computed from the\n");
  fprintf(file, "# intensities when rabi_from_intensity is 1\n");

  int status = (fclose(file) == 0) ? input_success : input_bad_file;
  return status;
}
