// Author: Benjamin Fenker
#include <stdio.h>
#include <exception>
#include <fstream>
#include <map>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <gsl/gsl_complex.h>
#include <gsl/gsl_complex_math.h>

// boost includes
#include <boost/algorithm/string.hpp>

#include "include/spectra_export.h"

namespace {
bool ToDouble(const std::string &word, double *value) {
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

bool ToSize(const std::string &word, size_t *value) {
  double d = 0.0;
  if (!ToDouble(word, &d) || d < 0.0) return false;
  *value = static_cast<size_t>(d);
  return static_cast<double>(*value) == d;
}
}  // namespace

int FWMExport::WriteCSV(const Sweep_Result &result, std::string fname) {
  FILE *file = fopen(fname.c_str(), "w");
  if (file == NULL) {
    std::cout << "Could not open " << fname << " for writing" << std::endl;
    return bad_file;
  }
  const int dims = result.dimensions();
  const sweep_metadata &meta = result.metadata();
  std::vector<size_t> shape = result.shape();

  fprintf(file, "# sweep_type %dD\n", dims);
  fprintf(file, "# shape");
  for (size_t a = 0; a < shape.size(); a++) fprintf(file, " %zu", shape[a]);
  fprintf(file, "\n");
  for (int a = 0; a < dims; a++) {
    fprintf(file, "# parameter %s\n", result.parameter_name(a).c_str());
  }
  fprintf(file, "# units %s\n", meta.units.c_str());
  fprintf(file, "# timestamp %s\n", meta.timestamp.c_str());
  fprintf(file, "# unconverged_points %d\n", meta.unconverged_points);
  const std::map<std::string, double> &fixed = result.fixed_parameters();
  for (std::map<std::string, double>::const_iterator it = fixed.begin();
       it != fixed.end(); ++it) {
    fprintf(file, "# fixed %s %.17g\n", it->first.c_str(), it->second);
  }

  for (int a = 0; a < dims; a++) {
    fprintf(file, "%s,", result.parameter_name(a).c_str());
  }
  fprintf(file, "chi3_real,chi3_imag,chi3_magnitude,chi3_phase,");
  fprintf(file, "fwm_intensity\n");

  const size_t n1 = shape[0];
  const size_t n2 = (dims == 2) ? shape[1] : 1;
  for (size_t i = 0; i < n1; i++) {
    for (size_t j = 0; j < n2; j++) {
      fprintf(file, "%.17g,", result.parameter_values(0)[i]);
      if (dims == 2) fprintf(file, "%.17g,", result.parameter_values(1)[j]);
      gsl_complex chi3 = result.chi3(i, j);
      fprintf(file, "%.17g,%.17g,%.17g,%.17g,%.17g\n", GSL_REAL(chi3),
              GSL_IMAG(chi3), gsl_complex_abs(chi3), gsl_complex_arg(chi3),
              result.intensity(i, j));
    }
  }
  int status = (fclose(file) == 0) ? success : bad_file;
  return status;
}

int FWMExport::ReadCSV(std::string fname, sweep_record *record) {
  std::ifstream ifs(fname.c_str(), std::ifstream::in);
  if (!ifs.is_open()) {
    return bad_file;
  }

  sweep_record rec;
  int dims = 0;
  std::vector<size_t> shape;
  bool header_seen = false;
  std::vector<std::vector<double> > rows;

  std::string line;
  std::vector<std::string> word;
  while (std::getline(ifs, line)) {
    boost::algorithm::trim(line);
    if (line.empty()) continue;

    if (line[0] == '#') {
      line.erase(0, 1);
      boost::algorithm::trim(line);
      boost::split(word, line, boost::is_any_of(" \t"),
                   boost::token_compress_on);
      const std::string &key = word[0];
      std::string value = (word.size() > 1) ? word[1] : "";
      if (key == "sweep_type") {
        if (value == "1D") {
          dims = 1;
        } else if (value == "2D") {
          dims = 2;
        } else {
          std::cout << "Unknown sweep type " << value << " in " << fname
                    << std::endl;
          return read_error;
        }
      } else if (key == "shape") {
        for (size_t w = 1; w < word.size(); w++) {
          size_t n = 0;
          if (!ToSize(word[w], &n)) {
            std::cout << "Bad shape in file " << fname << std::endl;
            return read_error;
          }
          shape.push_back(n);
        }
      } else if (key == "parameter") {
        rec.parameter_names.push_back(value);
      } else if (key == "units") {
        rec.metadata.units = value;
      } else if (key == "timestamp") {
        rec.metadata.timestamp = value;
      } else if (key == "unconverged_points") {
        size_t n = 0;
        if (!ToSize(value, &n)) {
          std::cout << "Error converting to int in file " << fname
                    << std::endl;
          return read_error;
        }
        rec.metadata.unconverged_points = static_cast<int>(n);
      } else if (key == "fixed") {
        double v = 0.0;
        if (word.size() != 3 || !ToDouble(word[2], &v)) {
          std::cout << "Bad fixed parameter line in file " << fname
                    << std::endl;
          return read_error;
        }
        rec.fixed_parameters[word[1]] = v;
      }
      continue;
    }

    boost::split(word, line, boost::is_any_of(","));
    if (!header_seen) {
      // Column names.  Only the count is checked
      header_seen = true;
      if (dims == 0 || word.size() != static_cast<size_t>(dims) + 5) {
        std::cout << "Unexpected header in file " << fname << std::endl;
        return read_error;
      }
      continue;
    }
    if (word.size() != static_cast<size_t>(dims) + 5) {
      std::cout << "Wrong number of columns in file " << fname << std::endl;
      return read_error;
    }
    std::vector<double> row(word.size(), 0.0);
    for (size_t w = 0; w < word.size(); w++) {
      boost::algorithm::trim(word[w]);
      if (!ToDouble(word[w], &row[w])) {
        std::cout << "Error converting to double in file " << fname
                  << std::endl;
        return read_error;
      }
    }
    rows.push_back(row);
  }
  ifs.close();

  if (dims == 0 || shape.size() != static_cast<size_t>(dims) ||
      rec.parameter_names.size() != static_cast<size_t>(dims)) {
    std::cout << "Missing metadata in file " << fname << std::endl;
    return read_error;
  }
  const size_t n1 = shape[0];
  const size_t n2 = (dims == 2) ? shape[1] : 1;
  if (n1 == 0 || n2 == 0 || rows.size() != n1*n2) {
    std::cout << "Expected " << n1*n2 << " rows in " << fname << " but found "
              << rows.size() << std::endl;
    return bad_shape;
  }

  // Rebuild the axes from the first column(s) and make sure every row sits
  // on the grid
  rec.parameter_values.assign(dims, std::vector<double>());
  for (size_t i = 0; i < n1; i++) {
    rec.parameter_values[0].push_back(rows[i*n2][0]);
  }
  if (dims == 2) {
    for (size_t j = 0; j < n2; j++) rec.parameter_values[1].push_back(rows[j][1]);
  }
  for (size_t i = 0; i < n1; i++) {
    for (size_t j = 0; j < n2; j++) {
      const std::vector<double> &row = rows[i*n2 + j];
      bool on_grid = (row[0] == rec.parameter_values[0][i]);
      if (dims == 2) on_grid = on_grid && (row[1] == rec.parameter_values[1][j]);
      if (!on_grid) {
        std::cout << "Row " << i*n2 + j << " of " << fname
                  << " is not on the parameter grid" << std::endl;
        return bad_shape;
      }
      rec.chi3.push_back(gsl_complex_rect(row[dims], row[dims + 1]));
      rec.intensity.push_back(row[dims + 4]);
    }
  }

  *record = rec;
  return success;
}
