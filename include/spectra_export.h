// Author: Benjamin Fenker
#ifndef INCLUDE_SPECTRA_EXPORT_H_
#define INCLUDE_SPECTRA_EXPORT_H_

// Purpose: To write sweep results to disk in a form that can be plotted
// directly and read back without losing any precision.

#include <string>

#include "./parameter_sweep.h"

namespace FWMExport {
enum status {
  success = 0,
  bad_file = 1,
  read_error = 2,
  bad_shape = 3
};

// Return value: Status (0 = success, anything else = failure)

// result: Sweep to write.
// fname: Output file.  Metadata goes in '#' comment lines at the top, then a
// header line and one row per grid point (row-major for 2D sweeps) with
// columns
//   param [param2] chi3_real chi3_imag chi3_magnitude chi3_phase fwm_intensity
// separated by commas.  Numbers are written with 17 significant digits so
// that reading them back gives identical doubles.
int WriteCSV(const Sweep_Result &result, std::string fname);

// Return value: Status (0 = success, anything else = failure)

// fname: File written by WriteCSV
// record: Filled with the contents of the file.  The magnitude and phase
// columns are redundant and ignored.  Construct a Sweep_Result from it to
// check the shapes.
int ReadCSV(std::string fname, sweep_record *record);
}  // namespace FWMExport

#endif  // INCLUDE_SPECTRA_EXPORT_H_
