// Authors: Benjamin Fenker 2013


#include <stdio.h>
#include <stdlib.h>
#include <cstring>
#include "include/four_wave_mixing.h"
#include "include/fwm_parameters.h"
#include "include/units.h"

using std::string;

extern bool fwm_verbose;

int main(int argc, char* argv[]) {
  fwm_parameters params;
  // Also will accept command line input
  if (argc > 1) {
    if (strcmp(argv[1], "-h") == 0) {
      printf("Run this program with from an input file or a command line:\n");
      printf("To run from a file do: fourWaveMixing -f fileName\n\n");
      printf("To run from the command line, give a list of parameters:\n");
      printf("First paramter is isotope (Rb87, Rb85) [%s]\n",
             params.isotope.c_str());
      printf("Second parameter is Je2 (1 for D1 line, 3 for D2 line) [%d]\n",
             params.Je2);
      printf("Third parameter is pump Rabi frequency in 2pi MHz [%3.1G]\n",
             params.pump_rabi/_2pi_MHz);
      printf("Fourth parameter is probe Rabi frequency in 2pi MHz [%3.1G]\n",
             params.probe_rabi/_2pi_MHz);
      printf("Fifth parameter is pump detuning in 2pi MHz [%3.1G]\n",
             params.pump_detune/_2pi_MHz);
      printf("Sixth parameter is output file [%s]\n",
             params.out_file.c_str());
      printf("\nThe probe detuning is swept from %g to %g 2pi MHz\n",
             params.sweep_min/_2pi_MHz, params.sweep_max/_2pi_MHz);
      printf("Write an input file with every option to see the rest\n\n");
      return 0;
    } else if (strcmp(argv[1], "-f") == 0) {  // accept input from file
      if (argc == 2) {                        // No file name given
        printf("File name required with -f option.\n");
        printf("fourWaveMixing -f in.in\n");
        exit(1);
      }
      if (params.ReadFromFile(argv[2]) != input_success) exit(1);
    } else {
      if (params.ReadFromCommandLine(argc, argv) != input_success) exit(1);
    }
  }

  fwm_verbose = (params.verbosity > 0);
  FourWaveMixing mixer;
  int status = mixer.run(params);

  printf("\nCompleted with status = %d\n\n", status);
  return status;
}
