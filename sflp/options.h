// options.h
// Command-line options of the sflp_benders driver

#ifndef SFLP_OPTIONS_H
#define SFLP_OPTIONS_H

#include "benders.h"

struct Options
{
    BendersOptions benders;
    bool extensive = false;
    bool print_allocation = false;
};

// argv[1] is the instance path; options start at argv[2].
// Throws std::runtime_error on unknown flags or missing values.
Options parse_opts(int argc, char **argv);

#endif // SFLP_OPTIONS_H
