// report.h
// Plain-text reports of Benders and extensive-form runs

#ifndef SFLP_REPORT_H
#define SFLP_REPORT_H

#include <ostream>

#include "benders.h"
#include "extensive.h"
#include "instance.h"

void print_report(std::ostream &out, const ModelData &data, const BendersResult &res, bool print_allocation = false);
void print_report(std::ostream &out, const ModelData &data, const ExtensiveResult &res, bool print_allocation = false);

#endif // SFLP_REPORT_H
