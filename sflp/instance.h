// instance.h
// Two-stage stochastic facility location instance

#ifndef SFLP_INSTANCE_H
#define SFLP_INSTANCE_H

#include <istream>
#include <string>
#include <vector>

#include "utils.h"

struct Facility
{
    std::string id;
    double fixed_cost{0.0};
    double capacity{0.0};
};

struct Customer
{
    std::string id;
};

struct Scenario
{
    std::string id;
    double probability{0.0};
    std::vector<double> demand; // one entry per customer
};

//
// Instance of the stochastic facility location problem.
// Read-only once the Benders loop starts.
//
class ModelData
{
public:
    // tolerance used for the probability sum and the capacity check
    static constexpr double TOL = 1e-6;
    // largest nF, nC or nS accepted from a file
    static constexpr double MAX_DIM = 1e6;

    std::vector<Facility> facilities;
    std::vector<Customer> customers;
    std::vector<Scenario> scenarios;

    std::vector<double> variable_cost; // c_ij (nF*nC)
    std::vector<int> eligible;         // a_ij in {0,1} (nF*nC); empty = complete bipartite graph

    int num_facilities() const { return static_cast<int>(facilities.size()); }
    int num_customers() const { return static_cast<int>(customers.size()); }
    int num_scenarios() const { return static_cast<int>(scenarios.size()); }

    std::vector<int> F() const { return range_int(num_facilities()); }
    std::vector<int> C() const { return range_int(num_customers()); }
    std::vector<int> S() const { return range_int(num_scenarios()); }

    inline double cost(int i, int j) const { return variable_cost[idx2(i, j, customers.size())]; }
    inline double demand(int j, int s) const { return scenarios[s].demand[j]; }
    inline bool allowed(int i, int j) const
    {
        return eligible.empty() || eligible[idx2(i, j, customers.size())] != 0;
    }

    double total_demand(int s) const;
    double max_total_demand() const;
    double total_capacity() const;

    // sum_i f_i open_i
    double fixed_cost(const std::vector<int> &open) const;

    // Standing master constraint sum_i cap_i >= max_s sum_j d_js holds when
    // every facility is open.
    bool aggregate_capacity_sufficient() const;

    // Throws InvalidModelError on the first violated rule.
    void validate() const;

    //
    // Text format (whitespace separated):
    //   nF nC nS
    //   (capacity_i fixed_cost_i)          i = 0..nF-1
    //   c_ij                               row-major, nF*nC
    //   (probability_s d_0s ... d_(nC-1)s) s = 0..nS-1
    //   [a_ij in {0,1}                     optional, nF*nC]
    //
    static ModelData parse(std::istream &in);
    static ModelData from_txt(const std::string &path);
};

#endif // SFLP_INSTANCE_H
