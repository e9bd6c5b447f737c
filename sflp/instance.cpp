// instance.cpp
// Two-stage stochastic facility location instance

#include <algorithm>
#include <cmath>
#include <fstream>
#include <numeric>
#include <stdexcept>

#include "errors.h"
#include "instance.h"

double ModelData::total_demand(int s) const
{
    const std::vector<double> &d = scenarios[s].demand;
    return std::accumulate(d.begin(), d.end(), 0.0);
}

double ModelData::max_total_demand() const
{
    double m = 0.0;
    for (int s : S())
        m = std::max(m, total_demand(s));
    return m;
}

double ModelData::total_capacity() const
{
    double t = 0.0;
    for (const Facility &f : facilities)
        t += f.capacity;
    return t;
}

double ModelData::fixed_cost(const std::vector<int> &open) const
{
    double t = 0.0;
    for (int i : F())
        if (open[i])
            t += facilities[i].fixed_cost;
    return t;
}

bool ModelData::aggregate_capacity_sufficient() const
{
    return total_capacity() + TOL >= max_total_demand();
}

void ModelData::validate() const
{
    const int nF = num_facilities(), nC = num_customers(), nS = num_scenarios();

    if (nF == 0)
        throw InvalidModelError("Instance has no facilities.");
    if (nS == 0)
        throw InvalidModelError("Instance has no scenarios.");
    if (variable_cost.size() != static_cast<size_t>(nF) * static_cast<size_t>(nC))
        throw InvalidModelError("Variable cost matrix must have nF*nC entries.");
    if (!eligible.empty() && eligible.size() != variable_cost.size())
        throw InvalidModelError("Eligibility matrix must have nF*nC entries.");

    for (const Facility &f : facilities)
    {
        if (!std::isfinite(f.fixed_cost) || !std::isfinite(f.capacity))
            throw InvalidModelError("Non-finite data for facility " + f.id + ".");
        if (f.fixed_cost < 0.0)
            throw InvalidModelError("Negative fixed cost for facility " + f.id + ".");
        if (f.capacity < 0.0)
            throw InvalidModelError("Negative capacity for facility " + f.id + ".");
    }
    for (double c : variable_cost)
    {
        if (!std::isfinite(c))
            throw InvalidModelError("Non-finite variable cost.");
        if (c < 0.0)
            throw InvalidModelError("Negative variable cost.");
    }

    double psum = 0.0;
    for (const Scenario &sc : scenarios)
    {
        if (!(sc.probability > 0.0 && sc.probability <= 1.0))
            throw InvalidModelError("Probability of scenario " + sc.id + " outside (0,1].");
        if (sc.demand.size() != static_cast<size_t>(nC))
            throw InvalidModelError("Scenario " + sc.id + " must have one demand per customer.");
        for (double d : sc.demand)
        {
            if (!std::isfinite(d))
                throw InvalidModelError("Non-finite demand in scenario " + sc.id + ".");
            if (d < 0.0)
                throw InvalidModelError("Negative demand in scenario " + sc.id + ".");
        }
        psum += sc.probability;
    }
    if (!is_close(psum, 1.0, TOL))
        throw InvalidModelError("Scenario probabilities do not sum to 1.");

    // a customer with demand must be reachable from some facility
    for (int j : C())
    {
        bool reachable = false;
        for (int i = 0; i < nF && !reachable; ++i)
            reachable = allowed(i, j) && facilities[i].capacity > 0.0;
        if (reachable)
            continue;
        for (int s = 0; s < nS; ++s)
            if (demand(j, s) > 0.0)
                throw InvalidModelError("Customer " + customers[j].id + " has demand but no eligible facility.");
    }
}

ModelData ModelData::parse(std::istream &in)
{
    std::vector<double> a;
    double v;
    while (in >> v)
        a.push_back(v);
    if (!in.eof())
        throw std::runtime_error("Malformed file (non-numeric token).");
    if (a.size() < 3)
        throw std::runtime_error("Malformed file (header).");

    // sizes must be integral and small enough for the nF*nC matrices
    for (size_t k = 0; k < 3; ++k)
        if (!(a[k] >= 0.0 && a[k] <= MAX_DIM && a[k] == std::floor(a[k])))
            throw std::runtime_error("Malformed file (header sizes).");

    size_t pos = 0;
    const int nF = static_cast<int>(a[pos++]);
    const int nC = static_cast<int>(a[pos++]);
    const int nS = static_cast<int>(a[pos++]);

    const size_t nFC = static_cast<size_t>(nF) * static_cast<size_t>(nC);

    ModelData data;

    // (capacity, fixed cost): nF pairs
    if (pos + 2 * static_cast<size_t>(nF) > a.size())
        throw std::runtime_error("Malformed file (capacity,fixed_cost).");
    data.facilities.resize(nF);
    for (int i = 0; i < nF; ++i)
    {
        data.facilities[i].id = "F" + std::to_string(i);
        data.facilities[i].capacity = a[pos++];
        data.facilities[i].fixed_cost = a[pos++];
    }

    data.customers.resize(nC);
    for (int j = 0; j < nC; ++j)
        data.customers[j].id = "C" + std::to_string(j);

    // c: nF*nC
    if (pos + nFC > a.size())
        throw std::runtime_error("Malformed file (variable_cost).");
    data.variable_cost.assign(a.begin() + pos, a.begin() + pos + nFC);
    pos += nFC;

    // (probability, demand[nC]): nS rows
    if (pos + static_cast<size_t>(nS) * (static_cast<size_t>(nC) + 1) > a.size())
        throw std::runtime_error("Malformed file (scenarios).");
    data.scenarios.resize(nS);
    for (int s = 0; s < nS; ++s)
    {
        Scenario &sc = data.scenarios[s];
        sc.id = "S" + std::to_string(s);
        sc.probability = a[pos++];
        sc.demand.assign(a.begin() + pos, a.begin() + pos + nC);
        pos += static_cast<size_t>(nC);
    }

    // optional eligibility block
    if (pos < a.size())
    {
        if (a.size() - pos != nFC)
            throw std::runtime_error("Malformed file (eligibility).");
        data.eligible.resize(nFC);
        for (size_t t = 0; t < nFC; ++t)
            data.eligible[t] = a[pos++] > 0.5 ? 1 : 0;
    }

    return data;
}

ModelData ModelData::from_txt(const std::string &path)
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("Cannot open instance: " + path);
    return parse(in);
}
