#pragma once

#include <vector>

// Exact minimum-cost transport of supply onto demand. cost is row-major,
// supply.size() rows by demand.size() columns. Both weight vectors must be
// non-negative with equal total mass. Throws std::invalid_argument otherwise.
double earth_movers_distance(
    const std::vector<double>& supply,
    const std::vector<double>& demand,
    const std::vector<double>& cost
);
