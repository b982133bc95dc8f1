#include "transport.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

namespace {

constexpr double kEpsilon = 1e-12;

struct Edge {
    std::size_t to = 0;
    std::size_t rev = 0;
    double capacity = 0.0;
    double cost = 0.0;
};

class ResidualGraph {
public:
    explicit ResidualGraph(std::size_t node_count) : adjacency_(node_count) {}

    void add_edge(std::size_t from, std::size_t to, double capacity, double cost) {
        adjacency_[from].push_back(Edge{to, adjacency_[to].size(), capacity, cost});
        adjacency_[to].push_back(Edge{from, adjacency_[from].size() - 1, 0.0, -cost});
    }

    // Successive shortest paths; Bellman-Ford tolerates the negative residual costs.
    double min_cost_flow(std::size_t source, std::size_t sink, double required) {
        const std::size_t n = adjacency_.size();
        const double inf = std::numeric_limits<double>::infinity();

        double total_cost = 0.0;
        double pending = required;

        std::vector<double> dist(n);
        std::vector<std::size_t> prev_node(n);
        std::vector<std::size_t> prev_edge(n);

        while (pending > kEpsilon) {
            std::fill(dist.begin(), dist.end(), inf);
            dist[source] = 0.0;

            for (std::size_t round = 0; round + 1 < n; ++round) {
                bool relaxed = false;
                for (std::size_t u = 0; u < n; ++u) {
                    if (dist[u] == inf) {
                        continue;
                    }
                    for (std::size_t e = 0; e < adjacency_[u].size(); ++e) {
                        const Edge& edge = adjacency_[u][e];
                        if (edge.capacity <= kEpsilon) {
                            continue;
                        }
                        const double candidate = dist[u] + edge.cost;
                        if (candidate < dist[edge.to] - kEpsilon) {
                            dist[edge.to] = candidate;
                            prev_node[edge.to] = u;
                            prev_edge[edge.to] = e;
                            relaxed = true;
                        }
                    }
                }
                if (!relaxed) {
                    break;
                }
            }

            if (dist[sink] == inf) {
                break;
            }

            double push = pending;
            for (std::size_t v = sink; v != source; v = prev_node[v]) {
                push = std::min(push, adjacency_[prev_node[v]][prev_edge[v]].capacity);
            }
            if (push <= kEpsilon) {
                break;
            }

            for (std::size_t v = sink; v != source; v = prev_node[v]) {
                Edge& edge = adjacency_[prev_node[v]][prev_edge[v]];
                edge.capacity -= push;
                adjacency_[v][edge.rev].capacity += push;
            }

            total_cost += push * dist[sink];
            pending -= push;
        }

        return total_cost;
    }

private:
    std::vector<std::vector<Edge>> adjacency_;
};

void check_weights(const std::vector<double>& weights, const char* name) {
    for (double w : weights) {
        if (!std::isfinite(w) || w < 0.0) {
            throw std::invalid_argument(std::string("Transport ") + name + " weights must be finite and non-negative");
        }
    }
}

}  // namespace

double earth_movers_distance(
    const std::vector<double>& supply,
    const std::vector<double>& demand,
    const std::vector<double>& cost
) {
    if (cost.size() != supply.size() * demand.size()) {
        throw std::invalid_argument(
            "Transport cost matrix has " + std::to_string(cost.size()) + " entries, expected " +
            std::to_string(supply.size() * demand.size())
        );
    }

    check_weights(supply, "supply");
    check_weights(demand, "demand");

    const double supply_mass = std::accumulate(supply.begin(), supply.end(), 0.0);
    const double demand_mass = std::accumulate(demand.begin(), demand.end(), 0.0);
    if (std::fabs(supply_mass - demand_mass) > 1e-9 * std::max(1.0, supply_mass)) {
        throw std::invalid_argument("Transport supply and demand must have equal total mass");
    }

    if (supply_mass <= kEpsilon) {
        return 0.0;
    }

    // Node layout: source, supply rows, demand columns, sink.
    const std::size_t rows = supply.size();
    const std::size_t cols = demand.size();
    const std::size_t source = 0;
    const std::size_t sink = rows + cols + 1;

    ResidualGraph graph(rows + cols + 2);
    for (std::size_t i = 0; i < rows; ++i) {
        graph.add_edge(source, 1 + i, supply[i], 0.0);
    }
    for (std::size_t j = 0; j < cols; ++j) {
        graph.add_edge(1 + rows + j, sink, demand[j], 0.0);
    }
    for (std::size_t i = 0; i < rows; ++i) {
        for (std::size_t j = 0; j < cols; ++j) {
            const double c = cost[i * cols + j];
            if (!std::isfinite(c) || c < 0.0) {
                throw std::invalid_argument("Transport costs must be finite and non-negative");
            }
            graph.add_edge(1 + i, 1 + rows + j, supply[i], c);
        }
    }

    return graph.min_cost_flow(source, sink, std::min(supply_mass, demand_mass));
}
