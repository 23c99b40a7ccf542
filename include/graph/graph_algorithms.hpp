#pragma once

#include "graph/graph_store.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace sdb {

/**
 * @brief Limits for simple-cycle enumeration
 *
 * Enumeration is exponential on dense graphs; whichever limit is hit first
 * stops the search and marks the result truncated.
 */
struct CycleSearchBudget {
    size_t max_cycle_length = 12;                      // nodes per cycle
    size_t max_steps = 200000;                         // node expansions
    std::chrono::milliseconds time_budget{2000};
};

struct CycleSearchResult {
    std::vector<std::vector<NodeHandle>> cycles;       // each rooted at its smallest handle
    size_t steps = 0;
    bool truncated = false;
};

/**
 * @brief Distinct ordered endpoint pairs over n * (n - 1)
 *
 * Parallel records count once and self-loops are ignored. 0 when n < 2.
 */
double density(const GraphStore& store);

/**
 * @brief Weakly connected components (union-find over the undirected view)
 * @return Components as lists of node ids, in order of first member
 */
std::vector<std::vector<std::string>> weakly_connected_components(const GraphStore& store);

size_t count_weakly_connected_components(const GraphStore& store);

/**
 * @brief Nodes with neither incoming nor outgoing records
 */
std::vector<std::string> isolated_nodes(const GraphStore& store);

/**
 * @brief |N(a) ∩ N(b)| / |N(a) ∪ N(b)| where N = predecessors ∪ successors
 *
 * 0 when both neighborhoods are empty or either node is unknown.
 */
double jaccard_similarity(const GraphStore& store, const std::string& a, const std::string& b);

/**
 * @brief Bounded simple-cycle enumeration on the induced simple digraph
 *
 * Depth-limited DFS with an on-stack set. Each cycle is reported once,
 * starting from its smallest node handle.
 */
CycleSearchResult enumerate_simple_cycles(const GraphStore& store,
                                          const CycleSearchBudget& budget = {});

/**
 * @brief Simple paths with at most max_hops records, in adjacency (DFS) order
 */
std::vector<std::vector<std::string>> enumerate_simple_paths(const GraphStore& store,
                                                             const std::string& from,
                                                             const std::string& to,
                                                             int max_hops);

} // namespace sdb
