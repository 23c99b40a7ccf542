#include "graph/graph_algorithms.hpp"
#include <algorithm>
#include <numeric>
#include <set>

namespace sdb {

namespace {

/**
 * @brief Disjoint-set forest with path halving
 */
class UnionFind {
public:
    explicit UnionFind(size_t n) : parent_(n) {
        std::iota(parent_.begin(), parent_.end(), 0);
    }

    size_t find(size_t x) {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    void unite(size_t a, size_t b) {
        a = find(a);
        b = find(b);
        if (a != b) {
            // Keep the smaller root so component order follows insertion order
            if (b < a) std::swap(a, b);
            parent_[b] = a;
        }
    }

private:
    std::vector<size_t> parent_;
};

std::set<NodeHandle> undirected_neighborhood(const GraphStore& store, NodeHandle h) {
    std::set<NodeHandle> result;
    for (NodeHandle n : store.successor_handles(h)) result.insert(n);
    for (NodeHandle n : store.predecessor_handles(h)) result.insert(n);
    return result;
}

struct CycleSearch {
    const GraphStore& store;
    const CycleSearchBudget& budget;
    std::chrono::steady_clock::time_point deadline;
    CycleSearchResult result;
    std::vector<NodeHandle> path;
    std::vector<bool> on_stack;

    bool exhausted() {
        if (result.steps >= budget.max_steps) {
            return true;
        }
        // Clock reads are throttled to every 256 expansions
        if ((result.steps & 0xFF) == 0 && std::chrono::steady_clock::now() >= deadline) {
            return true;
        }
        return false;
    }

    void visit(NodeHandle root, NodeHandle current) {
        for (NodeHandle next : store.successor_handles(current)) {
            if (result.truncated) {
                return;
            }
            if (next == root) {
                result.cycles.push_back(path);
                continue;
            }
            if (next < root || on_stack[next] || path.size() >= budget.max_cycle_length) {
                continue;
            }

            ++result.steps;
            if (exhausted()) {
                result.truncated = true;
                return;
            }

            path.push_back(next);
            on_stack[next] = true;
            visit(root, next);
            on_stack[next] = false;
            path.pop_back();
        }
    }
};

} // namespace

double density(const GraphStore& store) {
    size_t n = store.num_nodes();
    if (n < 2) {
        return 0.0;
    }

    size_t pairs = 0;
    for (NodeHandle h = 0; h < n; ++h) {
        for (NodeHandle next : store.successor_handles(h)) {
            if (next != h) {
                ++pairs;
            }
        }
    }

    return static_cast<double>(pairs) / (static_cast<double>(n) * static_cast<double>(n - 1));
}

std::vector<std::vector<std::string>> weakly_connected_components(const GraphStore& store) {
    size_t n = store.num_nodes();
    UnionFind uf(n);
    for (NodeHandle h = 0; h < n; ++h) {
        for (NodeHandle next : store.successor_handles(h)) {
            uf.unite(h, next);
        }
    }

    std::vector<std::vector<std::string>> components;
    std::vector<size_t> slot(n, n);
    for (NodeHandle h = 0; h < n; ++h) {
        size_t root = uf.find(h);
        if (slot[root] == n) {
            slot[root] = components.size();
            components.emplace_back();
        }
        components[slot[root]].push_back(store.node_at(h).id);
    }
    return components;
}

size_t count_weakly_connected_components(const GraphStore& store) {
    return weakly_connected_components(store).size();
}

std::vector<std::string> isolated_nodes(const GraphStore& store) {
    std::vector<std::string> result;
    for (NodeHandle h = 0; h < store.num_nodes(); ++h) {
        if (store.out_edges(h).empty() && store.in_edges(h).empty()) {
            result.push_back(store.node_at(h).id);
        }
    }
    return result;
}

double jaccard_similarity(const GraphStore& store, const std::string& a, const std::string& b) {
    auto ha = store.node_handle(a);
    auto hb = store.node_handle(b);
    if (!ha || !hb) {
        return 0.0;
    }

    auto na = undirected_neighborhood(store, *ha);
    auto nb = undirected_neighborhood(store, *hb);

    std::vector<NodeHandle> common;
    std::set_intersection(na.begin(), na.end(), nb.begin(), nb.end(), std::back_inserter(common));

    std::vector<NodeHandle> combined;
    std::set_union(na.begin(), na.end(), nb.begin(), nb.end(), std::back_inserter(combined));

    if (combined.empty()) {
        return 0.0;
    }
    return static_cast<double>(common.size()) / static_cast<double>(combined.size());
}

CycleSearchResult enumerate_simple_cycles(const GraphStore& store, const CycleSearchBudget& budget) {
    CycleSearch search{
        store,
        budget,
        std::chrono::steady_clock::now() + budget.time_budget,
        {},
        {},
        std::vector<bool>(store.num_nodes(), false)
    };

    if (budget.max_cycle_length == 0) {
        return search.result;
    }

    for (NodeHandle root = 0; root < store.num_nodes(); ++root) {
        search.path = {root};
        search.on_stack[root] = true;
        search.visit(root, root);
        search.on_stack[root] = false;

        if (search.result.truncated) {
            break;
        }
    }

    return search.result;
}

std::vector<std::vector<std::string>> enumerate_simple_paths(const GraphStore& store,
                                                             const std::string& from,
                                                             const std::string& to,
                                                             int max_hops) {
    std::vector<std::vector<std::string>> paths;
    auto start = store.node_handle(from);
    auto goal = store.node_handle(to);
    if (!start || !goal || *start == *goal || max_hops < 1) {
        return paths;
    }

    std::vector<NodeHandle> path{*start};
    std::vector<bool> on_path(store.num_nodes(), false);
    on_path[*start] = true;

    // Explicit stack of (node, next successor index)
    std::vector<std::pair<std::vector<NodeHandle>, size_t>> frames;
    frames.emplace_back(store.successor_handles(*start), 0);

    while (!frames.empty()) {
        auto& [nexts, index] = frames.back();
        if (index >= nexts.size()) {
            on_path[path.back()] = false;
            path.pop_back();
            frames.pop_back();
            continue;
        }

        NodeHandle next = nexts[index++];
        if (on_path[next]) {
            continue;
        }

        if (next == *goal) {
            std::vector<std::string> ids;
            ids.reserve(path.size() + 1);
            for (NodeHandle h : path) ids.push_back(store.node_at(h).id);
            ids.push_back(store.node_at(next).id);
            paths.push_back(std::move(ids));
            continue;
        }

        if (static_cast<int>(path.size()) < max_hops) {
            path.push_back(next);
            on_path[next] = true;
            frames.emplace_back(store.successor_handles(next), 0);
        }
    }

    return paths;
}

} // namespace sdb
