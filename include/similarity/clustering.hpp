#pragma once

#include <algorithm>
#include <exception>
#include <functional>
#include <stack>
#include <string>
#include <thread>
#include <vector>

namespace kgf {

/**
 * @brief How candidates are grouped before fusion
 *
 * Seed: each unclustered item (in input order) seeds a cluster and absorbs
 * every later unclustered item similar to the seed. Members are compared to
 * the seed only, so A~B and B~C with A!~C puts C in its own cluster.
 *
 * Connected: clusters are the connected components of the "similar" graph,
 * so the same chain ends up in one cluster.
 */
enum class ClusteringMode {
    Seed,
    Connected
};

inline std::string clustering_mode_to_string(ClusteringMode mode) {
    switch (mode) {
        case ClusteringMode::Seed: return "seed";
        case ClusteringMode::Connected: return "connected";
    }
    return "seed";
}

inline bool string_to_clustering_mode(const std::string& name, ClusteringMode& mode) {
    if (name == "seed") {
        mode = ClusteringMode::Seed;
        return true;
    }
    if (name == "connected" || name == "connected_components") {
        mode = ClusteringMode::Connected;
        return true;
    }
    return false;
}

namespace detail {

/**
 * @brief Evaluate pred(k) for k in [0, count) on up to `workers` threads
 *
 * Results are written by index, so the outcome does not depend on
 * scheduling. pred must be safe to call concurrently. If pred throws, all
 * workers are joined and the first exception (in chunk order) is rethrown.
 */
inline std::vector<char> evaluate_parallel(
    size_t count,
    size_t workers,
    const std::function<bool(size_t)>& pred
) {
    std::vector<char> results(count, 0);
    if (count == 0) return results;

    size_t thread_count = std::min(std::max<size_t>(workers, 1), count);
    if (thread_count <= 1) {
        for (size_t k = 0; k < count; ++k) {
            results[k] = pred(k) ? 1 : 0;
        }
        return results;
    }

    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    std::vector<std::exception_ptr> errors(thread_count);
    size_t chunk = (count + thread_count - 1) / thread_count;

    for (size_t t = 0; t < thread_count; ++t) {
        size_t begin = t * chunk;
        size_t end = std::min(count, begin + chunk);
        if (begin >= end) break;
        threads.emplace_back([&results, &pred, &errors, t, begin, end]() {
            try {
                for (size_t k = begin; k < end; ++k) {
                    results[k] = pred(k) ? 1 : 0;
                }
            } catch (...) {
                errors[t] = std::current_exception();
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    // Rethrow on the calling thread, lowest chunk first
    for (const auto& error : errors) {
        if (error) std::rethrow_exception(error);
    }

    return results;
}

} // namespace detail

/**
 * @brief Seed-based grouping of n items
 *
 * Returns every cluster (singletons included) in seed order; members keep
 * input order with the seed first. Comparisons against one seed may run in
 * parallel, but membership is assigned serially.
 */
inline std::vector<std::vector<size_t>> seed_clusters(
    size_t n,
    const std::function<bool(size_t, size_t)>& is_similar,
    size_t workers = 1
) {
    std::vector<std::vector<size_t>> clusters;
    std::vector<bool> visited(n, false);

    for (size_t i = 0; i < n; ++i) {
        if (visited[i]) continue;
        visited[i] = true;

        std::vector<size_t> candidates;
        for (size_t j = i + 1; j < n; ++j) {
            if (!visited[j]) candidates.push_back(j);
        }

        auto matches = detail::evaluate_parallel(
            candidates.size(), workers,
            [&](size_t k) { return is_similar(i, candidates[k]); }
        );

        std::vector<size_t> cluster = {i};
        for (size_t k = 0; k < candidates.size(); ++k) {
            if (matches[k]) {
                cluster.push_back(candidates[k]);
                visited[candidates[k]] = true;
            }
        }
        clusters.push_back(std::move(cluster));
    }

    return clusters;
}

/**
 * @brief Connected-component grouping of n items
 *
 * The full upper triangle of comparisons is evaluated (in parallel when
 * workers > 1), then components are collected by depth-first search.
 * Clusters are ordered by their smallest member; members ascend.
 */
inline std::vector<std::vector<size_t>> connected_clusters(
    size_t n,
    const std::function<bool(size_t, size_t)>& is_similar,
    size_t workers = 1
) {
    std::vector<std::pair<size_t, size_t>> pairs;
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            pairs.emplace_back(i, j);
        }
    }

    auto matches = detail::evaluate_parallel(
        pairs.size(), workers,
        [&](size_t k) { return is_similar(pairs[k].first, pairs[k].second); }
    );

    std::vector<std::vector<size_t>> adjacency(n);
    for (size_t k = 0; k < pairs.size(); ++k) {
        if (matches[k]) {
            adjacency[pairs[k].first].push_back(pairs[k].second);
            adjacency[pairs[k].second].push_back(pairs[k].first);
        }
    }

    std::vector<bool> visited(n, false);
    std::vector<std::vector<size_t>> clusters;

    for (size_t start = 0; start < n; ++start) {
        if (visited[start]) continue;

        std::vector<size_t> component;
        std::stack<size_t> stack;
        stack.push(start);

        while (!stack.empty()) {
            size_t current = stack.top();
            stack.pop();

            if (visited[current]) continue;
            visited[current] = true;
            component.push_back(current);

            for (size_t neighbor : adjacency[current]) {
                if (!visited[neighbor]) {
                    stack.push(neighbor);
                }
            }
        }

        std::sort(component.begin(), component.end());
        clusters.push_back(std::move(component));
    }

    return clusters;
}

inline std::vector<std::vector<size_t>> cluster_items(
    ClusteringMode mode,
    size_t n,
    const std::function<bool(size_t, size_t)>& is_similar,
    size_t workers = 1
) {
    if (mode == ClusteringMode::Connected) {
        return connected_clusters(n, is_similar, workers);
    }
    return seed_clusters(n, is_similar, workers);
}

} // namespace kgf
