/**
 * @file fan_out.hpp
 * @brief Concurrent path searches over many roots and destinations
 *
 * Two levels of fan-out:
 *
 *  - PairFanOut: one root, many destinations. The neighbourhood of the root
 *    is resolved once, then every destination gets its own PathFinder,
 *    all of them sharing the same read-only AdjacencyMap.
 *  - RootFanOut: many roots. One PairFanOut per root, each with its own
 *    AdjacencyMap.
 *
 * Both levels run their tasks through gather(), so the first failure
 * cancels the rest of the operation and is rethrown to the caller.
 */

#pragma once

#include "finder_bfs.hpp"
#include "paths.hpp"
#include "progress.hpp"
#include <depaths/model/depaths_adjacency.hpp>

namespace depaths {
namespace pathfinder {


/**
 * @brief knobs of a search operation
 */
struct SearchSettings {
    /**
     * @brief max concurrent tasks per fan-out level
     *
     * @default 0 (hardware concurrency)
     */
    unsigned jobs = 0;

    /**
     * @brief stop each (root, destination) search after this many paths
     *
     * @default 0 (no limit)
     */
    std::size_t max_paths = 0;
};


/**
 * Find all paths from one root to each of many destinations
 */
struct PairFanOut
{
    PairFanOut(const model::AdjacencyProvider *provider
               , ProgressSink *progress = nullptr
               , const SearchSettings &settings = SearchSettings()
               , CancellationFlag cancel = CancellationFlag())
        : m_provider(provider)
        , m_progress(progress)
        , m_settings(settings)
        , m_cancel(cancel)
    {}

    /**
     * @return one entry per (unique) destination, in input order
     * @throw OperationCancelled if the cancellation flag got raised
     * @throw whatever the adjacency provider throws
     */
    PairPathsList operator()(const Node &root, const NodeList &destinations) const;

    const model::AdjacencyProvider *m_provider;
    ProgressSink *m_progress;
    SearchSettings m_settings;
    CancellationFlag m_cancel;
};


/**
 * Find all paths from each of many roots to each of many destinations
 */
struct RootFanOut
{
    RootFanOut(const model::AdjacencyProvider *provider
               , ProgressSink *progress = nullptr
               , const SearchSettings &settings = SearchSettings()
               , CancellationFlag cancel = CancellationFlag())
        : m_provider(provider)
        , m_progress(progress)
        , m_settings(settings)
        , m_cancel(cancel)
    {}

    /**
     * @brief all paths, grouped by root, then by destination, in input order.
     *
     * Within one (root, destination) group paths are shortest first.
     * There's no ordering across groups.
     */
    PathList operator()(const NodeList &roots, const NodeList &destinations) const;

    /**
     * @brief same as operator(), without flattening: one list per root
     */
    std::vector<PairPathsList> grouped(const NodeList &roots, const NodeList &destinations) const;

    const model::AdjacencyProvider *m_provider;
    ProgressSink *m_progress;
    SearchSettings m_settings;
    CancellationFlag m_cancel;
};


} // namespace pathfinder
} // namespace depaths
