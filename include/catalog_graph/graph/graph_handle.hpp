#pragma once

#include <catalog_graph/graph/graph_model.hpp>

#include <memory>

namespace catalog_graph {

// ---------------------------------------------------------------------------
// GraphHandle: publishes the current immutable graph to concurrent readers.
//
// Readers take a Snapshot() and keep using it for the whole request; a
// concurrent Swap() only affects later snapshots. The old graph is released
// once its last reader drops the snapshot.
// ---------------------------------------------------------------------------
class GraphHandle {
public:
    GraphHandle() : current_(std::make_shared<const Graph>()) {}
    explicit GraphHandle(std::shared_ptr<const Graph> graph)
        : current_(std::move(graph)) {}

    GraphHandle(const GraphHandle&) = delete;
    GraphHandle& operator=(const GraphHandle&) = delete;

    [[nodiscard]] std::shared_ptr<const Graph> Snapshot() const {
        return std::atomic_load(&current_);
    }

    /// Publish `next`; returns the graph it replaced.
    std::shared_ptr<const Graph> Swap(std::shared_ptr<const Graph> next) {
        return std::atomic_exchange(&current_, std::move(next));
    }

private:
    std::shared_ptr<const Graph> current_;
};

} // namespace catalog_graph
