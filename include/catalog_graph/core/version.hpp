#pragma once

namespace catalog_graph {

constexpr const char* kVersion = "0.3.0";

} // namespace catalog_graph
