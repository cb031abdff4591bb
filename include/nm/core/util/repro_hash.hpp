// File: include/nm/core/util/repro_hash.hpp
#pragma once

#include <string>

#include "nm/core/config.hpp"
#include "nm/core/model/query_params.hpp"

namespace nm {

// Hash the full runtime config (site, query, input, output, safety, logging).
// Goal: if the run changes, this hash should change.
std::string compute_config_hash(const Config& cfg);

// Hash only the query parameters. Identical queries over the same snapshot
// produce identical results, so this doubles as a result-cache key.
std::string compute_query_hash(const QueryParams& q);

}  // namespace nm
