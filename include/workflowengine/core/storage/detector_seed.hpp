#pragma once

#include <workflowengine/core/config/app_config.hpp>
#include <workflowengine/core/storage/sqlite_store.hpp>
#include <cstddef>
#include <vector>

namespace WorkflowEngine {

/**
 * @brief Create the configured detectors that the store does not have yet
 *
 * A detector is matched by name. For each missing one a condition group,
 * its conditions and then the detector row are created; existing detectors
 * are left untouched, so seeding the same list twice creates nothing.
 *
 * @return Number of detectors created
 * @throws std::runtime_error on an unknown condition type or result
 * @throws StoreError when a write fails
 */
size_t seedDetectors(SqliteStore& store, const std::vector<AppConfig::DetectorConfig>& detectors);

} // namespace WorkflowEngine
