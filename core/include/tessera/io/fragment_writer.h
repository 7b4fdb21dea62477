#pragma once

/**
 * @file fragment_writer.h
 * @brief JSON serialization of fragment snapshots and step deltas
 *
 * Snapshot layout:
 * @code
 * { "width": 640, "height": 480, "maxFragments": 2000, "fragmentCount": 4,
 *   "fragments": [ { "id": 2, "region": [0, 0, 320, 240],
 *                    "color": [0.1, 0.2, 0.3], "score": 0.4,
 *                    "weightedScore": 0.2 }, ... ] }
 * @endcode
 *
 * A delta is `{ "step": n, "removed": id, "added": [fragment x4] }`.
 * A reset line is `{ "reset": "image2", "snapshot": {...} }`; consumers must
 * drop every fragment they hold when they see one.
 */

#include <tessera/fragment.h>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace tessera {
class RefinementEngine;
}

namespace tessera::io {

nlohmann::json fragmentToJson(const Fragment& fragment);

/// @brief Full fragment set ordered by id
nlohmann::json snapshotToJson(const RefinementEngine& engine);

/// @brief Delta for one successful step
nlohmann::json stepToJson(const StepResult& result, size_t stepIndex);

/// @brief Write a snapshot to disk. Returns false (and logs) on failure.
bool writeSnapshot(const std::string& path, const RefinementEngine& engine);

/// @brief Write one delta as a single JSON line
void writeStepLine(std::ostream& out, const StepResult& result, size_t stepIndex);

/// @brief Write a full-replacement marker followed by the new fragment set
void writeResetLine(std::ostream& out, const RefinementEngine& engine, const std::string& sourceName);

} // namespace tessera::io
