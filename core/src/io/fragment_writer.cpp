// Tessera I/O - Fragment snapshot and delta writer

#include <tessera/io/fragment_writer.h>
#include <tessera/refinement_engine.h>

#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace tessera::io {

json fragmentToJson(const Fragment& fragment) {
    const Region& r = fragment.region;
    const Color& c = fragment.stats.avgColor;
    return {
        {"id", fragment.id},
        {"region", {r.left, r.top, r.right, r.bottom}},
        {"color", {c.r, c.g, c.b}},
        {"score", fragment.stats.score},
        {"weightedScore", fragment.weightedScore},
    };
}

json snapshotToJson(const RefinementEngine& engine) {
    json j;
    const PixelBufferPtr& buffer = engine.buffer();
    j["width"] = buffer ? buffer->width() : 0;
    j["height"] = buffer ? buffer->height() : 0;
    j["maxFragments"] = engine.maxFragments();
    j["fragmentCount"] = engine.fragmentCount();

    json fragments = json::array();
    for (const auto& [id, fragment] : engine.activeFragments()) {
        fragments.push_back(fragmentToJson(fragment));
    }
    j["fragments"] = std::move(fragments);
    return j;
}

json stepToJson(const StepResult& result, size_t stepIndex) {
    json added = json::array();
    for (const Fragment& child : result.added) {
        added.push_back(fragmentToJson(child));
    }
    return {
        {"step", stepIndex},
        {"removed", result.removed.id},
        {"added", std::move(added)},
    };
}

bool writeSnapshot(const std::string& path, const RefinementEngine& engine) {
    std::ofstream file(path);
    if (!file) {
        std::cerr << "tessera-io: Cannot write snapshot: " << path << std::endl;
        return false;
    }
    file << snapshotToJson(engine).dump(2) << "\n";
    if (!file) {
        std::cerr << "tessera-io: Failed while writing snapshot: " << path << std::endl;
        return false;
    }
    return true;
}

void writeStepLine(std::ostream& out, const StepResult& result, size_t stepIndex) {
    out << stepToJson(result, stepIndex).dump() << "\n";
}

void writeResetLine(std::ostream& out, const RefinementEngine& engine, const std::string& sourceName) {
    json line = {
        {"reset", sourceName},
        {"snapshot", snapshotToJson(engine)},
    };
    out << line.dump() << "\n";
}

} // namespace tessera::io
