/**
 * Segue Engine - In-memory Analysis Provider
 */

#include "provider.h"

namespace segue {

namespace {

ResultError unknown_track(const std::string& track_id) {
    return ResultError{ErrorCode::InvalidArgument, "Unknown track: " + track_id};
}

} // namespace

void MemoryProvider::add_track(const std::string& track_id, TrackPrimitives primitives) {
    tracks_[track_id] = std::move(primitives);
}

const TrackPrimitives* MemoryProvider::find(const std::string& track_id) const {
    auto it = tracks_.find(track_id);
    return it != tracks_.end() ? &it->second : nullptr;
}

Result<float> MemoryProvider::tempo(const std::string& track_id) {
    const auto* t = find(track_id);
    if (!t) return unknown_track(track_id);
    return t->bpm;
}

Result<std::vector<float>> MemoryProvider::chroma(const std::string& track_id) {
    const auto* t = find(track_id);
    if (!t) return unknown_track(track_id);
    return t->chroma;
}

Result<std::vector<Segment>> MemoryProvider::segments(const std::string& track_id) {
    const auto* t = find(track_id);
    if (!t) return unknown_track(track_id);
    return t->segments;
}

Result<std::vector<float>> MemoryProvider::beat_grid(const std::string& track_id) {
    const auto* t = find(track_id);
    if (!t) return unknown_track(track_id);
    return t->beats;
}

Result<std::vector<EnergyPoint>> MemoryProvider::energy_curve(const std::string& track_id) {
    const auto* t = find(track_id);
    if (!t) return unknown_track(track_id);
    return t->energy_curve;
}

Result<int> MemoryProvider::sample_rate(const std::string& track_id) {
    const auto* t = find(track_id);
    if (!t) return unknown_track(track_id);
    return t->sample_rate;
}

Result<float> MemoryProvider::duration(const std::string& track_id) {
    const auto* t = find(track_id);
    if (!t) return unknown_track(track_id);
    return t->duration;
}

Result<ClusterSegmentation> MemoryProvider::cluster_segmentation(const std::string& track_id) {
    const auto* t = find(track_id);
    if (!t) return unknown_track(track_id);
    return t->unlabeled;
}

} // namespace segue
