/**
 * Segue Engine - Analysis Provider Interface
 */

#ifndef SEGUE_PROVIDER_H
#define SEGUE_PROVIDER_H

#include "segue/types.h"
#include <string>
#include <unordered_map>

namespace segue {

/**
 * Unlabeled segmentation from a boundary/cluster segmenter.
 */
struct ClusterSegmentation {
    std::vector<float> boundaries;      // Segment starts, optionally one trailing end
    std::vector<int> clusters;          // Cluster id per segment
};

/**
 * Raw per-track analysis primitives, as delivered by an external
 * feature extractor.
 */
struct TrackPrimitives {
    int sample_rate = 44100;
    float bpm = 0.0f;
    float duration = 0.0f;              // 0 = derive from segments / beats
    std::vector<float> chroma;          // 12 bins, C..B
    std::vector<Segment> segments;
    std::vector<float> beats;
    std::vector<EnergyPoint> energy_curve;
    ClusterSegmentation unlabeled;      // Used when `segments` is empty
};

/**
 * External source of track analysis.
 * Implementations wrap whatever feature extractor and segmenter is in use.
 */
class AnalysisProvider {
public:
    virtual ~AnalysisProvider() = default;

    virtual Result<float> tempo(const std::string& track_id) = 0;
    virtual Result<std::vector<float>> chroma(const std::string& track_id) = 0;
    virtual Result<std::vector<Segment>> segments(const std::string& track_id) = 0;
    virtual Result<std::vector<float>> beat_grid(const std::string& track_id) = 0;
    virtual Result<std::vector<EnergyPoint>> energy_curve(const std::string& track_id) = 0;
    virtual Result<int> sample_rate(const std::string& track_id) = 0;
    virtual Result<float> duration(const std::string& track_id) = 0;

    /**
     * Unlabeled segmentation. Providers with a labeling segmenter keep the
     * default, which reports none.
     */
    virtual Result<ClusterSegmentation> cluster_segmentation(const std::string& track_id) {
        (void)track_id;
        return ClusterSegmentation();
    }
};

/**
 * Provider over primitives already held in memory.
 */
class MemoryProvider : public AnalysisProvider {
public:
    void add_track(const std::string& track_id, TrackPrimitives primitives);

    Result<float> tempo(const std::string& track_id) override;
    Result<std::vector<float>> chroma(const std::string& track_id) override;
    Result<std::vector<Segment>> segments(const std::string& track_id) override;
    Result<std::vector<float>> beat_grid(const std::string& track_id) override;
    Result<std::vector<EnergyPoint>> energy_curve(const std::string& track_id) override;
    Result<int> sample_rate(const std::string& track_id) override;
    Result<float> duration(const std::string& track_id) override;
    Result<ClusterSegmentation> cluster_segmentation(const std::string& track_id) override;

private:
    const TrackPrimitives* find(const std::string& track_id) const;

    std::unordered_map<std::string, TrackPrimitives> tracks_;
};

} // namespace segue

#endif // SEGUE_PROVIDER_H
