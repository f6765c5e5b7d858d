#pragma once

#include <array>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include "core/capabilities.hpp"
#include "core/media_types.hpp"

class ClipCache;

struct ClipSynthesizerConfig
{
    double granularity_seconds = 0.5;
};

/**
 * @brief Produces playable clips for (video, start, end) requests
 *
 * Requests are snapped to the configured granularity and fingerprinted. At most one
 * extraction runs per fingerprint: concurrent callers wait on the same shared future
 * and receive the same artifact. The in-flight table is split into stripes keyed by
 * fingerprint, so unrelated requests never share a lock, and no lock is held while
 * media is being extracted.
 */
class ClipSynthesizer
{
public:
    ClipSynthesizer(std::shared_ptr<MediaStore> media_store,
                    std::shared_ptr<ClipCache> cache,
                    ClipSynthesizerConfig config = ClipSynthesizerConfig());

    /**
     * @brief Return the cached clip or extract it
     * @throws MediaExtractionError when the source cannot be read or the range is outside it
     */
    ClipArtifactRef synthesize(const std::string &video_id, double start, double end);

    /**
     * @brief Snap a range to a granularity grid
     *
     * Rounds half away from zero; a range that collapses is extended by one step.
     */
    static std::pair<double, double> snapRange(double start, double end, double granularity);

    static std::string fingerprint(const std::string &video_id, double snapped_start, double snapped_end);

    const ClipSynthesizerConfig &config() const { return config_; }

private:
    static constexpr size_t kStripeCount = 16;

    struct Stripe
    {
        std::mutex mutex;
        std::unordered_map<std::string, std::shared_future<ClipArtifactRef>> in_flight;
    };

    Stripe &stripeFor(const std::string &fingerprint);
    ClipArtifactRef extract(const std::string &fingerprint, const std::string &video_id, double requested_start,
                            double start, double end);

    std::shared_ptr<MediaStore> media_store_;
    std::shared_ptr<ClipCache> cache_;
    ClipSynthesizerConfig config_;
    std::array<Stripe, kStripeCount> stripes_;
};
