#include "core/clip_synthesizer.hpp"
#include "core/cache/clip_cache.hpp"
#include "core/errors.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <iomanip>
#include <sstream>

ClipSynthesizer::ClipSynthesizer(std::shared_ptr<MediaStore> media_store,
                                 std::shared_ptr<ClipCache> cache,
                                 ClipSynthesizerConfig config)
    : media_store_(std::move(media_store)), cache_(std::move(cache)), config_(config)
{
    if (!media_store_ || !cache_)
    {
        throw std::invalid_argument("ClipSynthesizer requires a media store and a clip cache");
    }
    if (!(config_.granularity_seconds > 0.0))
    {
        Logger::warn("Invalid clip granularity " + std::to_string(config_.granularity_seconds) + ", using 0.5s");
        config_.granularity_seconds = 0.5;
    }
}

std::pair<double, double> ClipSynthesizer::snapRange(double start, double end, double granularity)
{
    double snapped_start = std::round(start / granularity) * granularity;
    double snapped_end = std::round(end / granularity) * granularity;
    if (snapped_start < 0.0)
        snapped_start = 0.0;
    if (snapped_start >= snapped_end)
        snapped_end = snapped_start + granularity;
    return {snapped_start, snapped_end};
}

std::string ClipSynthesizer::fingerprint(const std::string &video_id, double snapped_start, double snapped_end)
{
    std::ostringstream key;
    key << video_id << '|' << std::fixed << std::setprecision(3) << snapped_start << '|' << snapped_end;
    return FileUtils::sha256Hex(key.str());
}

ClipSynthesizer::Stripe &ClipSynthesizer::stripeFor(const std::string &fingerprint)
{
    return stripes_[std::hash<std::string>{}(fingerprint) % kStripeCount];
}

ClipArtifactRef ClipSynthesizer::synthesize(const std::string &video_id, double start, double end)
{
    if (video_id.empty() || std::isnan(start) || std::isnan(end))
    {
        throw MediaExtractionError("Invalid clip request for video '" + video_id + "'");
    }

    auto range = snapRange(start, end, config_.granularity_seconds);
    const std::string fp = fingerprint(video_id, range.first, range.second);

    if (ClipArtifactRef cached = cache_->lookup(fp))
    {
        Logger::debug("Clip cache hit for " + video_id + " [" + std::to_string(range.first) + ", " +
                      std::to_string(range.second) + "]");
        return cached;
    }

    Stripe &stripe = stripeFor(fp);
    std::promise<ClipArtifactRef> promise;
    {
        std::unique_lock<std::mutex> lock(stripe.mutex);
        auto it = stripe.in_flight.find(fp);
        if (it != stripe.in_flight.end())
        {
            std::shared_future<ClipArtifactRef> pending = it->second;
            lock.unlock();
            cache_->recordCoalescedWait();
            Logger::debug("Joining in-flight clip extraction for " + video_id);
            return pending.get();
        }

        // Published between the lookup and taking the stripe lock
        if (ClipArtifactRef cached = cache_->peek(fp))
            return cached;

        stripe.in_flight.emplace(fp, promise.get_future().share());
    }

    try
    {
        ClipArtifactRef artifact = extract(fp, video_id, start, range.first, range.second);
        {
            std::lock_guard<std::mutex> lock(stripe.mutex);
            stripe.in_flight.erase(fp);
        }
        promise.set_value(artifact);
        return artifact;
    }
    catch (const std::exception &e)
    {
        {
            std::lock_guard<std::mutex> lock(stripe.mutex);
            stripe.in_flight.erase(fp);
        }
        std::exception_ptr failure;
        if (dynamic_cast<const MediaExtractionError *>(&e))
            failure = std::current_exception();
        else
            failure = std::make_exception_ptr(MediaExtractionError(
                "Clip extraction failed for " + video_id + ": " + e.what()));
        promise.set_exception(failure);
        std::rethrow_exception(failure);
    }
}

ClipArtifactRef ClipSynthesizer::extract(const std::string &fingerprint, const std::string &video_id,
                                         double requested_start, double start, double end)
{
    MediaHandle handle = media_store_->open(video_id);

    if (handle.duration_seconds > 0.0)
    {
        if (requested_start >= handle.duration_seconds)
        {
            throw MediaExtractionError("Clip start " + std::to_string(requested_start) +
                                       "s is beyond the end of video " + video_id + " (" +
                                       std::to_string(handle.duration_seconds) + "s)");
        }
        if (start >= handle.duration_seconds)
        {
            // Rounding pushed a tail range past the end: step back to the last grid point inside
            const double granularity = config_.granularity_seconds;
            double grid = std::floor(handle.duration_seconds / granularity) * granularity;
            if (grid >= handle.duration_seconds)
                grid -= granularity;
            start = std::max(0.0, std::min(grid, requested_start));
            Logger::debug("Clamping snapped clip start to " + std::to_string(start) + "s for video " + video_id);
        }
        if (end > handle.duration_seconds)
        {
            Logger::debug("Clamping clip end " + std::to_string(end) + "s to video duration " +
                          std::to_string(handle.duration_seconds) + "s");
            end = handle.duration_seconds;
        }
    }

    Logger::info("Extracting clip " + video_id + " [" + std::to_string(start) + ", " + std::to_string(end) + "]");
    cache_->recordExtraction();
    std::vector<uint8_t> bytes = media_store_->extract(handle, start, end);
    if (bytes.empty())
    {
        throw MediaExtractionError("Media store returned no data for " + video_id);
    }
    return cache_->publish(fingerprint, video_id, start, end, bytes);
}
