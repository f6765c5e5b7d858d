#include "core/frame_sampler.hpp"
#include "core/errors.hpp"
#include "core/external_library_wrappers.hpp"
#include "logging/logger.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <cstdio>
#include <filesystem>

namespace fs = std::filesystem;

FFmpegMediaAnalyzer::FFmpegMediaAnalyzer(std::string output_dir)
    : output_dir_(std::move(output_dir))
{
}

MediaProbe FFmpegMediaAnalyzer::probe(const std::string &media_path)
{
    return FFmpegMediaStore::probe(media_path);
}

std::vector<FrameSample> FFmpegMediaAnalyzer::sampleFrames(const VideoAsset &video, double interval_seconds)
{
    if (!(interval_seconds > 0.0))
    {
        throw MalformedInputError("Frame sample interval must be positive for video " + video.id);
    }

    AVInputContextRAII format_ctx;
    int ret = avformat_open_input(format_ctx.address(), video.media_path.c_str(), nullptr, nullptr);
    if (ret < 0)
    {
        throw MediaExtractionError("Could not open video file " + video.media_path + ": " + avErrorToString(ret));
    }
    if (avformat_find_stream_info(format_ctx.get(), nullptr) < 0)
    {
        throw MediaExtractionError("Could not find stream information (file may be corrupted): " + video.media_path);
    }

    const AVCodec *codec = nullptr;
    int video_stream_index = av_find_best_stream(format_ctx.get(), AVMEDIA_TYPE_VIDEO, -1, -1, &codec, 0);
    if (video_stream_index < 0 || !codec)
    {
        throw MediaExtractionError("No decodable video stream in " + video.media_path);
    }
    AVStream *video_stream = format_ctx.get()->streams[video_stream_index];

    AVCodecContextRAII codec_ctx(avcodec_alloc_context3(codec));
    if (!codec_ctx.get())
    {
        throw MediaExtractionError("Could not allocate decoder context");
    }
    if (avcodec_parameters_to_context(codec_ctx.get(), video_stream->codecpar) < 0)
    {
        throw MediaExtractionError("Could not copy codec parameters");
    }
    if (avcodec_open2(codec_ctx.get(), codec, nullptr) < 0)
    {
        throw MediaExtractionError("Could not open decoder for " + video.media_path);
    }

    AVFrameRAII frame;
    AVPacketRAII packet;
    SwsContextRAII sws_ctx;
    if (!frame.get() || !packet.get())
    {
        throw MediaExtractionError("Could not allocate frame or packet");
    }

    const fs::path frame_dir = fs::path(output_dir_) / video.id;
    std::error_code ec;
    fs::create_directories(frame_dir, ec);
    if (ec)
    {
        throw MediaExtractionError("Could not create frame directory " + frame_dir.string() + ": " + ec.message());
    }

    const double time_base = av_q2d(video_stream->time_base);
    std::vector<FrameSample> samples;
    double next_target = 0.0;
    int scaler_width = 0;
    int scaler_height = 0;

    auto drain = [&]()
    {
        while (true)
        {
            int response = avcodec_receive_frame(codec_ctx.get(), frame.get());
            if (response == AVERROR(EAGAIN) || response == AVERROR_EOF)
                return;
            if (response < 0)
            {
                Logger::warn("Decoder error in " + video.media_path + ": " + avErrorToString(response));
                return;
            }

            int64_t pts = frame.get()->best_effort_timestamp;
            double timestamp = pts == AV_NOPTS_VALUE ? next_target : pts * time_base;
            if (video_stream->start_time != AV_NOPTS_VALUE)
                timestamp -= video_stream->start_time * time_base;
            if (timestamp + 1e-9 < next_target)
                continue;

            const int width = frame.get()->width;
            const int height = frame.get()->height;
            if (!sws_ctx.get() || width != scaler_width || height != scaler_height)
            {
                sws_ctx.set(sws_getContext(width, height, static_cast<AVPixelFormat>(frame.get()->format), width,
                                           height, AV_PIX_FMT_BGR24, SWS_BILINEAR, nullptr, nullptr, nullptr));
                if (!sws_ctx.get())
                {
                    throw MediaExtractionError("Could not create scaler context");
                }
                scaler_width = width;
                scaler_height = height;
            }

            cv::Mat image(height, width, CV_8UC3);
            uint8_t *dst_data[4] = {image.data, nullptr, nullptr, nullptr};
            int dst_linesize[4] = {static_cast<int>(image.step[0]), 0, 0, 0};
            sws_scale(sws_ctx.get(), frame.get()->data, frame.get()->linesize, 0, height, dst_data, dst_linesize);

            char name[32];
            std::snprintf(name, sizeof(name), "f%06zu.jpg", samples.size());
            const fs::path image_path = frame_dir / name;
            if (!cv::imwrite(image_path.string(), image))
            {
                Logger::warn("Failed to write frame " + image_path.string());
            }
            else
            {
                FrameSample sample;
                sample.video_id = video.id;
                sample.timestamp = timestamp < 0.0 ? 0.0 : timestamp;
                sample.image_ref = image_path.string();
                samples.push_back(sample);
            }

            while (next_target <= timestamp)
                next_target += interval_seconds;
        }
    };

    try
    {
        while (av_read_frame(format_ctx.get(), packet.get()) >= 0)
        {
            if (packet.get()->stream_index == video_stream_index)
            {
                if (avcodec_send_packet(codec_ctx.get(), packet.get()) >= 0)
                    drain();
            }
            av_packet_unref(packet.get());
        }
        // Flush frames still buffered in the decoder
        if (avcodec_send_packet(codec_ctx.get(), nullptr) >= 0)
            drain();
    }
    catch (const cv::Exception &e)
    {
        throw MediaExtractionError("OpenCV error while sampling frames from " + video.media_path + ": " + e.what());
    }

    Logger::info("Sampled " + std::to_string(samples.size()) + " frames from " + video.id + " every " +
                 std::to_string(interval_seconds) + "s");
    return samples;
}
