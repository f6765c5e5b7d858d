#include "core/ffmpeg_media_store.hpp"
#include "core/errors.hpp"
#include "core/external_library_wrappers.hpp"
#include "database/chunk_store.hpp"
#include "logging/logger.hpp"

extern "C"
{
#include <libavutil/dict.h>
#include <libavutil/mathematics.h>
}

namespace
{
    // libavformat names the Matroska muxer "matroska"; the cache names files by extension
    std::string muxerName(const std::string &container)
    {
        if (container == "mkv")
            return "matroska";
        return container;
    }

    void openInput(AVInputContextRAII &input, const std::string &path)
    {
        int ret = avformat_open_input(input.address(), path.c_str(), nullptr, nullptr);
        if (ret < 0)
        {
            throw MediaExtractionError("Could not open media file " + path + ": " + avErrorToString(ret));
        }
        ret = avformat_find_stream_info(input.get(), nullptr);
        if (ret < 0)
        {
            throw MediaExtractionError("Could not find stream information (file may be corrupted): " + path);
        }
    }
}

FFmpegMediaStore::FFmpegMediaStore(std::shared_ptr<ChunkStore> catalog, std::string container)
    : catalog_(std::move(catalog)), container_(std::move(container))
{
    if (!catalog_)
    {
        throw std::invalid_argument("FFmpegMediaStore requires a video catalog");
    }
}

MediaProbe FFmpegMediaStore::probe(const std::string &media_path)
{
    AVInputContextRAII input;
    openInput(input, media_path);

    MediaProbe probe;
    if (input.get()->duration > 0)
        probe.duration_seconds = static_cast<double>(input.get()->duration) / AV_TIME_BASE;

    int video_index = av_find_best_stream(input.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (video_index < 0)
    {
        throw MediaExtractionError("No video stream found in " + media_path);
    }
    AVStream *stream = input.get()->streams[video_index];
    if (stream->avg_frame_rate.num > 0 && stream->avg_frame_rate.den > 0)
        probe.frame_rate = av_q2d(stream->avg_frame_rate);
    else if (stream->r_frame_rate.num > 0 && stream->r_frame_rate.den > 0)
        probe.frame_rate = av_q2d(stream->r_frame_rate);
    probe.width = stream->codecpar->width;
    probe.height = stream->codecpar->height;

    if (probe.duration_seconds <= 0.0 && stream->duration > 0)
        probe.duration_seconds = stream->duration * av_q2d(stream->time_base);
    if (probe.duration_seconds <= 0.0)
    {
        throw MediaExtractionError("Video file has invalid or zero duration (possibly corrupted): " + media_path);
    }

    Logger::debug("Probed " + media_path + " - duration: " + std::to_string(probe.duration_seconds) +
                  "s, fps: " + std::to_string(probe.frame_rate));
    return probe;
}

MediaHandle FFmpegMediaStore::open(const std::string &video_id)
{
    auto video = catalog_->getVideo(video_id);
    if (!video)
    {
        throw MediaExtractionError("Unknown video: " + video_id);
    }
    MediaHandle handle;
    handle.video_id = video->id;
    handle.media_path = video->media_path;
    handle.duration_seconds = video->duration_seconds;
    return handle;
}

std::vector<uint8_t> FFmpegMediaStore::extract(const MediaHandle &handle, double start, double end)
{
    if (!(end > start))
    {
        throw MediaExtractionError("Empty clip range for " + handle.video_id);
    }

    AVInputContextRAII input;
    openInput(input, handle.media_path);

    AVMemoryOutputContextRAII output;
    const std::string muxer = muxerName(container_);
    int ret = avformat_alloc_output_context2(output.address(), nullptr, muxer.c_str(), nullptr);
    if (ret < 0 || !output.get())
    {
        throw MediaExtractionError("Unsupported clip container '" + container_ + "'");
    }

    const unsigned int stream_count = input.get()->nb_streams;
    std::vector<int> stream_map(stream_count, -1);
    size_t mapped = 0;
    for (unsigned int i = 0; i < stream_count; ++i)
    {
        AVStream *in_stream = input.get()->streams[i];
        AVMediaType type = in_stream->codecpar->codec_type;
        if (type != AVMEDIA_TYPE_VIDEO && type != AVMEDIA_TYPE_AUDIO)
            continue;

        AVStream *out_stream = avformat_new_stream(output.get(), nullptr);
        if (!out_stream)
        {
            throw MediaExtractionError("Could not allocate output stream");
        }
        ret = avcodec_parameters_copy(out_stream->codecpar, in_stream->codecpar);
        if (ret < 0)
        {
            throw MediaExtractionError("Could not copy codec parameters: " + avErrorToString(ret));
        }
        out_stream->codecpar->codec_tag = 0;
        out_stream->time_base = in_stream->time_base;
        stream_map[i] = out_stream->index;
        ++mapped;
    }
    if (mapped == 0)
    {
        throw MediaExtractionError("No audio or video streams in " + handle.media_path);
    }

    ret = avio_open_dyn_buf(&output.get()->pb);
    if (ret < 0)
    {
        throw MediaExtractionError("Could not open memory output: " + avErrorToString(ret));
    }

    // The output is not seekable, so MP4 needs fragments with an up-front moov
    AVDictionary *options = nullptr;
    if (container_ == "mp4" || container_ == "mov")
        av_dict_set(&options, "movflags", "frag_keyframe+empty_moov", 0);
    ret = avformat_write_header(output.get(), &options);
    av_dict_free(&options);
    if (ret < 0)
    {
        throw MediaExtractionError("Could not write clip header (unsupported codec for " + container_ +
                                   "?): " + avErrorToString(ret));
    }

    int64_t seek_target = static_cast<int64_t>(start * AV_TIME_BASE);
    ret = av_seek_frame(input.get(), -1, seek_target, AVSEEK_FLAG_BACKWARD);
    if (ret < 0)
    {
        Logger::warn("Seek to " + std::to_string(start) + "s failed in " + handle.media_path +
                     ", reading from the beginning: " + avErrorToString(ret));
    }

    AVPacketRAII packet;
    std::vector<int64_t> first_dts(stream_count, AV_NOPTS_VALUE);
    std::vector<bool> finished(stream_count, false);
    size_t active = mapped;
    size_t written = 0;

    while (active > 0)
    {
        ret = av_read_frame(input.get(), packet.get());
        if (ret == AVERROR_EOF)
            break;
        if (ret < 0)
        {
            throw MediaExtractionError("Error reading " + handle.media_path + ": " + avErrorToString(ret));
        }

        const int index = packet.get()->stream_index;
        if (index < 0 || static_cast<unsigned int>(index) >= stream_count || stream_map[index] < 0 || finished[index])
        {
            av_packet_unref(packet.get());
            continue;
        }

        AVStream *in_stream = input.get()->streams[index];
        int64_t ts = packet.get()->pts != AV_NOPTS_VALUE ? packet.get()->pts : packet.get()->dts;
        if (ts != AV_NOPTS_VALUE && ts * av_q2d(in_stream->time_base) > end)
        {
            finished[index] = true;
            --active;
            av_packet_unref(packet.get());
            continue;
        }

        if (first_dts[index] == AV_NOPTS_VALUE)
        {
            int64_t base = packet.get()->dts != AV_NOPTS_VALUE ? packet.get()->dts : ts;
            first_dts[index] = base == AV_NOPTS_VALUE ? 0 : base;
        }
        if (packet.get()->pts != AV_NOPTS_VALUE)
            packet.get()->pts -= first_dts[index];
        if (packet.get()->dts != AV_NOPTS_VALUE)
            packet.get()->dts -= first_dts[index];

        AVStream *out_stream = output.get()->streams[stream_map[index]];
        packet.get()->stream_index = stream_map[index];
        av_packet_rescale_ts(packet.get(), in_stream->time_base, out_stream->time_base);
        packet.get()->pos = -1;

        ret = av_interleaved_write_frame(output.get(), packet.get());
        if (ret < 0)
        {
            throw MediaExtractionError("Error muxing clip packet: " + avErrorToString(ret));
        }
        ++written;
    }

    if (written == 0)
    {
        throw MediaExtractionError("No packets found between " + std::to_string(start) + "s and " +
                                   std::to_string(end) + "s in " + handle.media_path);
    }

    ret = av_write_trailer(output.get());
    if (ret < 0)
    {
        throw MediaExtractionError("Could not finalize clip: " + avErrorToString(ret));
    }

    std::vector<uint8_t> bytes = output.takeBuffer();
    Logger::debug("Extracted " + std::to_string(written) + " packets (" + std::to_string(bytes.size()) +
                  " bytes) from " + handle.video_id);
    return bytes;
}
