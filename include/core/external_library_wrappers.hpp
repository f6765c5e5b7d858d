#pragma once
#include <cstdint>
#include <string>
#include <vector>

extern "C"
{
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/error.h>
#include <libswscale/swscale.h>
}

// Human readable text for an FFmpeg error code
inline std::string avErrorToString(int errnum)
{
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(errnum, buf, sizeof(buf));
    return std::string(buf);
}

// RAII wrapper for a demuxing AVFormatContext opened with avformat_open_input
class AVInputContextRAII
{
private:
    AVFormatContext *ctx_;

public:
    AVInputContextRAII() : ctx_(nullptr) {}
    ~AVInputContextRAII()
    {
        if (ctx_)
            avformat_close_input(&ctx_);
    }

    AVFormatContext *get() { return ctx_; }
    AVFormatContext **address() { return &ctx_; }

    // Disable copy
    AVInputContextRAII(const AVInputContextRAII &) = delete;
    AVInputContextRAII &operator=(const AVInputContextRAII &) = delete;

    // Allow move
    AVInputContextRAII(AVInputContextRAII &&other) noexcept : ctx_(other.ctx_)
    {
        other.ctx_ = nullptr;
    }
};

// RAII wrapper for a muxing AVFormatContext writing into an in-memory dynamic buffer
class AVMemoryOutputContextRAII
{
private:
    AVFormatContext *ctx_;

public:
    AVMemoryOutputContextRAII() : ctx_(nullptr) {}
    ~AVMemoryOutputContextRAII()
    {
        if (!ctx_)
            return;
        if (ctx_->pb)
        {
            uint8_t *buf = nullptr;
            avio_close_dyn_buf(ctx_->pb, &buf);
            av_free(buf);
            ctx_->pb = nullptr;
        }
        avformat_free_context(ctx_);
    }

    AVFormatContext *get() { return ctx_; }
    AVFormatContext **address() { return &ctx_; }

    /**
     * @brief Close the dynamic buffer and hand its bytes to the caller
     */
    std::vector<uint8_t> takeBuffer()
    {
        std::vector<uint8_t> bytes;
        if (!ctx_ || !ctx_->pb)
            return bytes;
        uint8_t *buf = nullptr;
        int size = avio_close_dyn_buf(ctx_->pb, &buf);
        ctx_->pb = nullptr;
        if (buf && size > 0)
            bytes.assign(buf, buf + size);
        av_free(buf);
        return bytes;
    }

    // Disable copy
    AVMemoryOutputContextRAII(const AVMemoryOutputContextRAII &) = delete;
    AVMemoryOutputContextRAII &operator=(const AVMemoryOutputContextRAII &) = delete;
};

// RAII wrapper for FFmpeg AVCodecContext
class AVCodecContextRAII
{
private:
    AVCodecContext *ctx_;

public:
    AVCodecContextRAII() : ctx_(nullptr) {}
    explicit AVCodecContextRAII(AVCodecContext *existing_ctx) : ctx_(existing_ctx) {}

    ~AVCodecContextRAII()
    {
        if (ctx_)
            avcodec_free_context(&ctx_);
    }

    AVCodecContext *get() { return ctx_; }

    void set(AVCodecContext *new_ctx)
    {
        if (ctx_)
            avcodec_free_context(&ctx_);
        ctx_ = new_ctx;
    }

    // Disable copy
    AVCodecContextRAII(const AVCodecContextRAII &) = delete;
    AVCodecContextRAII &operator=(const AVCodecContextRAII &) = delete;
};

// RAII wrapper for FFmpeg AVFrame
class AVFrameRAII
{
private:
    AVFrame *frame_;

public:
    AVFrameRAII() : frame_(av_frame_alloc()) {}
    ~AVFrameRAII()
    {
        if (frame_)
            av_frame_free(&frame_);
    }

    AVFrame *get() { return frame_; }

    // Disable copy
    AVFrameRAII(const AVFrameRAII &) = delete;
    AVFrameRAII &operator=(const AVFrameRAII &) = delete;
};

// RAII wrapper for FFmpeg AVPacket
class AVPacketRAII
{
private:
    AVPacket *packet_;

public:
    AVPacketRAII() : packet_(av_packet_alloc()) {}
    ~AVPacketRAII()
    {
        if (packet_)
            av_packet_free(&packet_);
    }

    AVPacket *get() { return packet_; }

    // Disable copy
    AVPacketRAII(const AVPacketRAII &) = delete;
    AVPacketRAII &operator=(const AVPacketRAII &) = delete;
};

// RAII wrapper for FFmpeg SwsContext
class SwsContextRAII
{
private:
    SwsContext *ctx_;

public:
    SwsContextRAII() : ctx_(nullptr) {}
    ~SwsContextRAII()
    {
        if (ctx_)
            sws_freeContext(ctx_);
    }

    SwsContext *get() { return ctx_; }
    void set(SwsContext *c)
    {
        if (ctx_)
            sws_freeContext(ctx_);
        ctx_ = c;
    }

    // Disable copy
    SwsContextRAII(const SwsContextRAII &) = delete;
    SwsContextRAII &operator=(const SwsContextRAII &) = delete;
};
