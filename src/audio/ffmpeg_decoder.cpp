#include "audio/ffmpeg_decoder.hpp"
#include <boost/asio/post.hpp>
#include <cstring>
#include <iostream>
#include <stdexcept>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/channel_layout.h>
#include <libavutil/opt.h>
#include <libswresample/swresample.h>
}

namespace voxcall {

namespace {

struct CodecContextDeleter {
    void operator()(AVCodecContext* ctx) const { avcodec_free_context(&ctx); }
};
struct ParserDeleter {
    void operator()(AVCodecParserContext* parser) const { av_parser_close(parser); }
};
struct PacketDeleter {
    void operator()(AVPacket* pkt) const { av_packet_free(&pkt); }
};
struct FrameDeleter {
    void operator()(AVFrame* frame) const { av_frame_free(&frame); }
};
struct SwrDeleter {
    void operator()(SwrContext* swr) const { swr_free(&swr); }
};

using CodecContextPtr = std::unique_ptr<AVCodecContext, CodecContextDeleter>;
using ParserPtr = std::unique_ptr<AVCodecParserContext, ParserDeleter>;
using PacketPtr = std::unique_ptr<AVPacket, PacketDeleter>;
using FramePtr = std::unique_ptr<AVFrame, FrameDeleter>;
using SwrPtr = std::unique_ptr<SwrContext, SwrDeleter>;

class ChunkDecoder {
public:
    explicit ChunkDecoder(const AVCodec* codec)
        : parser_(av_parser_init(codec->id))
        , ctx_(avcodec_alloc_context3(codec))
        , packet_(av_packet_alloc())
        , frame_(av_frame_alloc()) {
        if (!parser_ || !ctx_ || !packet_ || !frame_) {
            throw std::runtime_error("FFmpeg allocation failed");
        }
        if (avcodec_open2(ctx_.get(), codec, nullptr) < 0) {
            throw std::runtime_error("Could not open audio codec");
        }
    }

    bool feed(const std::uint8_t* data, int size) {
        while (size > 0) {
            int used = av_parser_parse2(parser_.get(), ctx_.get(),
                                        &packet_->data, &packet_->size,
                                        data, size,
                                        AV_NOPTS_VALUE, AV_NOPTS_VALUE, 0);
            if (used < 0) return false;
            data += used;
            size -= used;
            if (packet_->size > 0 && !sendPacket(packet_.get())) return false;
        }
        return true;
    }

    bool finish() {
        av_parser_parse2(parser_.get(), ctx_.get(),
                         &packet_->data, &packet_->size,
                         nullptr, 0, AV_NOPTS_VALUE, AV_NOPTS_VALUE, 0);
        if (packet_->size > 0 && !sendPacket(packet_.get())) return false;
        return sendPacket(nullptr);
    }

    std::optional<PcmBuffer> result() {
        if (samples_.empty()) return std::nullopt;
        PcmBuffer pcm;
        pcm.samples = std::move(samples_);
        pcm.sampleRate = sampleRate_;
        pcm.channels = 1;
        return pcm;
    }

private:
    ParserPtr parser_;
    CodecContextPtr ctx_;
    PacketPtr packet_;
    FramePtr frame_;
    SwrPtr swr_;
    int sampleRate_{0};
    std::vector<float> samples_;

    bool sendPacket(const AVPacket* packet) {
        int ret = avcodec_send_packet(ctx_.get(), packet);
        // A corrupt frame inside an otherwise good chunk is skipped.
        if (ret < 0 && ret != AVERROR(EAGAIN) && ret != AVERROR_EOF) {
            return packet != nullptr || !samples_.empty();
        }
        while (true) {
            ret = avcodec_receive_frame(ctx_.get(), frame_.get());
            if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return true;
            if (ret < 0) return false;
            bool ok = appendFrame(frame_.get());
            av_frame_unref(frame_.get());
            if (!ok) return false;
        }
    }

    bool appendFrame(const AVFrame* frame) {
        if (!swr_) {
            SwrContext* swr = nullptr;
            AVChannelLayout mono;
            av_channel_layout_default(&mono, 1);
            int ret = swr_alloc_set_opts2(&swr,
                                          &mono, AV_SAMPLE_FMT_FLT, frame->sample_rate,
                                          &frame->ch_layout,
                                          static_cast<AVSampleFormat>(frame->format),
                                          frame->sample_rate,
                                          0, nullptr);
            if (ret < 0 || !swr) return false;
            swr_.reset(swr);
            if (swr_init(swr_.get()) < 0) return false;
            sampleRate_ = frame->sample_rate;
        }
        if (frame->sample_rate != sampleRate_) return false;

        int capacity = swr_get_out_samples(swr_.get(), frame->nb_samples);
        if (capacity <= 0) return true;
        std::size_t offset = samples_.size();
        samples_.resize(offset + static_cast<std::size_t>(capacity));
        auto* out = reinterpret_cast<std::uint8_t*>(samples_.data() + offset);
        int converted = swr_convert(swr_.get(), &out, capacity,
                                    const_cast<const std::uint8_t**>(frame->extended_data),
                                    frame->nb_samples);
        if (converted < 0) {
            samples_.resize(offset);
            return false;
        }
        samples_.resize(offset + static_cast<std::size_t>(converted));
        return true;
    }
};

} // namespace

FfmpegDecoder::FfmpegDecoder(EventLoop& loop)
    : loop_(loop)
    , alive_(std::make_shared<char>(0)) {
    if (!avcodec_find_decoder(AV_CODEC_ID_MP3)) {
        throw std::runtime_error("FFmpeg has no MP3 decoder");
    }
}

FfmpegDecoder::~FfmpegDecoder() {
    alive_.reset();
    worker_.join();
}

void FfmpegDecoder::decode(AudioChunk chunk, DecodeCallback done) {
    std::weak_ptr<char> alive = alive_;
    EventLoop* loop = &loop_;
    boost::asio::post(worker_, [alive, loop, chunk = std::move(chunk), done = std::move(done)]() mutable {
        auto pcm = decodeChunk(chunk);
        if (alive.expired()) return;
        loop->post([alive, pcm = std::move(pcm), done = std::move(done)]() mutable {
            if (alive.expired()) return;
            done(std::move(pcm));
        });
    });
}

std::optional<PcmBuffer> FfmpegDecoder::decodeChunk(const AudioChunk& chunk) {
    if (chunk.empty()) return std::nullopt;

    const AVCodec* codec = avcodec_find_decoder(AV_CODEC_ID_MP3);
    if (!codec) return std::nullopt;

    // The parser may read past the end; FFmpeg requires zeroed padding.
    std::vector<std::uint8_t> input(chunk.size() + AV_INPUT_BUFFER_PADDING_SIZE, 0);
    std::memcpy(input.data(), chunk.data(), chunk.size());

    try {
        ChunkDecoder decoder(codec);
        if (!decoder.feed(input.data(), static_cast<int>(chunk.size()))) return std::nullopt;
        if (!decoder.finish()) return std::nullopt;
        return decoder.result();
    } catch (const std::runtime_error& e) {
        std::cerr << "Warning: audio decoder: " << e.what() << std::endl;
        return std::nullopt;
    }
}

} // namespace voxcall
