#include "ffmpeg_codec.h"
#include "packet_parser.hpp"
#include "stream_errors.hpp"
#include <algorithm>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace {

std::string av_error(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

// Per-call owners of the libav objects
struct CodecContext {
    AVCodecContext* ctx;
    explicit CodecContext(const AVCodec* codec) : ctx(avcodec_alloc_context3(codec)) {
        if (!ctx) throw TransformFailure("Failed to allocate codec context");
    }
    ~CodecContext() { avcodec_free_context(&ctx); }
};

struct Frame {
    AVFrame* frame = av_frame_alloc();
    ~Frame() { av_frame_free(&frame); }
};

struct Packet {
    AVPacket* pkt = av_packet_alloc();
    ~Packet() { av_packet_free(&pkt); }
};

struct Resampler {
    SwrContext* swr = nullptr;
    ~Resampler() { swr_free(&swr); }
};

AVSampleFormat pick_sample_format(const AVCodec* codec) {
    if (!codec->sample_fmts) return AV_SAMPLE_FMT_FLT;
    for (const AVSampleFormat* p = codec->sample_fmts; *p != AV_SAMPLE_FMT_NONE; ++p) {
        if (*p == AV_SAMPLE_FMT_FLT || *p == AV_SAMPLE_FMT_FLTP) return *p;
    }
    return codec->sample_fmts[0];
}

void drain_packets(AVCodecContext* ctx, AVFrame* frame, AVPacket* pkt, std::vector<uint8_t>& out) {
    int ret = avcodec_send_frame(ctx, frame);
    if (ret < 0) throw TransformFailure("avcodec_send_frame failed: " + av_error(ret));

    while (true) {
        ret = avcodec_receive_packet(ctx, pkt);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return;
        if (ret < 0) throw TransformFailure("avcodec_receive_packet failed: " + av_error(ret));

        put_u32(out, static_cast<uint32_t>(pkt->size));
        out.insert(out.end(), pkt->data, pkt->data + pkt->size);
        av_packet_unref(pkt);
    }
}

} // namespace

FFmpegAudioTransform::FFmpegAudioTransform(const std::string& codec_name)
    : m_codecName(codec_name)
{
    encoder = avcodec_find_encoder_by_name(codec_name.c_str());
    if (!encoder || encoder->type != AVMEDIA_TYPE_AUDIO)
        throw std::runtime_error("Audio encoder not found: " + codec_name);

    decoder = avcodec_find_decoder(encoder->id);
    if (!decoder)
        throw std::runtime_error("No decoder for codec: " + codec_name);
}

void FFmpegAudioTransform::prepare(uint32_t sample_rate) {
    m_sampleRate = static_cast<int>(sample_rate);
    std::cout << "[codec] " << encoder->name << " -> " << decoder->name
              << " at " << m_sampleRate << " Hz" << std::endl;
}

EncodedChunk FFmpegAudioTransform::encode(const std::vector<float>& samples, uint32_t num_streams) {
    CodecContext cc(encoder);
    AVCodecContext* ctx = cc.ctx;

    ctx->sample_rate = m_sampleRate;
    ctx->sample_fmt = pick_sample_format(encoder);
    av_channel_layout_default(&ctx->ch_layout, 1);
    ctx->time_base = AVRational{1, m_sampleRate};
    if (num_streams > 0)
        ctx->bit_rate = BITRATE_PER_STREAM * num_streams;

    int ret = avcodec_open2(ctx, encoder, nullptr);
    if (ret < 0)
        throw TransformFailure("Failed to open encoder " + m_codecName + ": " + av_error(ret));

    Resampler rs;
    ret = swr_alloc_set_opts2(&rs.swr,
                              &ctx->ch_layout, ctx->sample_fmt, m_sampleRate,
                              &ctx->ch_layout, AV_SAMPLE_FMT_FLT, m_sampleRate,
                              0, nullptr);
    if (ret < 0 || (ret = swr_init(rs.swr)) < 0)
        throw TransformFailure("Failed to initialize swresample context: " + av_error(ret));

    const bool any_size = (encoder->capabilities & AV_CODEC_CAP_VARIABLE_FRAME_SIZE) != 0 || ctx->frame_size <= 0;
    const bool short_last = any_size || (encoder->capabilities & AV_CODEC_CAP_SMALL_LAST_FRAME) != 0;
    const int total = static_cast<int>(samples.size());
    const int frame_size = any_size ? std::max(total, 1) : ctx->frame_size;

    std::vector<uint8_t> packets;
    Frame fr;
    Packet pk;
    if (!fr.frame || !pk.pkt)
        throw TransformFailure("Failed to allocate frame or packet");

    for (int offset = 0; offset < total; offset += frame_size) {
        int n = std::min(frame_size, total - offset);
        int nb = short_last ? n : frame_size;

        AVFrame* frame = fr.frame;
        av_frame_unref(frame);
        frame->nb_samples = nb;
        frame->format = ctx->sample_fmt;
        frame->sample_rate = m_sampleRate;
        if (av_channel_layout_copy(&frame->ch_layout, &ctx->ch_layout) < 0 ||
            av_frame_get_buffer(frame, 0) < 0)
            throw TransformFailure("Could not allocate audio frame buffer");

        const uint8_t* in[1] = { reinterpret_cast<const uint8_t*>(samples.data() + offset) };
        int converted = swr_convert(rs.swr, frame->data, n, in, n);
        if (converted < 0)
            throw TransformFailure("swr_convert failed: " + av_error(converted));
        if (nb > converted)
            av_samples_set_silence(frame->data, converted, nb - converted, 1, ctx->sample_fmt);

        frame->pts = offset;
        drain_packets(ctx, frame, pk.pkt, packets);
    }
    drain_packets(ctx, nullptr, pk.pkt, packets);

    EncodedChunk out;
    put_u32(out.payload, static_cast<uint32_t>(ctx->extradata_size));
    if (ctx->extradata_size > 0)
        out.payload.insert(out.payload.end(), ctx->extradata, ctx->extradata + ctx->extradata_size);
    out.payload.insert(out.payload.end(), packets.begin(), packets.end());

    out.shape = {
        static_cast<uint32_t>(samples.size()),
        static_cast<uint32_t>(std::max(ctx->initial_padding, 0)),
        static_cast<uint32_t>(std::max(ctx->frame_size, 0))
    };
    return out;
}

std::vector<float> FFmpegAudioTransform::decode(const std::vector<uint8_t>& payload,
                                                const std::vector<uint32_t>& shape) {
    if (shape.size() < 2)
        throw TransformFailure("ffmpeg payload needs {samples, delay} shape");
    const uint32_t sample_count = shape[0];
    const uint32_t delay = shape[1];

    if (payload.size() < 4) throw TransformFailure("ffmpeg payload too short");
    size_t pos = 0;
    uint32_t extradata_size = get_u32(payload.data());
    pos += 4;
    if (extradata_size > payload.size() - pos)
        throw TransformFailure("ffmpeg payload extradata overruns payload");

    CodecContext cc(decoder);
    AVCodecContext* ctx = cc.ctx;
    ctx->sample_rate = m_sampleRate;
    av_channel_layout_default(&ctx->ch_layout, 1);
    if (extradata_size > 0) {
        ctx->extradata = static_cast<uint8_t*>(av_mallocz(extradata_size + AV_INPUT_BUFFER_PADDING_SIZE));
        if (!ctx->extradata) throw TransformFailure("Failed to allocate extradata");
        std::memcpy(ctx->extradata, payload.data() + pos, extradata_size);
        ctx->extradata_size = static_cast<int>(extradata_size);
    }
    pos += extradata_size;

    int ret = avcodec_open2(ctx, decoder, nullptr);
    if (ret < 0)
        throw TransformFailure("Could not open decoder " + std::string(decoder->name) + ": " + av_error(ret));

    Frame fr;
    Packet pk;
    Resampler rs;
    std::vector<float> out;
    AVChannelLayout mono;
    av_channel_layout_default(&mono, 1);

    auto receive_frames = [&]() {
        while (true) {
            int r = avcodec_receive_frame(ctx, fr.frame);
            if (r == AVERROR(EAGAIN) || r == AVERROR_EOF) return;
            if (r < 0) throw TransformFailure("avcodec_receive_frame failed: " + av_error(r));

            AVFrame* frame = fr.frame;
            int in_rate = frame->sample_rate > 0 ? frame->sample_rate : ctx->sample_rate;
            if (!rs.swr) {
                r = swr_alloc_set_opts2(&rs.swr,
                                        &mono, AV_SAMPLE_FMT_FLT, m_sampleRate,
                                        &frame->ch_layout, static_cast<AVSampleFormat>(frame->format), in_rate,
                                        0, nullptr);
                if (r < 0 || (r = swr_init(rs.swr)) < 0)
                    throw TransformFailure("Failed to initialize swresample context: " + av_error(r));
            }

            int capacity = swr_get_out_samples(rs.swr, frame->nb_samples);
            size_t old = out.size();
            out.resize(old + std::max(capacity, 0));
            uint8_t* dst[1] = { reinterpret_cast<uint8_t*>(out.data() + old) };
            int got = swr_convert(rs.swr, dst, capacity,
                                  const_cast<const uint8_t**>(frame->extended_data), frame->nb_samples);
            if (got < 0) throw TransformFailure("swr_convert failed: " + av_error(got));
            out.resize(old + got);
            av_frame_unref(frame);
        }
    };

    while (pos < payload.size()) {
        if (payload.size() - pos < 4) throw TransformFailure("truncated packet header in ffmpeg payload");
        uint32_t size = get_u32(payload.data() + pos);
        pos += 4;
        if (size > payload.size() - pos) throw TransformFailure("packet overruns ffmpeg payload");

        ret = av_new_packet(pk.pkt, static_cast<int>(size));
        if (ret < 0) throw TransformFailure("av_new_packet failed: " + av_error(ret));
        std::memcpy(pk.pkt->data, payload.data() + pos, size);
        pos += size;

        ret = avcodec_send_packet(ctx, pk.pkt);
        av_packet_unref(pk.pkt);
        if (ret < 0) throw TransformFailure("avcodec_send_packet failed: " + av_error(ret));
        receive_frames();
    }

    ret = avcodec_send_packet(ctx, nullptr);
    if (ret < 0 && ret != AVERROR_EOF) throw TransformFailure("decoder flush failed: " + av_error(ret));
    receive_frames();

    // Resampler delay
    if (rs.swr) {
        int pending = swr_get_out_samples(rs.swr, 0);
        if (pending > 0) {
            size_t old = out.size();
            out.resize(old + pending);
            uint8_t* dst[1] = { reinterpret_cast<uint8_t*>(out.data() + old) };
            int got = swr_convert(rs.swr, dst, pending, nullptr, 0);
            out.resize(old + std::max(got, 0));
        }
    }

    if (out.empty() && sample_count > 0)
        throw TransformFailure("decoder produced no samples");

    size_t skip = std::min<size_t>(delay, out.size());
    out.erase(out.begin(), out.begin() + skip);
    out.resize(sample_count, 0.0f);
    return out;
}
