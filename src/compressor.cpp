#include "compressor.hpp"
#include "overlap_reconstructor.hpp"
#include "packet_parser.hpp"
#include "stream_errors.hpp"

#include <iomanip>
#include <iostream>
#include <stdexcept>

using namespace std;
typedef chrono::steady_clock Clock;

CompressResult compress_signal(const vector<float>& samples, uint32_t sample_rate,
                               const CompressConfig& config, AudioTransform& transform,
                               const CancellationToken& cancel) {
    config.geometry.validate();
    if (sample_rate == 0)
        throw invalid_argument("sample rate must be positive");

    transform.prepare(sample_rate);

    CompressResult result;
    SessionAccounting accounting("local");
    accounting.start();

    SignalSlicer slicer(samples.data(), samples.size(), config.geometry);
    cout << "[compress] " << samples.size() << " samples as " << slicer.total_chunks() << " chunks (hop "
         << config.geometry.hop_size() << "), codec " << transform.name() << endl;

    uint32_t current = 0;
    OverlapReconstructor reconstructor(config.geometry, slicer.total_chunks(),
        [&](uint32_t index, const vector<float>& out) {
            result.samples.insert(result.samples.end(), out.begin(), out.end());
            if (config.keep_chunks)
                result.chunks.emplace_back(index ? index : current, out);
        });

    const auto pace = chrono::duration_cast<Clock::duration>(
        chrono::duration<double>(static_cast<double>(config.geometry.chunk_size) / sample_rate));

    AudioChunk chunk;
    while (!cancel.cancelled() && slicer.next(chunk)) {
        accounting.chunk_queued();

        auto t0 = Clock::now();
        EncodedChunk encoded;
        try {
            encoded = transform.encode(chunk.samples, config.num_streams);
        } catch (const TransformFailure& e) {
            cerr << "[compress] Encoding chunk " << chunk.index << " failed, skipped: " << e.what() << endl;
            accounting.chunk_skipped();
            continue;
        }
        accounting.record_stage(Stage::Encode, Clock::now() - t0);

        AudioPacket pkt;
        pkt.chunk_index = chunk.index;
        pkt.timestamp_us = chunk.timestamp_us;
        pkt.payload = encoded.payload;
        pkt.shape = encoded.shape;
        vector<uint8_t> body = serialize_packet(pkt);
        put_u32(result.encoded, static_cast<uint32_t>(body.size()));
        result.encoded.insert(result.encoded.end(), body.begin(), body.end());
        accounting.record_packet(body.size() + 4);

        t0 = Clock::now();
        vector<float> decoded;
        try {
            decoded = transform.decode(encoded.payload, encoded.shape);
        } catch (const TransformFailure& e) {
            cerr << "[compress] Decoding chunk " << chunk.index << " failed, skipped: " << e.what() << endl;
            accounting.chunk_skipped();
            continue;
        }
        auto elapsed = Clock::now() - t0;
        accounting.record_stage(Stage::Decode, elapsed);

        current = chunk.index;
        if (reconstructor.handle(chunk.index, std::move(decoded)))
            accounting.chunk_processed();
        else
            accounting.chunk_skipped();

        cout << "[compress] Chunk " << chunk.index << ": " << body.size() + 4 << " bytes, decoded in "
             << fixed << setprecision(4) << chrono::duration<double>(elapsed).count() << "s" << endl;

        if (config.realtime && !sleep_unless_cancelled(pace, cancel))
            break;
    }
    reconstructor.finish();

    if (cancel.cancelled()) {
        accounting.fail("cancelled");
        cout << "[compress] Cancelled after " << slicer.produced() << " chunks" << endl;
    } else {
        if (result.samples.size() > samples.size())
            result.samples.resize(samples.size());
        accounting.complete();
    }

    result.report = accounting.snapshot();
    return result;
}
