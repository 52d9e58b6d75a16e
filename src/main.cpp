#include "sender_receiver.hpp"
#include "compressor.hpp"
#include "ffmpeg_codec.h"
#include "stream_errors.hpp"
#include "wav_io.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>

namespace {

CancellationToken g_cancel;

void signal_handler(int) {
    g_cancel.cancel();
}

void install_signal_handlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;  // no SA_RESTART: a blocking stdin read must return
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

void print_usage(const char* prog) {
    std::cerr << "Usage:\n"
              << "  " << prog << " send --input <file.wav|-> [--host localhost] [--port 8888]\n"
              << "      [--chunk-size 16000] [--overlap-size 1600] [--num-streams 6] [--codec flac]\n"
              << "      [--rate-limit] [--rate-limit-bps 375] [--realtime] [--sample-rate 16000]\n"
              << "      [--queue-capacity 10] [--save-input <file.wav>]\n"
              << "  " << prog << " receive [--host 0.0.0.0] [--port 8888] [--save-path ./output]\n"
              << "      [--save-chunks] [--packet-log <file>] [--codec flac] [--queue-capacity 20]\n"
              << "  " << prog << " compress --input <file.wav> [--save-path ./output] [--chunk-size 16000]\n"
              << "      [--overlap-size 1600] [--num-streams 6] [--codec flac] [--realtime] [--save-chunks]\n"
              << "\n--input - reads signed 16-bit little-endian mono PCM from stdin as a live stream;\n"
              << "--save-input keeps a copy of what was read.\n"
              << "compress runs the chunk codec locally, without a network.\n"
              << "--codec takes any FFmpeg audio encoder name, or identity for raw float samples.\n";
}

std::unique_ptr<AudioTransform> make_transform(const std::string& codec) {
    if (codec == "identity")
        return std::unique_ptr<AudioTransform>(new IdentityTransform());
    return std::unique_ptr<AudioTransform>(new FFmpegAudioTransform(codec));
}

// s16le mono from stdin, one burst per read()
class StdinSource {
public:
    explicit StdinSource(size_t burst_samples) : buffer_(burst_samples * 2) {}

    bool operator()(std::vector<float>& out) {
        ssize_t n = ::read(STDIN_FILENO, buffer_.data() + carry_, buffer_.size() - carry_);
        if (n < 0) {
            if (errno != EINTR)
                std::cerr << "[sender] stdin read failed: " << std::strerror(errno) << std::endl;
            return false;
        }
        if (n == 0) return false;

        size_t bytes = carry_ + static_cast<size_t>(n);
        size_t samples = bytes / 2;
        out.resize(samples);
        for (size_t i = 0; i < samples; ++i) {
            int16_t v = static_cast<int16_t>(buffer_[2 * i] | (buffer_[2 * i + 1] << 8));
            out[i] = v / 32768.0f;
        }
        carry_ = bytes % 2;
        if (carry_) buffer_[0] = buffer_[bytes - 1];
        return true;
    }

private:
    std::vector<uint8_t> buffer_;
    size_t carry_ = 0;
};

std::string kbps_label(uint32_t num_streams) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(1) << num_streams * 1.5 << "kbps";
    return os.str();
}

struct Options {
    std::string input;
    std::string host;
    int port = 8888;
    uint32_t chunk_size = 16000;
    uint32_t overlap_size = 1600;
    uint32_t num_streams = 6;
    std::string codec = "flac";
    bool rate_limit = false;
    size_t rate_limit_bps = 375;
    bool realtime = false;
    uint32_t sample_rate = 16000;
    size_t queue_capacity = 0;
    std::string save_path = "./output";
    bool save_chunks = false;
    std::string packet_log;
    std::string save_input;
};

Options parse_options(int argc, char** argv) {
    Options opt;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument(arg + " needs a value");
            return argv[++i];
        };

        if (arg == "--input") opt.input = value();
        else if (arg == "--host") opt.host = value();
        else if (arg == "--port") opt.port = std::stoi(value());
        else if (arg == "--chunk-size") opt.chunk_size = static_cast<uint32_t>(std::stoul(value()));
        else if (arg == "--overlap-size") opt.overlap_size = static_cast<uint32_t>(std::stoul(value()));
        else if (arg == "--num-streams") opt.num_streams = static_cast<uint32_t>(std::stoul(value()));
        else if (arg == "--codec") opt.codec = value();
        else if (arg == "--rate-limit") opt.rate_limit = true;
        else if (arg == "--rate-limit-bps") opt.rate_limit_bps = std::stoul(value());
        else if (arg == "--realtime") opt.realtime = true;
        else if (arg == "--sample-rate") opt.sample_rate = static_cast<uint32_t>(std::stoul(value()));
        else if (arg == "--queue-capacity") opt.queue_capacity = std::stoul(value());
        else if (arg == "--save-path") opt.save_path = value();
        else if (arg == "--save-chunks") opt.save_chunks = true;
        else if (arg == "--packet-log") opt.packet_log = value();
        else if (arg == "--save-input") opt.save_input = value();
        else throw std::invalid_argument("unknown option " + arg);
    }
    return opt;
}

int run_send(const Options& opt) {
    if (opt.input.empty()) {
        std::cerr << "[sender] --input is required" << std::endl;
        return 1;
    }

    SenderConfig config;
    config.host = opt.host.empty() ? "localhost" : opt.host;
    config.port = opt.port;
    config.geometry.chunk_size = opt.chunk_size;
    config.geometry.overlap_size = opt.overlap_size;
    config.num_streams = opt.num_streams;
    config.enable_rate_limit = opt.rate_limit;
    config.rate_limit_bps = opt.rate_limit_bps;
    config.realtime = opt.realtime;
    if (opt.queue_capacity) config.queue_capacity = opt.queue_capacity;

    std::unique_ptr<AudioTransform> transform = make_transform(opt.codec);
    StreamSender sender(config, *transform, g_cancel);

    SessionReport report;
    if (opt.input == "-") {
        sender.connect();
        StdinSource source(config.geometry.hop_size());
        std::vector<float> captured;
        report = sender.stream_live([&](std::vector<float>& burst) {
            if (!source(burst)) return false;
            if (!opt.save_input.empty())
                captured.insert(captured.end(), burst.begin(), burst.end());
            return true;
        }, opt.sample_rate);

        if (!opt.save_input.empty()) {
            write_wav(opt.save_input, captured, opt.sample_rate);
            std::cout << "[sender] Saved " << captured.size() << " input samples to " << opt.save_input << std::endl;
        }
    } else {
        WavAudio audio = read_wav(opt.input);
        if (audio.sample_rate != opt.sample_rate)
            std::cout << "[sender] " << opt.input << " is " << audio.sample_rate
                      << " Hz, streaming at the file's rate" << std::endl;
        sender.connect();
        report = sender.stream_signal(audio.samples, audio.sample_rate);
    }

    std::cout << format_report(report) << std::endl;
    return report.completed ? 0 : 1;
}

int run_receive(const Options& opt) {
    ReceiverConfig config;
    config.host = opt.host.empty() ? "0.0.0.0" : opt.host;
    config.port = opt.port;
    config.keep_chunks = opt.save_chunks;
    config.packet_log_path = opt.packet_log;
    if (opt.queue_capacity) config.queue_capacity = opt.queue_capacity;

    std::unique_ptr<AudioTransform> transform = make_transform(opt.codec);
    StreamReceiver receiver(config, *transform, g_cancel);
    receiver.listen();

    ReceiveResult result = receiver.receive();
    std::cout << format_report(result.report) << std::endl;

    if (!result.samples.empty()) {
        std::filesystem::create_directories(opt.save_path);
        const std::string label = kbps_label(result.metadata.num_streams);
        const std::string stamp = std::to_string(std::time(nullptr));

        std::filesystem::path output = std::filesystem::path(opt.save_path) /
                                       ("received_audio_" + label + "_" + stamp + ".wav");
        write_wav(output.string(), result.samples, result.metadata.sample_rate);
        std::cout << "[receiver] Saved " << result.samples.size() << " samples to " << output.string() << std::endl;

        for (const auto& [index, samples] : result.chunks) {
            std::filesystem::path chunk_file = std::filesystem::path(opt.save_path) /
                ("received_" + label + "_" + stamp + "_chunk_" + std::to_string(index) + ".wav");
            write_wav(chunk_file.string(), samples, result.metadata.sample_rate);
        }
        if (!result.chunks.empty())
            std::cout << "[receiver] Saved " << result.chunks.size() << " chunk files" << std::endl;
    }
    return result.report.completed ? 0 : 1;
}

int run_compress(const Options& opt) {
    if (opt.input.empty() || opt.input == "-") {
        std::cerr << "[compress] --input <file.wav> is required" << std::endl;
        return 1;
    }

    CompressConfig config;
    config.geometry.chunk_size = opt.chunk_size;
    config.geometry.overlap_size = opt.overlap_size;
    config.num_streams = opt.num_streams;
    config.realtime = opt.realtime;
    config.keep_chunks = opt.save_chunks || opt.realtime;

    WavAudio audio = read_wav(opt.input);
    std::unique_ptr<AudioTransform> transform = make_transform(opt.codec);
    CompressResult result = compress_signal(audio.samples, audio.sample_rate, config, *transform, g_cancel);
    std::cout << format_report(result.report) << std::endl;

    if (result.samples.empty()) {
        std::cout << "[compress] No chunks were processed" << std::endl;
        return 1;
    }

    namespace fs = std::filesystem;
    fs::create_directories(opt.save_path);
    const std::string label = kbps_label(opt.num_streams);
    const fs::path input(opt.input);
    const std::string stem = input.stem().string();

    fs::path decoded = fs::path(opt.save_path) / ("decoded_" + label + "_" + input.filename().string());
    write_wav(decoded.string(), result.samples, audio.sample_rate);
    std::cout << "[compress] Reconstructed audio saved to " << decoded.string() << std::endl;

    fs::path encoded = fs::path(opt.save_path) / ("encoded_" + label + "_" + stem + ".bin");
    std::ofstream out(encoded, std::ios::binary);
    out.write(reinterpret_cast<const char*>(result.encoded.data()),
              static_cast<std::streamsize>(result.encoded.size()));
    if (!out)
        throw std::runtime_error("cannot write " + encoded.string());
    std::cout << "[compress] Encoded chunks (" << result.encoded.size() << " bytes) saved to "
              << encoded.string() << std::endl;

    for (const auto& [index, samples] : result.chunks) {
        fs::path chunk_file = fs::path(opt.save_path) /
            ("chunk_" + std::to_string(index) + "_" + label + "_" + stem + ".wav");
        write_wav(chunk_file.string(), samples, audio.sample_rate);
    }
    if (!result.chunks.empty())
        std::cout << "[compress] Saved " << result.chunks.size() << " chunk files" << std::endl;

    return result.report.completed ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    install_signal_handlers();

    std::string command = argv[1];
    try {
        Options opt = parse_options(argc, argv);
        if (command == "send") return run_send(opt);
        if (command == "receive") return run_receive(opt);
        if (command == "compress") return run_compress(opt);
        print_usage(argv[0]);
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid arguments: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[" << command << "] Exception: " << e.what() << std::endl;
        return 1;
    }
}
