#include "tagsense/estimator.hpp"
#include "tagsense/errors.hpp"
#include "tagsense/logging.hpp"
#include "tagsense/thermistor.hpp"
#include "io/frame_reader.hpp"
#include "protocol/result_packet.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

using namespace tagsense;

// Signal handling for clean shutdown
static std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

struct CliOptions {
    const char* snapshot_file = "tagsense_model.tsnp";
    const char* config_file = nullptr;
    const char* output_file = nullptr;
    io::FrameFormat format = io::FrameFormat::TENSOR;
    protocol::PacketEncoding encoding = protocol::PacketEncoding::COMPACT;
    uint64_t max_frames = 0;      // 0 = until end of input
    int interval_ms = 0;
};

void printUsage(const char* prog) {
    std::cerr << "tagsense - Backscatter Tag Temperature Estimator\n\n";
    std::cerr << "Usage: " << prog << " [options] <command>\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  infer [file]        Estimate every frame in file (or stdin), print results\n";
    std::cerr << "  run [file]          Continuous mode: one status line per frame, timing stats\n";
    std::cerr << "  convert <gamma>...  Convert reflection coefficients to temperature\n";
    std::cerr << "  info                Show configuration and frame sizes\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  -m <file>           Parameter snapshot (default: tagsense_model.tsnp)\n";
    std::cerr << "  -c <file>           Configuration INI file\n";
    std::cerr << "  -f <format>         Input format: tensor, capture (default: tensor)\n";
    std::cerr << "  -p <encoding>       Packet encoding: compact, full (default: compact)\n";
    std::cerr << "  -o <file>           Write encoded result packets to file\n";
    std::cerr << "  -n <count>          Stop after count frames (run)\n";
    std::cerr << "  -i <ms>             Delay between frames in ms (run)\n";
    std::cerr << "  -v                  Verbose logging\n";
    std::cerr << "  -q                  Errors only\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  # Estimate a recorded capture and store compact packets\n";
    std::cerr << "  " << prog << " -f capture -o packets.bin infer rx_capture.bin\n\n";
    std::cerr << "  # Stream frames from the acquisition side\n";
    std::cerr << "  acquire | " << prog << " -m model.tsnp run\n\n";
    std::cerr << "  # Check the thermistor curve\n";
    std::cerr << "  " << prog << " convert -- -0.5 0 0.5\n";
    std::cerr << "\n";
}

void printInfo(const EstimatorConfig& config, const CliOptions& opts) {
    std::cout << "=== tagsense ===\n\n";

    std::cout << "Configuration:\n";
    std::cout << "  Tags (T):          " << config.num_tags << "\n";
    std::cout << "  Antennas (R):      " << config.num_rx << "\n";
    std::cout << "  Samples/slot (W):  " << config.samples_per_slot << "\n";
    std::cout << "  Slots:             " << config.slotCount() << " (" << config.num_tags
              << " pilot + 1 data)\n";
    std::cout << "  Hidden width:      " << config.hidden_width << "\n";
    std::cout << "  Refine blocks:     " << config.refine_blocks << "\n";
    std::cout << "  Channel residual:  ";
    if (config.enable_delta_h) {
        std::cout << "on (width " << config.delta_h_width << ")\n";
    } else {
        std::cout << "off\n";
    }
    std::cout << "  Base lambda:       " << config.base_lambda << "\n";
    std::cout << "  Condition clamp:   [" << config.condition_min << ", " << config.condition_max << "]\n";
    std::cout << "  Output stage:      " << (config.softplus_output ? "softplus" : "linear");
    if (config.output_clip) {
        std::cout << ", clip [" << config.output_clip->low << ", " << config.output_clip->high << "]";
    }
    std::cout << "\n\n";

    std::cout << "Sizes:\n";
    std::cout << "  Frame values:      " << config.frameValues() << "\n";
    std::cout << "  Tensor frame:      " << io::frameBytes(io::FrameFormat::TENSOR, config) << " bytes\n";
    std::cout << "  Capture frame:     " << io::frameBytes(io::FrameFormat::CAPTURE, config) << " bytes\n";
    std::cout << "  Model output:      " << config.outputSize() << " values\n";
    std::cout << "  Compact packet:    " << protocol::compactPacketSize(config.num_tags) << " bytes\n";
    std::cout << "  Full packet:       " << protocol::fullPacketSize(config.num_tags) << " bytes\n";
    std::cout << "  Snapshot tensors:  " << expectedTensorLayout(config).size() << "\n";
    std::cout << "  Snapshot file:     " << opts.snapshot_file << "\n";
}

void printResult(uint64_t index, const EstimateResult& res) {
    std::cout << "Frame " << index << ":\n";
    std::cout << std::fixed;
    for (uint32_t t = 0; t < res.num_tags; ++t) {
        std::cout << "  Tag " << t << ": gamma=" << std::setprecision(4) << res.gamma[t]
                  << "  T=" << std::setprecision(2) << res.temperatures_c[t] << " C"
                  << (res.valid[t] ? "" : "  [INVALID]") << "\n";
    }
    std::cout << "  |H| (rx x tag):\n";
    for (uint32_t r = 0; r < res.num_rx; ++r) {
        std::cout << "   ";
        for (uint32_t t = 0; t < res.num_tags; ++t) {
            std::cout << " " << std::setprecision(4) << res.channelMagnitude(r, t);
        }
        std::cout << "\n";
    }
    std::cout << "  cond=" << std::setprecision(2) << res.diagnostics.condition
              << "  |y|=" << std::setprecision(4) << res.diagnostics.observation_norm
              << "  log_snr=" << std::setprecision(2) << res.diagnostics.log_snr;
    if (res.diagnostics.gate) {
        std::cout << "  gate=" << std::setprecision(3) << *res.diagnostics.gate;
    }
    std::cout << "\n";
    std::cout.unsetf(std::ios::floatfield);
}

void printStatusLine(uint64_t index, const EstimateResult& res, double infer_ms) {
    std::cout << "[" << index << "]";
    std::cout << std::fixed << std::setprecision(1);
    for (uint32_t t = 0; t < res.num_tags; ++t) {
        if (res.valid[t]) {
            std::cout << " " << res.temperatures_c[t];
        } else {
            std::cout << " --";
        }
    }
    std::cout << "  (" << std::setprecision(2) << infer_ms << " ms)\n";
    std::cout.unsetf(std::ios::floatfield);
}

// Open input file (or stdin) and optional packet output file
struct StreamSet {
    std::ifstream infile;
    std::istream* input = &std::cin;
    std::ofstream outfile;
    bool have_output = false;
};

bool openStreams(StreamSet& streams, const char* input_file, const char* output_file) {
    if (input_file) {
        streams.infile.open(input_file, std::ios::binary);
        if (!streams.infile) {
            std::cerr << "Error: Cannot open input file: " << input_file << "\n";
            return false;
        }
        streams.input = &streams.infile;
    }
    if (output_file) {
        streams.outfile.open(output_file, std::ios::binary);
        if (!streams.outfile) {
            std::cerr << "Error: Cannot open output file: " << output_file << "\n";
            return false;
        }
        streams.have_output = true;
    }
    return true;
}

void writePacket(StreamSet& streams, const Bytes& packet) {
    streams.outfile.write(reinterpret_cast<const char*>(packet.data()),
                          static_cast<std::streamsize>(packet.size()));
}

int runInfer(const InferenceEngine& engine, const CliOptions& opts, const char* input_file) {
    StreamSet streams;
    if (!openStreams(streams, input_file, opts.output_file)) {
        return 1;
    }

    io::FrameReader reader(*streams.input, engine.config(), opts.format);
    int invalid_tags = 0;
    while (g_running) {
        std::optional<ObservationFrame> frame = reader.next();
        if (!frame) break;

        EstimateResult res = engine.infer(*frame);
        printResult(reader.framesRead() - 1, res);
        invalid_tags += static_cast<int>(res.num_tags - res.validCount());

        if (streams.have_output) {
            writePacket(streams, protocol::encodePacket(res, opts.encoding));
        }
    }

    std::cerr << "Processed " << reader.framesRead() << " frame(s)";
    if (invalid_tags > 0) {
        std::cerr << ", " << invalid_tags << " out-of-range tag reading(s)";
    }
    std::cerr << "\n";
    return 0;
}

// Accumulated per-stage wall time for run mode
struct TimingStats {
    uint64_t frames = 0;
    double read_ms = 0.0;
    double infer_ms = 0.0;
    double encode_ms = 0.0;

    void print() const {
        std::cerr << "\n=== Timing ===\n";
        std::cerr << "  Frames:        " << frames << "\n";
        if (frames == 0) return;
        std::cerr << std::fixed << std::setprecision(3);
        std::cerr << "  Read (mean):   " << read_ms / frames << " ms\n";
        std::cerr << "  Infer (mean):  " << infer_ms / frames << " ms\n";
        std::cerr << "  Encode (mean): " << encode_ms / frames << " ms\n";
        std::cerr << "  Total (mean):  " << (read_ms + infer_ms + encode_ms) / frames << " ms\n";
        std::cerr.unsetf(std::ios::floatfield);
    }
};

int runContinuous(const InferenceEngine& engine, const CliOptions& opts, const char* input_file) {
    using Clock = std::chrono::steady_clock;
    auto elapsedMs = [](Clock::time_point a, Clock::time_point b) {
        return std::chrono::duration<double, std::milli>(b - a).count();
    };

    StreamSet streams;
    if (!openStreams(streams, input_file, opts.output_file)) {
        return 1;
    }

    std::cerr << "Running";
    if (input_file) std::cerr << " on " << input_file;
    if (opts.max_frames > 0) std::cerr << ", " << opts.max_frames << " frame(s)";
    if (opts.interval_ms > 0) std::cerr << ", every " << opts.interval_ms << " ms";
    std::cerr << "... (Ctrl+C to stop)\n";

    io::FrameReader reader(*streams.input, engine.config(), opts.format);
    TimingStats stats;

    while (g_running && (opts.max_frames == 0 || stats.frames < opts.max_frames)) {
        auto t0 = Clock::now();
        std::optional<ObservationFrame> frame = reader.next();
        if (!frame) break;
        auto t1 = Clock::now();

        EstimateResult res = engine.infer(*frame);
        auto t2 = Clock::now();

        Bytes packet = protocol::encodePacket(res, opts.encoding);
        if (streams.have_output) {
            writePacket(streams, packet);
        }
        auto t3 = Clock::now();

        stats.read_ms += elapsedMs(t0, t1);
        stats.infer_ms += elapsedMs(t1, t2);
        stats.encode_ms += elapsedMs(t2, t3);
        printStatusLine(stats.frames, res, elapsedMs(t1, t2));
        ++stats.frames;

        if (opts.interval_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(opts.interval_ms));
        }
    }

    if (!g_running) {
        std::cerr << "Interrupted\n";
    }
    stats.print();
    return 0;
}

int runConvert(const ThermistorModel& thermistor, const std::vector<const char*>& values) {
    if (values.empty()) {
        std::cerr << "Error: convert requires at least one gamma value\n";
        return 1;
    }
    std::cout << std::fixed;
    for (const char* v : values) {
        char* end = nullptr;
        double gamma = std::strtod(v, &end);
        if (end == v || *end != '\0') {
            std::cerr << "Error: Not a number: " << v << "\n";
            return 1;
        }
        double ohms = gammaToResistance(gamma, thermistor);
        TemperatureReading reading = gammaToTemperature(gamma, thermistor);
        std::cout << "gamma=" << std::setprecision(4) << gamma
                  << "  R=" << std::setprecision(1) << ohms << " ohm"
                  << "  T=" << std::setprecision(2) << reading.celsius << " C"
                  << (reading.valid ? "" : "  [INVALID]") << "\n";
    }
    return 0;
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);

    CliOptions opts;
    const char* command = nullptr;
    const char* input_file = nullptr;
    std::vector<const char*> positional;
    bool options_done = false;

    // Options may appear before or after the command
    for (int i = 1; i < argc; ++i) {
        if (options_done) {
            positional.push_back(argv[i]);
        } else if (strcmp(argv[i], "--") == 0) {
            options_done = true;
        } else if (strcmp(argv[i], "-m") == 0 && i + 1 < argc) {
            opts.snapshot_file = argv[++i];
        } else if (strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            opts.config_file = argv[++i];
        } else if (strcmp(argv[i], "-f") == 0 && i + 1 < argc) {
            std::optional<io::FrameFormat> format = io::parseFrameFormat(argv[++i]);
            if (!format) {
                std::cerr << "Unknown frame format: " << argv[i] << " (expected tensor or capture)\n";
                return 1;
            }
            opts.format = *format;
        } else if (strcmp(argv[i], "-p") == 0 && i + 1 < argc) {
            std::optional<protocol::PacketEncoding> encoding = protocol::parsePacketEncoding(argv[++i]);
            if (!encoding) {
                std::cerr << "Unknown packet encoding: " << argv[i] << " (expected compact or full)\n";
                return 1;
            }
            opts.encoding = *encoding;
        } else if (strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            opts.output_file = argv[++i];
        } else if (strcmp(argv[i], "-n") == 0 && i + 1 < argc) {
            opts.max_frames = std::strtoull(argv[++i], nullptr, 10);
        } else if (strcmp(argv[i], "-i") == 0 && i + 1 < argc) {
            opts.interval_ms = std::atoi(argv[++i]);
        } else if (strcmp(argv[i], "-v") == 0) {
            setLogLevel(LogLevel::DEBUG);
        } else if (strcmp(argv[i], "-q") == 0) {
            setLogLevel(LogLevel::ERROR);
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-' ||
                   (!positional.empty() && strcmp(positional.front(), "convert") == 0)) {
            // Negative gamma values for convert
            positional.push_back(argv[i]);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    // First positional is the command, the rest are its arguments
    if (!positional.empty()) {
        command = positional.front();
        positional.erase(positional.begin());
    }
    if (!positional.empty()) {
        input_file = positional.front();
    }

    if (!command) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        EstimatorConfig config = presets::standard();
        if (opts.config_file && !config.load(opts.config_file)) {
            std::cerr << "Error: Cannot open config file: " << opts.config_file << "\n";
            return 1;
        }
        config.validate();

        if (strcmp(command, "info") == 0) {
            printInfo(config, opts);
            return 0;
        } else if (strcmp(command, "convert") == 0) {
            return runConvert(ThermistorModel{}, positional);
        } else if (strcmp(command, "infer") == 0 || strcmp(command, "run") == 0) {
            InferenceEngine engine(config);
            engine.loadSnapshot(opts.snapshot_file);
            if (strcmp(command, "infer") == 0) {
                return runInfer(engine, opts, input_file);
            }
            return runContinuous(engine, opts, input_file);
        } else {
            std::cerr << "Unknown command: " << command << "\n";
            printUsage(argv[0]);
            return 1;
        }
    } catch (const Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        return 3;
    }
}
