/**
 * fastdaq_cli - Headless acquisition run against the simulated device
 *
 * Runs the full pipeline (producer, ring buffer, processing, display gate,
 * monitor) for a fixed duration and prints a one-line status every second,
 * every alert as it is raised, and a summary at the end.
 *
 * Exit codes: 0 = clean run, 1 = acquisition fault, 2 = bad configuration
 * or other error.
 */

#include "config/pipeline_config.hpp"
#include "fastdaq/errors.hpp"
#include "fastdaq/logging.hpp"
#include "monitor/performance_monitor.hpp"
#include "pipeline/pipeline.hpp"
#include "sim/simulated_daq_device.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

using namespace fastdaq;

namespace {

std::atomic<bool> g_interrupted{false};

void onSignal(int) {
    g_interrupted.store(true);
}

void printHelp() {
    std::cout << "fastdaq_cli - multi-channel acquisition pipeline (simulated device)\n\n";
    std::cout << "Usage: fastdaq_cli [options]\n\n";
    std::cout << "Acquisition:\n";
    std::cout << "  --config <file>          Load key=value settings (flags below override)\n";
    std::cout << "  -r, --rate <hz>          Sample rate per channel (default 1000)\n";
    std::cout << "  -c, --channels <list>    Channel names, e.g. ai0,ai1,ai2\n";
    std::cout << "  -d, --duration <s>       Run time in seconds (default 5)\n";
    std::cout << "  --block <n>              Samples per read (default: from rate)\n";
    std::cout << "\nProcessing:\n";
    std::cout << "  --filter <type>          none, lowpass, highpass, bandpass, bandstop,\n";
    std::cout << "                           notch50 (48-52 Hz), notch60 (58-62 Hz)\n";
    std::cout << "  --low <hz>               Cutoff / lower band edge\n";
    std::cout << "  --high <hz>              Upper band edge\n";
    std::cout << "  --order <n>              Butterworth order (default 4)\n";
    std::cout << "  --window <type>          hann, hamming, blackman, rectangular\n";
    std::cout << "  --fft <n>                FFT length, power of two (default 8192)\n";
    std::cout << "  --no-spectrum            Skip the PSD\n";
    std::cout << "\nSimulation / stress:\n";
    std::cout << "  --throughput <f>         Fraction of the sample clock delivered (default 1.0)\n";
    std::cout << "  --processing-delay-ms <n> Extra time per background cycle\n";
    std::cout << "  --timeout-every <n>      Every Nth read times out\n";
    std::cout << "  --fault-after <n>        Device disconnects after N reads\n";
    std::cout << "  --nan-every <n>          Corrupt one sample in every Nth block\n";
    std::cout << "  --seed <n>               Noise seed (default 42)\n";
    std::cout << "\nOther:\n";
    std::cout << "  --benchmark              Run the ring buffer and processor benchmarks and exit\n";
    std::cout << "  -q, --quiet              Summary only\n";
    std::cout << "  -v, --verbose            Debug logging\n";
    std::cout << "  --log-level <level>      error, warn, info, debug, trace\n";
    std::cout << "  -h, --help               This text\n";
}

void printBenchmark(const BenchmarkResult& r) {
    std::cout << "  " << std::left << std::setw(14) << r.name << std::right;
    if (!r.success) {
        std::cout << " FAILED: " << r.error << "\n";
        return;
    }
    std::cout << std::fixed << std::setprecision(3)
              << " " << std::setw(8) << r.duration_s << " s  "
              << std::setprecision(1) << std::setw(12) << r.throughput / 1e6 << " MS/s\n";
}

int runBenchmarks(const PipelineConfig& config) {
    std::cout << "Benchmarks (" << config.numChannels() << " ch, block "
              << config.blockSize() << ", capacity " << config.bufferCapacity() << ")\n";

    BenchmarkResult ring = PerformanceMonitor::benchmarkRingBuffer(
        config.numChannels(), config.bufferCapacity(), config.blockSize(), 2000);
    printBenchmark(ring);

    BenchmarkResult proc = PerformanceMonitor::benchmarkProcessor(
        SignalProcessor::Config::fromPipeline(config), config.numChannels(), 50);
    printBenchmark(proc);

    return (ring.success && proc.success) ? 0 : 1;
}

void printStatus(const PerformanceMetrics& m, AlertLevel level) {
    std::cout << std::fixed << std::setprecision(1)
              << "[" << std::setw(6) << m.time_s << "s] "
              << "rate " << std::setw(9) << m.achieved_rate_hz << " Hz ("
              << std::setw(5) << m.rate_accuracy_pct << "%)  "
              << "acq " << m.samples_acquired << "  "
              << "drop " << m.samples_dropped << " (" << m.dropped_rate_hz << "/s)  "
              << "occ " << std::setw(5) << m.occupancy_pct << "%  "
              << "proc " << std::setprecision(2) << m.avg_processing_ms << " ms  "
              << alertLevelToString(level) << "\n";
}

void printSummary(const Pipeline& pipeline) {
    PerformanceMetrics m = pipeline.getMetrics();
    Pipeline::Stats stats = pipeline.getStats();

    std::cout << "\n=== Summary ===\n";
    std::cout << "  Mode:               " << pipeline.plan().describe() << "\n";
    std::cout << std::fixed << std::setprecision(1);
    std::cout << "  Duration:           " << m.time_s << " s\n";
    std::cout << "  Requested rate:     " << m.requested_rate_hz << " Hz\n";
    std::cout << "  Achieved rate:      " << m.achieved_rate_hz << " Hz ("
              << m.rate_accuracy_pct << "%)\n";
    std::cout << "  Samples acquired:   " << m.samples_acquired << " / "
              << m.samples_requested << " requested\n";
    std::cout << "  Samples dropped:    " << m.samples_dropped << "\n";
    std::cout << "  Read timeouts:      " << m.read_timeouts << " (" << m.stalls << " stalls)\n";
    std::cout << "  Processing cycles:  " << m.processing_cycles << " ("
              << m.processing_errors << " errors, " << m.results_overwritten << " overwritten)\n";
    std::cout << std::setprecision(2);
    std::cout << "  Processing latency: avg " << m.avg_processing_ms << " ms, max "
              << m.max_processing_ms << " ms (budget " << m.latency_budget_ms << " ms)\n";
    std::cout << "  Pool:               " << m.pool_allocations << " allocations, "
              << m.pool_hits << " hits, " << m.pool_exhaustion << " exhausted\n";
    if (const DisplayGate* gate = pipeline.displayGate()) {
        DisplayGate::Stats g = gate->getStats();
        std::cout << "  Display:            " << g.frames_delivered << " frames, "
                  << g.missed_deadlines << " missed deadlines\n";
    }
    if (stats.forced_shutdowns > 0) {
        std::cout << "  Forced shutdowns:   " << stats.forced_shutdowns << "\n";
    }

    if (auto result = pipeline.latestResult()) {
        std::cout << "\n  Channel statistics (cycle " << result->cycle << ", "
                  << result->samples << " samples"
                  << (result->filtered ? ", filtered" : "") << "):\n";
        const auto& names = pipeline.config().channels;
        for (size_t ch = 0; ch < result->statistics.size(); ++ch) {
            const ChannelStatistics& s = result->statistics[ch];
            std::cout << "    " << std::left << std::setw(6)
                      << (ch < names.size() ? names[ch] : std::string("?")) << std::right
                      << std::setprecision(4)
                      << " min " << std::setw(8) << s.min
                      << "  max " << std::setw(8) << s.max
                      << "  mean " << std::setw(8) << s.mean
                      << "  std " << std::setw(8) << s.std_dev
                      << "  rms " << std::setw(8) << s.rms;

            const Spectrum& sp = result->spectrum;
            if (sp.status == SpectrumStatus::OK && ch < sp.psd_db.size() && !sp.psd_db[ch].empty()) {
                // Strongest bin above DC
                size_t peak = sp.psd_db[ch].size() > 1 ? 1 : 0;
                for (size_t k = peak; k < sp.psd_db[ch].size(); ++k) {
                    if (sp.psd_db[ch][k] > sp.psd_db[ch][peak]) peak = k;
                }
                std::cout << std::setprecision(1) << "  peak " << sp.frequencies_hz[peak] << " Hz";
            } else {
                std::cout << "  spectrum " << spectrumStatusToString(sp.status);
            }
            std::cout << "\n";
        }
    }

    std::cout << "\n  Alerts raised:      " << pipeline.getAlertHistory().size() << "\n";
    std::cout << "  Result:             " << (stats.faulted ? "FAULT" : "OK") << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        PipelineConfig config;
        sim::SimulatedDaqDevice::Config sim_cfg;
        double duration_s = 5.0;
        int processing_delay_ms = 0;
        bool benchmark = false;
        bool quiet = false;

        initLogLevelFromEnv();

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                std::string path = argv[++i];
                if (!loadConfigFile(config, path)) {
                    std::cerr << "Cannot use config file: " << path << "\n";
                    return 2;
                }
            } else if ((arg == "--rate" || arg == "-r") && i + 1 < argc) {
                config.sample_rate_hz = std::stod(argv[++i]);
            } else if ((arg == "--channels" || arg == "-c") && i + 1 < argc) {
                config.channels = parseChannelList(argv[++i]);
            } else if ((arg == "--duration" || arg == "-d") && i + 1 < argc) {
                duration_s = std::stod(argv[++i]);
            } else if (arg == "--block" && i + 1 < argc) {
                config.samples_per_block = std::stoul(argv[++i]);
            } else if (arg == "--filter" && i + 1 < argc) {
                std::string type = argv[++i];
                if (!parseFilterSetting(type, config.filter)) {
                    std::cerr << "Unknown filter: " << type
                              << " (use none, lowpass, highpass, bandpass, bandstop, notch50, notch60)\n";
                    return 2;
                }
            } else if (arg == "--low" && i + 1 < argc) {
                config.filter.low_hz = std::stod(argv[++i]);
            } else if (arg == "--high" && i + 1 < argc) {
                config.filter.high_hz = std::stod(argv[++i]);
            } else if (arg == "--order" && i + 1 < argc) {
                config.filter.order = std::stoi(argv[++i]);
            } else if (arg == "--window" && i + 1 < argc) {
                std::string type = argv[++i];
                if (!parseWindowType(type, config.spectrum.window)) {
                    std::cerr << "Unknown window: " << type
                              << " (use hann, hamming, blackman, rectangular)\n";
                    return 2;
                }
            } else if (arg == "--fft" && i + 1 < argc) {
                config.spectrum.fft_length = std::stoul(argv[++i]);
            } else if (arg == "--no-spectrum") {
                config.spectrum.enabled = false;
            } else if (arg == "--throughput" && i + 1 < argc) {
                sim_cfg.throughput_factor = std::stod(argv[++i]);
            } else if (arg == "--processing-delay-ms" && i + 1 < argc) {
                processing_delay_ms = std::stoi(argv[++i]);
            } else if (arg == "--timeout-every" && i + 1 < argc) {
                sim_cfg.timeout_every_n_reads = std::stoi(argv[++i]);
            } else if (arg == "--fault-after" && i + 1 < argc) {
                sim_cfg.fault_after_reads = std::stoi(argv[++i]);
            } else if (arg == "--nan-every" && i + 1 < argc) {
                sim_cfg.nan_every_n_reads = std::stoi(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                sim_cfg.seed = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--benchmark") {
                benchmark = true;
            } else if (arg == "--quiet" || arg == "-q") {
                quiet = true;
            } else if (arg == "--verbose" || arg == "-v") {
                setLogLevel(LogLevel::DEBUG);
            } else if (arg == "--log-level" && i + 1 < argc) {
                LogLevel level;
                if (!parseLogLevel(argv[++i], level)) {
                    std::cerr << "Unknown log level: " << argv[i] << "\n";
                    return 2;
                }
                setLogLevel(level);
            } else if (arg == "--help" || arg == "-h") {
                printHelp();
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << " (try --help)\n";
                return 2;
            }
        }

        config.validate();

        if (benchmark) {
            return runBenchmarks(config);
        }

        std::signal(SIGINT, onSignal);

        sim::SimulatedDaqDevice device(sim_cfg);
        Pipeline pipeline(config, device);

        std::mutex out_mutex;
        pipeline.setAlertCallback([&out_mutex, quiet](const Alert& a) {
            if (quiet) return;
            std::lock_guard<std::mutex> lock(out_mutex);
            std::cout << "  ** " << alertLevelToString(a.level) << " ["
                      << alertCategoryToString(a.category) << "] " << a.message << "\n";
        });
        pipeline.setProcessingDelayMs(processing_delay_ms);

        std::cout << "Running " << config.numChannels() << " channel(s) at "
                  << config.sample_rate_hz << " Hz for " << duration_s << " s\n";
        pipeline.start();

        auto t_start = std::chrono::steady_clock::now();
        auto t_end = t_start + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                   std::chrono::duration<double>(duration_s));
        auto next_status = t_start + std::chrono::seconds(1);

        while (std::chrono::steady_clock::now() < t_end && !g_interrupted.load()) {
            if (!pipeline.isRunning()) break;   // Faulted
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            if (!quiet && std::chrono::steady_clock::now() >= next_status) {
                next_status += std::chrono::seconds(1);
                std::lock_guard<std::mutex> lock(out_mutex);
                printStatus(pipeline.getMetrics(), pipeline.currentAlertLevel());
            }
        }

        pipeline.stop();
        printSummary(pipeline);
        pipeline.rethrowIfFaulted();
        return 0;

    } catch (const AcquisitionFault& e) {
        std::cerr << "Acquisition fault: " << e.what() << std::endl;
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }
}
