#pragma once
#include "command_intake.hpp"
#include "watchdog.hpp"
#include "ring_buffer.hpp"
#include "publisher.hpp"
#include "metrics.hpp"
#include "welch.hpp"
#include "config.hpp"
#include <atomic>
#include <complex>
#include <string>
#include <thread>
#include <vector>

enum class AcqMode : uint8_t { CONTINUOUS, SINGLE };
const char* acq_mode_str(AcqMode m);
bool        parse_acq_mode(const char* s, AcqMode& out);

struct EngineConfig {
    AcqMode     mode              = AcqMode::CONTINUOUS;
    double      ref_impedance_ohm = RFSENSE_REF_IMPEDANCE_OHM;
    std::string device_id         = "unknown";
    int         window_wait_ms    = RFSENSE_WINDOW_WAIT_MS;
};

// ── AcquisitionEngine ─────────────────────────────────────────────────────
// Processing thread: takes the latest plan at each window boundary (a
// window already filling finishes under its plan first), hands
// its hardware side to the Watchdog, then per window
//   ring → complex IQ → Welch → crop → scale → Publisher.
// Overruns discard the window and retry with a fresh one.
class AcquisitionEngine {
public:
    AcquisitionEngine(CommandIntake& intake, Watchdog& wd, RingBuffer& rb,
                      Publisher& pub, MetricsSink& metrics, const HWConfig& caps,
                      const EngineConfig& cfg = EngineConfig());
    ~AcquisitionEngine();

    AcquisitionEngine(const AcquisitionEngine&) = delete;
    AcquisitionEngine& operator=(const AcquisitionEngine&) = delete;

    void start();
    void stop();

    // Watchdog state listener: publishes on the status topic
    void on_device_state(DeviceState s);

    uint64_t cycles() const { return cycles_.load(); }
    uint64_t overruns_handled() const { return overruns_handled_.load(); }

private:
    void run();
    void process_window(const AcqPlan& plan, double acq_ms);
    bool streaming(uint64_t generation) const;

    CommandIntake& intake_;
    Watchdog&      wd_;
    RingBuffer&    rb_;
    Publisher&     pub_;
    MetricsSink&   metrics_;
    HWConfig       caps_;
    EngineConfig   cfg_;

    WelchEstimator welch_;
    std::vector<uint8_t>             raw_;
    std::vector<std::complex<float>> iq_;
    std::vector<double>              freqs_, pxx_;

    std::thread           thr_;
    std::atomic<bool>     stop_{false};
    std::atomic<uint64_t> cycles_{0};
    std::atomic<uint64_t> overruns_handled_{0};
    std::atomic<uint64_t> active_gen_{0};
};
