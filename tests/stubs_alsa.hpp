#ifndef STUBS_ALSA_HPP
#define STUBS_ALSA_HPP

#include <alsa/asoundlib.h>
#include <atomic>
#include <set>
#include <string>
#include <vector>

namespace voxplay::tests::mock {

enum class PcmState {
    OPEN,
    SETUP,
    PREPARED,
    RUNNING,
    CLOSED
};

// Global mock state. Fields the playback thread touches are atomic; the
// rest is only read or written while no stream is running.
struct AlsaMockState {
    std::set<std::string> failing_devices; // snd_pcm_open fails for these
    bool fail_all_opens = false;
    bool fail_hw_params = false;
    bool reject_channels_above_two = false;

    std::atomic<bool> simulate_underrun{false};
    std::atomic<int> write_error_count{0};   // Next N writes return -EIO
    std::atomic<int> recover_fail_count{0};
    std::atomic<long> delay_frames{0};

    std::atomic<PcmState> state{PcmState::CLOSED};
    std::vector<std::string> opened_devices;
    unsigned int applied_channels = 0;
    unsigned int applied_rate = 0;
    int sw_start_threshold = 0;

    std::atomic<long> written_frames{0};
    std::atomic<int> write_calls{0};
    std::atomic<int> prepare_calls{0};
    std::atomic<int> drop_calls{0};
    std::atomic<int> recover_calls{0};

    void reset() {
        failing_devices.clear();
        fail_all_opens = false;
        fail_hw_params = false;
        reject_channels_above_two = false;
        simulate_underrun = false;
        write_error_count = 0;
        recover_fail_count = 0;
        delay_frames = 0;
        state = PcmState::CLOSED;
        opened_devices.clear();
        applied_channels = 0;
        applied_rate = 0;
        sw_start_threshold = 0;
        written_frames = 0;
        write_calls = 0;
        prepare_calls = 0;
        drop_calls = 0;
        recover_calls = 0;
    }
};

extern AlsaMockState g_alsa_mock;

} // namespace voxplay::tests::mock

#endif // STUBS_ALSA_HPP
