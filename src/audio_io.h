// audio_io.h - Abstract block driver + PortAudio full-duplex backend
//
// The driver owns the timing-critical thread: it delivers one mono block of
// fixed size per callback and expects the processed block back before the
// callback returns.
#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include <atomic>

// ---------------------------------------------------------------------------
// BlockCallback - called by the driver for each period.
//   in     : captured mono float32 samples (nullptr if no input is available)
//   out    : mono float32 buffer to fill, `frames` samples
//   frames : fixed block size
// ---------------------------------------------------------------------------
using BlockCallback = std::function<void(const float* in,
                                         float*       out,
                                         size_t       frames)>;

// ---------------------------------------------------------------------------
// AudioDriver - pure virtual base class
// ---------------------------------------------------------------------------
class AudioDriver {
public:
    virtual ~AudioDriver() = default;

    // Start the stream; cb is called from the audio thread.
    virtual bool start(BlockCallback cb) = 0;
    virtual void stop() = 0;
    virtual bool is_running() const = 0;

    virtual int         sample_rate() const = 0;
    virtual size_t      block_size()  const = 0;
    virtual std::string name()        const = 0;
};

#ifdef HAVE_PORTAUDIO
#include <portaudio.h>
#endif

// ---------------------------------------------------------------------------
// PortAudioDuplex - mono capture → callback → mono playback via PortAudio
// ---------------------------------------------------------------------------
class PortAudioDuplex : public AudioDriver {
public:
    struct DeviceInfo {
        int         index;
        std::string name;
        int         max_input_channels;
        int         max_output_channels;
        double      default_sample_rate;
        double      default_low_latency;   // seconds (input side)
        bool        is_default_input;
        bool        is_default_output;
    };

    // Enumerate all PortAudio devices.
    // Returns empty vector if PortAudio fails to initialize.
    static std::vector<DeviceInfo> enumerate_devices();

    // input_device / output_device : PortAudio index, or -1 for system default
    // frames_per_buf               : fixed block size delivered to the callback
    PortAudioDuplex(int    input_device   = -1,
                    int    output_device  = -1,
                    int    sample_rate    = 44100,
                    size_t frames_per_buf = 64);
    ~PortAudioDuplex() override;

    bool start(BlockCallback cb) override;
    void stop()                  override;
    bool is_running() const      override { return running_.load(); }

    int         sample_rate() const override { return sample_rate_;    }
    size_t      block_size()  const override { return frames_per_buf_; }
    std::string name()        const override { return device_name_;    }

private:
    int         input_device_;
    int         output_device_;
    int         sample_rate_;
    size_t      frames_per_buf_;
    std::string device_name_;

#ifdef HAVE_PORTAUDIO
    PaStream*      pa_stream_  = nullptr;
#else
    void*          pa_stream_  = nullptr;
#endif
    BlockCallback     callback_;
    std::atomic<bool> running_{false};

#ifdef HAVE_PORTAUDIO
    static int pa_callback_trampoline(const void*                     input,
                                      void*                           output,
                                      unsigned long                   frame_count,
                                      const PaStreamCallbackTimeInfo* time_info,
                                      PaStreamCallbackFlags           status_flags,
                                      void*                           user_data);
#endif
};
