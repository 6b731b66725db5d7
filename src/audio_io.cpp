// audio_io.cpp - PortAudio full-duplex implementation
#include "audio_io.h"
#include "adfx_logger.h"

#ifdef HAVE_PORTAUDIO
#include <portaudio.h>
#endif

#include <cstring>
#include <cstdio>

// ---------------------------------------------------------------------------
// PortAudioDuplex - enumerate devices
// ---------------------------------------------------------------------------
std::vector<PortAudioDuplex::DeviceInfo> PortAudioDuplex::enumerate_devices()
{
    std::vector<DeviceInfo> result;

#ifdef HAVE_PORTAUDIO
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        ADFX_LOG(error, "[PortAudio] Init failed: " << Pa_GetErrorText(err));
        return result;
    }

    int count   = Pa_GetDeviceCount();
    int def_in  = Pa_GetDefaultInputDevice();
    int def_out = Pa_GetDefaultOutputDevice();

    for (int i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;

        DeviceInfo di;
        di.index               = i;
        di.name                = info->name ? info->name : "(unknown)";
        di.max_input_channels  = info->maxInputChannels;
        di.max_output_channels = info->maxOutputChannels;
        di.default_sample_rate = info->defaultSampleRate;
        di.default_low_latency = info->defaultLowInputLatency;
        di.is_default_input    = (i == def_in);
        di.is_default_output   = (i == def_out);
        result.push_back(di);
    }

    Pa_Terminate();
#endif

    return result;
}

// ---------------------------------------------------------------------------
// PortAudioDuplex - constructor / destructor
// ---------------------------------------------------------------------------
PortAudioDuplex::PortAudioDuplex(int input_device, int output_device,
                                 int sample_rate, size_t frames_per_buf)
    : input_device_(input_device)
    , output_device_(output_device)
    , sample_rate_(sample_rate)
    , frames_per_buf_(frames_per_buf)
{
}

PortAudioDuplex::~PortAudioDuplex()
{
    stop();
}

// ---------------------------------------------------------------------------
// PortAudioDuplex::start
// ---------------------------------------------------------------------------
bool PortAudioDuplex::start(BlockCallback cb)
{
#ifdef HAVE_PORTAUDIO
    if (running_.load()) return true;

    callback_ = cb;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        ADFX_LOG(error, "[PortAudio] Pa_Initialize: " << Pa_GetErrorText(err));
        return false;
    }

    PaDeviceIndex in_dev  = (input_device_ < 0)
                            ? Pa_GetDefaultInputDevice()
                            : static_cast<PaDeviceIndex>(input_device_);
    PaDeviceIndex out_dev = (output_device_ < 0)
                            ? Pa_GetDefaultOutputDevice()
                            : static_cast<PaDeviceIndex>(output_device_);

    if (in_dev == paNoDevice || out_dev == paNoDevice) {
        ADFX_ERR("[PortAudio] No input/output device available.");
        Pa_Terminate();
        return false;
    }

    const PaDeviceInfo* in_info  = Pa_GetDeviceInfo(in_dev);
    const PaDeviceInfo* out_info = Pa_GetDeviceInfo(out_dev);
    device_name_ = std::string(in_info ? in_info->name : "Unknown")
                 + " → " + (out_info ? out_info->name : "Unknown");

    PaStreamParameters in_params{};
    in_params.device                    = in_dev;
    in_params.channelCount              = 1;
    in_params.sampleFormat              = paFloat32;
    in_params.suggestedLatency          = in_info ? in_info->defaultLowInputLatency : 0.01;
    in_params.hostApiSpecificStreamInfo = nullptr;

    PaStreamParameters out_params{};
    out_params.device                    = out_dev;
    out_params.channelCount              = 1;
    out_params.sampleFormat              = paFloat32;
    out_params.suggestedLatency          = out_info ? out_info->defaultLowOutputLatency : 0.01;
    out_params.hostApiSpecificStreamInfo = nullptr;

    PaStream* stream = nullptr;
    err = Pa_OpenStream(&stream,
                        &in_params,
                        &out_params,
                        static_cast<double>(sample_rate_),
                        static_cast<unsigned long>(frames_per_buf_),
                        paClipOff,
                        pa_callback_trampoline,
                        this);
    if (err != paNoError) {
        ADFX_LOG(error, "[PortAudio] Pa_OpenStream: " << Pa_GetErrorText(err));
        Pa_Terminate();
        return false;
    }

    pa_stream_ = stream;
    running_.store(true);
    err = Pa_StartStream(stream);
    if (err != paNoError) {
        ADFX_LOG(error, "[PortAudio] Pa_StartStream: " << Pa_GetErrorText(err));
        running_.store(false);
        Pa_CloseStream(stream);
        pa_stream_ = nullptr;
        Pa_Terminate();
        return false;
    }

    ADFX_LOG(info, "[PortAudio] Duplex started: " << device_name_ << "  "
                   << sample_rate_ << " Hz  " << frames_per_buf_ << " frames");
    return true;
#else
    (void)cb;
    ADFX_ERR("[PortAudio] Not compiled in (HAVE_PORTAUDIO not set)");
    return false;
#endif
}

// ---------------------------------------------------------------------------
// PortAudioDuplex::stop
// ---------------------------------------------------------------------------
void PortAudioDuplex::stop()
{
#ifdef HAVE_PORTAUDIO
    if (!running_.load()) return;
    running_.store(false);

    if (pa_stream_) {
        Pa_StopStream(pa_stream_);
        Pa_CloseStream(pa_stream_);
        pa_stream_ = nullptr;
    }
    Pa_Terminate();
    ADFX_INFO("[PortAudio] Duplex stopped.");
#endif
}

// ---------------------------------------------------------------------------
// PortAudioDuplex::pa_callback_trampoline (static)
// ---------------------------------------------------------------------------
#ifdef HAVE_PORTAUDIO
int PortAudioDuplex::pa_callback_trampoline(const void*                     input,
                                            void*                           output,
                                            unsigned long                   frame_count,
                                            const PaStreamCallbackTimeInfo* /*time_info*/,
                                            PaStreamCallbackFlags           /*status_flags*/,
                                            void*                           user_data)
{
    auto* self = static_cast<PortAudioDuplex*>(user_data);
    auto* out  = static_cast<float*>(output);
    if (!out) return paContinue;

    if (!self->running_.load() || !self->callback_) {
        memset(out, 0, frame_count * sizeof(float));
        return self->running_.load() ? paContinue : paAbort;
    }

    self->callback_(static_cast<const float*>(input), out, frame_count);
    return paContinue;
}
#endif
