// config_loader.h - Startup YAML → AdfxConfig
//
// CLI flags always override YAML values - apply after adfx_load_config().
#pragma once

#include <string>

// ---------------------------------------------------------------------------
// AdfxConfig - host settings (compiled-in defaults below)
// ---------------------------------------------------------------------------
struct AdfxConfig {
    // audio:
    int         sample_rate    = 44100;
    int         block_size     = 64;     // frames per driver callback
    int         input_device   = -1;     // PortAudio index, -1 = system default
    int         output_device  = -1;

    // effects:
    std::string initial_genre  = "Pop";
    std::string fallback_genre = "Pop";

    // log:
    std::string log_dir        = "/var/log/adfx";
    int         log_level      = 4;
    bool        log_stderr     = true;
};

// ---------------------------------------------------------------------------
// adfx_load_config
//
// Parses `path` into `cfg`.  Sections: audio, effects, log.  Keys missing
// from the file keep their current value; unknown keys are ignored.
//
// Returns false (with a message on stderr) if the file cannot be read, is
// not a YAML mapping, has a key whose value does not parse ("abc" for an
// integer, "maybe" for a bool), or holds a non-positive sample-rate or
// block-size.
// ---------------------------------------------------------------------------
bool adfx_load_config(const char* path, AdfxConfig& cfg);
