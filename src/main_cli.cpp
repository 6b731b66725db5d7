// main_cli.cpp - adfx live effects host (Linux)
//
// Precedence (highest wins):
//   1. CLI flags (--sample-rate, --block-size, --genre, --log-level, …)
//   2. YAML config file (-c / --config)
//   3. Compiled-in defaults (AdfxConfig)
//
// Workflow:
//   1. Parse CLI flags into local "cli_*" variables; record which were set
//   2. If -c was given: adfx_load_config() → fills AdfxConfig
//   3. Re-apply any explicitly-set CLI flags on top of YAML values
//   4. Build the effect chain, open the PortAudio duplex stream
//   5. Read genre requests from stdin until "q", EOF or SIGINT
//
// stdin protocol: "1".."5" pick Rock/Country, Jazz/Blues, Pop, Clean, Metal;
// any other non-empty line is passed to set_genre() as a genre label, so a
// classifier process can be piped straight in.

#include "adfx_logger.h"
#include "audio_io.h"
#include "config_loader.h"
#include "dsp/effect_chain.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <signal.h>
#include <getopt.h>
#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <string>
#include <exception>
#include <typeinfo>
#include <execinfo.h>

/* ── Terminate handler - prints backtrace on std::terminate ───────────────── */

static void adfx_terminate_handler()
{
    if (std::exception_ptr ep = std::current_exception()) {
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            fprintf(stderr, "\n[adfx FATAL] std::terminate - %s: %s\n",
                    typeid(e).name(), e.what());
        } catch (...) {
            fprintf(stderr, "\n[adfx FATAL] std::terminate - unknown exception\n");
        }
    }

    void* frames[64];
    int   n = backtrace(frames, 64);
    char** syms = backtrace_symbols(frames, n);
    fprintf(stderr, "[adfx BACKTRACE] %d frames:\n", n);
    for (int i = 0; i < n; i++)
        fprintf(stderr, "  #%02d  %s\n", i, syms ? syms[i] : "?");
    if (syms) free(syms);
    fflush(stderr);

    abort();
}

/* ── Signal handling ──────────────────────────────────────────────────────── */

static volatile sig_atomic_t g_running     = 1;
static volatile sig_atomic_t g_reopen_logs = 0;

static void sig_handler(int sig)
{
    if (sig == SIGHUP) g_reopen_logs = 1;
    else               g_running     = 0;
}

/* ── Usage ────────────────────────────────────────────────────────────────── */

static void print_usage(const char* prog)
{
    fprintf(stdout,
"adfx v0.3.0 - genre-adaptive live effects\n"
"\n"
"Usage:\n"
"  %s -c <config.yaml>\n"
"  %s --genre Metal --block-size 64\n"
"  %s --list-devices\n"
"\n"
"Options:\n"
"  -c, --config <file>        YAML config file\n"
"  -g, --genre <name>         Initial genre (default: Pop)\n"
"  --sample-rate <hz>         Stream sample rate (default: 44100)\n"
"  --block-size <frames>      Frames per audio block (default: 64)\n"
"  --input-device <index>     PortAudio input device (default: system)\n"
"  --output-device <index>    PortAudio output device (default: system)\n"
"  --log-level <1-5>          1=CRIT 2=ERROR 3=WARN 4=INFO 5=DEBUG\n"
"  --log-dir <dir>            Log directory (default: /var/log/adfx)\n"
"  -v, --verbose              Debug logging\n"
"  -l, --list-devices         List audio devices and exit\n"
"  -h, --help                 Show this help\n"
"\n"
"While running, type a genre and press Enter:\n"
"  1 = Rock/Country   2 = Jazz/Blues   3 = Pop   4 = Clean   5 = Metal\n"
"  <name> = any genre label      ? = list genres      q = quit\n"
"\n",
    prog, prog, prog);
}

/* ── Device list ──────────────────────────────────────────────────────────── */

static int list_devices()
{
    auto devs = PortAudioDuplex::enumerate_devices();
    if (devs.empty()) {
        fprintf(stdout, "No audio devices found (or PortAudio not available).\n");
        return 1;
    }
    fprintf(stdout, "  idx  in  out  rate     latency  name\n");
    for (const auto& d : devs) {
        fprintf(stdout, "  %3d  %2d  %3d  %-7.0f  %5.1fms  %s%s%s\n",
                d.index, d.max_input_channels, d.max_output_channels,
                d.default_sample_rate, d.default_low_latency * 1000.0,
                d.name.c_str(),
                d.is_default_input  ? "  [default in]"  : "",
                d.is_default_output ? "  [default out]" : "");
    }
    return 0;
}

/* ── stdin command → genre name ───────────────────────────────────────────── */

static std::string hotkey_genre(const std::string& line)
{
    if (line == "1") return "Rock/Country";
    if (line == "2") return "Jazz/Blues";
    if (line == "3") return "Pop";
    if (line == "4") return "Clean";
    if (line == "5") return "Metal";
    return line;
}

static std::string trim(const char* s)
{
    std::string out(s);
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r' ||
                            out.back() == ' '  || out.back() == '\t'))
        out.pop_back();
    size_t start = out.find_first_not_of(" \t");
    return start == std::string::npos ? std::string() : out.substr(start);
}

/* ── Long option table ────────────────────────────────────────────────────── */

static const struct option long_opts[] = {
    { "config",        required_argument, 0, 'c' },
    { "genre",         required_argument, 0, 'g' },
    { "verbose",       no_argument,       0, 'v' },
    { "list-devices",  no_argument,       0, 'l' },
    { "sample-rate",   required_argument, 0,  1  },
    { "block-size",    required_argument, 0,  2  },
    { "input-device",  required_argument, 0,  3  },
    { "output-device", required_argument, 0,  4  },
    { "log-level",     required_argument, 0,  5  },
    { "log-dir",       required_argument, 0,  6  },
    { "help",          no_argument,       0, 'h' },
    { 0, 0, 0, 0 }
};

/* ── main ─────────────────────────────────────────────────────────────────── */

int main(int argc, char* argv[])
{
    std::set_terminate(adfx_terminate_handler);
    signal(SIGINT,  sig_handler);
    signal(SIGTERM, sig_handler);
    signal(SIGHUP,  sig_handler);

    AdfxConfig cfg;
    const char* config_file = nullptr;

    // CLI override tracking - only applied after YAML load
    bool cli_genre_set    = false;  std::string cli_genre;
    bool cli_rate_set     = false;  int         cli_rate      = 44100;
    bool cli_block_set    = false;  int         cli_block     = 64;
    bool cli_in_dev_set   = false;  int         cli_in_dev    = -1;
    bool cli_out_dev_set  = false;  int         cli_out_dev   = -1;
    bool cli_loglevel_set = false;  int         cli_loglevel  = 4;
    bool cli_logdir_set   = false;  std::string cli_logdir;

    int opt, idx = 0;
    while ((opt = getopt_long(argc, argv, "c:g:vlh", long_opts, &idx)) != -1) {
        switch (opt) {
        case 'c': config_file = optarg;                                   break;
        case 'g': cli_genre_set    = true; cli_genre    = optarg;         break;
        case 'v': cli_loglevel_set = true; cli_loglevel = 5;              break;
        case 'l': return list_devices();
        case  1: cli_rate_set     = true; cli_rate     = atoi(optarg);   break;
        case  2: cli_block_set    = true; cli_block    = atoi(optarg);   break;
        case  3: cli_in_dev_set   = true; cli_in_dev   = atoi(optarg);   break;
        case  4: cli_out_dev_set  = true; cli_out_dev  = atoi(optarg);   break;
        case  5: cli_loglevel_set = true; cli_loglevel = atoi(optarg);   break;
        case  6: cli_logdir_set   = true; cli_logdir   = optarg;         break;
        case 'h': print_usage(argv[0]); return 0;
        default:  print_usage(argv[0]); return 1;
        }
    }

    /* Load YAML startup config */
    if (config_file && !adfx_load_config(config_file, cfg)) {
        fprintf(stderr, "[adfx] Fatal: config load failed: %s\n", config_file);
        return 1;
    }

    /* Re-apply CLI overrides on top of YAML values */
    if (cli_genre_set)    cfg.initial_genre = cli_genre;
    if (cli_rate_set)     cfg.sample_rate   = cli_rate;
    if (cli_block_set)    cfg.block_size    = cli_block;
    if (cli_in_dev_set)   cfg.input_device  = cli_in_dev;
    if (cli_out_dev_set)  cfg.output_device = cli_out_dev;
    if (cli_loglevel_set) cfg.log_level     = cli_loglevel;
    if (cli_logdir_set)   cfg.log_dir       = cli_logdir;

    if (cfg.sample_rate <= 0 || cfg.block_size <= 0) {
        fprintf(stderr, "[adfx] Fatal: sample rate and block size must be positive\n");
        return 1;
    }

    adfxlog.init(cfg.log_dir, cfg.log_level, cfg.log_stderr);
    ADFX_DBG("Effective config: config=" + std::string(config_file ? config_file : "(none)")
             + " rate=" + std::to_string(cfg.sample_rate)
             + " block=" + std::to_string(cfg.block_size)
             + " in=" + std::to_string(cfg.input_device)
             + " out=" + std::to_string(cfg.output_device)
             + " genre=" + cfg.initial_genre
             + " fallback=" + cfg.fallback_genre);

    /* Build the chain - every effect buffer is allocated here */
    adfx::EffectChainConfig chain_cfg;
    chain_cfg.sample_rate      = cfg.sample_rate;
    chain_cfg.max_block_frames = static_cast<size_t>(cfg.block_size);
    chain_cfg.initial_genre    = cfg.initial_genre;
    chain_cfg.fallback_genre   = cfg.fallback_genre;
    adfx::EffectChain chain(chain_cfg);

    PortAudioDuplex driver(cfg.input_device, cfg.output_device,
                           cfg.sample_rate, static_cast<size_t>(cfg.block_size));

    /* Audio callback: copy capture → output, process in place */
    bool started = driver.start([&chain](const float* in, float* out, size_t frames) {
        if (in) std::copy(in, in + frames, out);
        else    std::fill(out, out + frames, 0.0f);
        chain.process(out, frames);
    });
    if (!started) {
        ADFX_CRIT("Cannot start audio stream - see errors above");
        return 1;
    }

    fprintf(stdout,
        "\n"
        "  adfx v0.3.0 (Linux)\n"
        "  ──────────────────────────────────────────────────────\n"
        "  Device : %s\n"
        "  Stream : %d Hz, %d frames/block (%.2f ms)\n"
        "  Genre  : %s\n"
        "  Keys   : 1-5 genre, ? list, q quit\n\n",
        driver.name().c_str(), cfg.sample_rate, cfg.block_size,
        1000.0 * cfg.block_size / cfg.sample_rate,
        chain.current_genre().c_str());

    /* Control loop: stdin genre requests + periodic fault reporting */
    char line[256];
    while (g_running && driver.is_running()) {
        struct pollfd pfd = { STDIN_FILENO, POLLIN, 0 };
        int rc = poll(&pfd, 1, 500);

        chain.drain_faults();

        if (g_reopen_logs) {
            g_reopen_logs = 0;
            adfxlog.rotate();
            ADFX_INFO("Log files reopened (SIGHUP)");
        }

        if (rc <= 0) continue;
        if (!fgets(line, sizeof(line), stdin)) break;   // EOF

        std::string cmd = trim(line);
        if (cmd.empty()) continue;
        if (cmd == "q" || cmd == "quit") break;
        if (cmd == "?") {
            for (const auto& g : adfx::EffectChain::available_genres())
                fprintf(stdout, "  %s\n", g.c_str());
            continue;
        }

        chain.set_genre(hotkey_genre(cmd));
        fprintf(stdout, ">>> Genre: %s\n", chain.current_genre().c_str());
    }

    fprintf(stdout, "\n[adfx] Shutdown - stopping stream...\n");
    driver.stop();
    chain.drain_faults();
    return 0;
}
