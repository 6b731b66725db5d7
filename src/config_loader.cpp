// config_loader.cpp - Startup YAML -> AdfxConfig
//
// The logger is not initialised yet when this runs (its directory and level
// come from this file), so problems are reported on stderr.

#include "config_loader.h"

#include <yaml.h>

#include <errno.h>
#include <limits.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <string>

namespace {

// One parsed document; every section parser reads through this
struct YamlDoc {
    yaml_document_t doc;
    const char*     path;
    bool            ok = true;   // cleared by the first bad value
};

const char* scalar_of(yaml_node_t* node)
{
    if (!node || node->type != YAML_SCALAR_NODE) return nullptr;
    return reinterpret_cast<const char*>(node->data.scalar.value);
}

yaml_node_t* lookup(YamlDoc& y, yaml_node_t* map, const char* key)
{
    if (!map || map->type != YAML_MAPPING_NODE) return nullptr;
    for (yaml_node_pair_t* pair = map->data.mapping.pairs.start;
         pair < map->data.mapping.pairs.top; ++pair)
    {
        const char* k = scalar_of(yaml_document_get_node(&y.doc, pair->key));
        if (k && strcmp(k, key) == 0)
            return yaml_document_get_node(&y.doc, pair->value);
    }
    return nullptr;
}

void bad_value(YamlDoc& y, const char* section, const char* key, const char* value)
{
    fprintf(stderr, "[config] %s.%s: invalid value '%s' in %s\n",
            section, key, value ? value : "(not a scalar)", y.path);
    y.ok = false;
}

// Missing key: `out` untouched.  Present but not an integer: load fails.
void read_int(YamlDoc& y, yaml_node_t* section_node, const char* section,
              const char* key, int& out)
{
    yaml_node_t* node = lookup(y, section_node, key);
    if (!node) return;

    const char* s = scalar_of(node);
    if (!s || !*s) { bad_value(y, section, key, s); return; }

    errno = 0;
    char* end = nullptr;
    long v = strtol(s, &end, 10);
    if (errno != 0 || *end != '\0' || v < INT_MIN || v > INT_MAX) {
        bad_value(y, section, key, s);
        return;
    }
    out = static_cast<int>(v);
}

void read_string(YamlDoc& y, yaml_node_t* section_node, const char* section,
                 const char* key, std::string& out)
{
    yaml_node_t* node = lookup(y, section_node, key);
    if (!node) return;

    const char* s = scalar_of(node);
    if (!s) { bad_value(y, section, key, s); return; }
    out = s;
}

void read_bool(YamlDoc& y, yaml_node_t* section_node, const char* section,
               const char* key, bool& out)
{
    yaml_node_t* node = lookup(y, section_node, key);
    if (!node) return;

    const char* s = scalar_of(node);
    if (s && (!strcmp(s, "true") || !strcmp(s, "yes") || !strcmp(s, "1")))
        out = true;
    else if (s && (!strcmp(s, "false") || !strcmp(s, "no") || !strcmp(s, "0")))
        out = false;
    else
        bad_value(y, section, key, s);
}

// ---------------------------------------------------------------------------
// Sections
// ---------------------------------------------------------------------------

void parse_audio(YamlDoc& y, yaml_node_t* node, AdfxConfig& cfg)
{
    read_int(y, node, "audio", "sample-rate",   cfg.sample_rate);
    read_int(y, node, "audio", "block-size",    cfg.block_size);
    read_int(y, node, "audio", "input-device",  cfg.input_device);
    read_int(y, node, "audio", "output-device", cfg.output_device);
}

void parse_effects(YamlDoc& y, yaml_node_t* node, AdfxConfig& cfg)
{
    read_string(y, node, "effects", "initial-genre",  cfg.initial_genre);
    read_string(y, node, "effects", "fallback-genre", cfg.fallback_genre);
}

void parse_log(YamlDoc& y, yaml_node_t* node, AdfxConfig& cfg)
{
    read_string(y, node, "log", "log-dir",   cfg.log_dir);
    read_int   (y, node, "log", "log-level", cfg.log_level);
    read_bool  (y, node, "log", "stderr",    cfg.log_stderr);
}

} // namespace

// ---------------------------------------------------------------------------
// adfx_load_config
// ---------------------------------------------------------------------------

bool adfx_load_config(const char* path, AdfxConfig& cfg)
{
    if (!path || !path[0]) {
        fprintf(stderr, "[config] No config file given.\n");
        return false;
    }

    FILE* f = fopen(path, "r");
    if (!f) {
        fprintf(stderr, "[config] Cannot open %s: %s\n", path, strerror(errno));
        return false;
    }

    yaml_parser_t parser;
    yaml_parser_initialize(&parser);
    yaml_parser_set_input_file(&parser, f);

    YamlDoc y;
    y.path = path;
    const bool loaded = yaml_parser_load(&parser, &y.doc) != 0;
    if (!loaded) {
        fprintf(stderr, "[config] YAML parse error in %s: %s (line %zu)\n",
                path, parser.problem ? parser.problem : "unknown",
                parser.problem_mark.line + 1);
    }
    yaml_parser_delete(&parser);
    fclose(f);
    if (!loaded) return false;

    yaml_node_t* root = yaml_document_get_root_node(&y.doc);
    if (!root || root->type != YAML_MAPPING_NODE) {
        fprintf(stderr, "[config] %s: top level must be a mapping\n", path);
        yaml_document_delete(&y.doc);
        return false;
    }

    // Sections are optional; a missing one keeps the compiled-in defaults
    parse_audio  (y, lookup(y, root, "audio"),   cfg);
    parse_effects(y, lookup(y, root, "effects"), cfg);
    parse_log    (y, lookup(y, root, "log"),     cfg);

    yaml_document_delete(&y.doc);
    if (!y.ok) return false;

    if (cfg.sample_rate <= 0) {
        fprintf(stderr, "[config] sample-rate must be positive (got %d) in %s\n",
                cfg.sample_rate, path);
        return false;
    }
    if (cfg.block_size <= 0) {
        fprintf(stderr, "[config] block-size must be positive (got %d) in %s\n",
                cfg.block_size, path);
        return false;
    }
    return true;
}
