// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <cstdio>
#include <cstring>

namespace idkspot {

static void print_help(const char* program_name) {
    printf("Usage: %s [options]\n", program_name);
    printf("Options:\n");
    printf("  -c, --config <path>  Settings file (default: $XDG_CONFIG_HOME/idkspot/settings.json)\n");
    printf("  -v, --verbose        Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>    Log destination: auto, journal, syslog, file, console\n");
    printf("  --log-file <path>    Log file path (when --log-dest=file)\n");
    printf("  -h, --help           Show this help message\n");
    printf("\nCommands (read from stdin):\n");
    printf("  start [ssid] <password>   Start the hotspot\n");
    printf("  stop                      Stop the hotspot\n");
    printf("  status                    Show hotspot state\n");
    printf("  devices                   List connected devices\n");
    printf("  block <mac>               Block a device\n");
    printf("  unblock <mac>             Unblock a device\n");
    printf("  blocked                   List blocked devices\n");
    printf("  quit                      Exit\n");
}

/// Value of "--opt=value" or "--opt value"; nullptr (with message) if missing
static const char* option_value(int argc, char** argv, int& i, const char* name) {
    size_t len = strlen(name);
    if (strncmp(argv[i], name, len) == 0 && argv[i][len] == '=') {
        return argv[i] + len + 1;
    }
    if (i + 1 < argc) {
        return argv[++i];
    }
    printf("Error: %s requires an argument\n", name);
    return nullptr;
}

static bool matches_option(const char* arg, const char* name) {
    size_t len = strlen(name);
    return strncmp(arg, name, len) == 0 && (arg[len] == '\0' || arg[len] == '=');
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_help(argv[0]);
            args.help_shown = true;
            return false;
        }
        // Verbosity
        else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "-vv") == 0 ||
                 strcmp(argv[i], "-vvv") == 0) {
            const char* p = argv[i];
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        }
        // Settings file
        else if (strcmp(argv[i], "-c") == 0 || matches_option(argv[i], "--config")) {
            const char* value = nullptr;
            if (strcmp(argv[i], "-c") == 0) {
                if (i + 1 >= argc) {
                    printf("Error: -c requires a path argument\n");
                    return false;
                }
                value = argv[++i];
            } else {
                value = option_value(argc, argv, i, "--config");
            }
            if (!value)
                return false;
            if (value[0] == '\0') {
                printf("Error: --config requires a non-empty path\n");
                return false;
            }
            args.config_path = value;
        }
        // Log destination
        else if (matches_option(argv[i], "--log-dest")) {
            const char* value = option_value(argc, argv, i, "--log-dest");
            if (!value)
                return false;
            args.log_dest = value;
            if (args.log_dest != "auto" && args.log_dest != "journal" &&
                args.log_dest != "syslog" && args.log_dest != "file" &&
                args.log_dest != "console") {
                printf("Error: invalid --log-dest value: %s\n", args.log_dest.c_str());
                printf("Valid values: auto, journal, syslog, file, console\n");
                return false;
            }
        } else if (matches_option(argv[i], "--log-file")) {
            const char* value = option_value(argc, argv, i, "--log-file");
            if (!value)
                return false;
            args.log_file = value;
        } else {
            printf("Unknown argument: %s\n", argv[i]);
            printf("Use --help for usage information\n");
            return false;
        }
    }

    return true;
}

} // namespace idkspot
