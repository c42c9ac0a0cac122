#pragma once

// ============================================================
// options.hpp -- Command line -> ServerConfig
// ============================================================

#include "../common/platform.hpp"
#include "../common/errors.hpp"
#include <string>
#include <ostream>

static constexpr size_t DEFAULT_BUFFER_SIZE = 16384;
static constexpr size_t MAX_BUFFER_SIZE     = 64u * 1024u * 1024u;

struct ServerConfig {
    bool        all_addresses{false};  // -a
    bool        unbuffered{false};     // -u
    bool        resolve{true};         // cleared by -n
    size_t      buffer_size{DEFAULT_BUFFER_SIZE};  // -b
    u16         port{0};               // -p; 0 = pick one in [8000, 9000)
    std::string mime_override;         // -m
    std::string user_url;              // -U
    std::string url_file;              // -f
    bool        verbose{false};        // -v
    bool        show_help{false};      // -h
    std::string name;                  // the one positional argument
};

// Bad command line; the message is shown above the short usage
class UsageError : public SetupError {
public:
    explicit UsageError(const std::string& msg) : SetupError(msg) {}
};

// Parse argv (getopt style: clustered flags, attached or separate values,
// "--" ends options, the first non-option starts the positionals).
// Throws UsageError. With -h, returns early with show_help set.
ServerConfig parse_args(int argc, const char* const argv[]);

// Full help (with examples) or, when 'brief', just the synopsis
void print_usage(std::ostream& os, const std::string& prog, bool brief);
