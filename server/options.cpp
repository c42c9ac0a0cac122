// ============================================================
// options.cpp -- Command line parsing and help text
// ============================================================

#include "options.hpp"
#include "../common/utils.hpp"
#include <vector>

static bool takes_value(char opt) {
    return opt == 'b' || opt == 'p' || opt == 'm' || opt == 'U' || opt == 'f';
}

static void apply_option(ServerConfig& cfg, char opt, const std::string& value) {
    switch (opt) {
        case 'a': cfg.all_addresses = true; break;
        case 'u': cfg.unbuffered = true; break;
        case 'n': cfg.resolve = false; break;
        case 'v': cfg.verbose = true; break;
        case 'h': cfg.show_help = true; break;
        case 'm': cfg.mime_override = value; break;
        case 'U': cfg.user_url = value; break;
        case 'f': cfg.url_file = value; break;
        case 'b': {
            u64 n = 0;
            if (!utils::parse_decimal(value, n) || n == 0 || n > MAX_BUFFER_SIZE) {
                throw UsageError("Invalid buffer size: " + value);
            }
            cfg.buffer_size = (size_t)n;
            break;
        }
        case 'p': {
            u64 n = 0;
            if (!utils::parse_decimal(value, n) || !utils::validate_port(n)) {
                throw UsageError("Invalid port specified: " + value);
            }
            cfg.port = (u16)n;
            break;
        }
        default:
            throw UsageError(std::string("Unknown option: -") + opt);
    }
}

ServerConfig parse_args(int argc, const char* const argv[]) {
    ServerConfig cfg;
    std::vector<std::string> positionals;

    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--") { ++i; break; }
        if (arg.size() < 2 || arg[0] != '-') break;

        for (size_t k = 1; k < arg.size(); ++k) {
            char opt = arg[k];
            if (!takes_value(opt)) {
                apply_option(cfg, opt, "");
                if (cfg.show_help) return cfg;
                continue;
            }
            // value is the rest of this word, or the next argument
            std::string value;
            if (k + 1 < arg.size()) {
                value = arg.substr(k + 1);
            } else if (i + 1 < argc) {
                value = argv[++i];
            } else {
                throw UsageError(std::string("Option -") + opt + " requires an argument");
            }
            apply_option(cfg, opt, value);
            break;
        }
    }
    for (; i < argc; ++i) positionals.push_back(argv[i]);

    if (positionals.empty() || positionals[0].empty()) {
        throw UsageError("Must specify a filename");
    }
    if (positionals.size() > 1) {
        std::string extra;
        for (size_t k = 1; k < positionals.size(); ++k) {
            if (k > 1) extra += ' ';
            extra += positionals[k];
        }
        throw UsageError("Unexpected extra arguments: " + extra);
    }
    cfg.name = positionals[0];
    return cfg;
}

void print_usage(std::ostream& os, const std::string& prog, bool brief) {
    os << "Usage:\n"
       << prog << " [ -a ] [ -u ] [ -n ] [ -b bufsize ] [ -p port ] [ -m mimetype ]"
       << " [ -U url ] [ -f filename ] [ -v ] name\n"
       << "\n"
       << "-a          : consider all addresses for URLs (including loopback and link-local addresses)\n"
       << "-u          : flush output buffer as soon as it's written\n"
       << "-n          : do not resolve IPs to names\n"
       << "-b bufsize  : read/write up to bufsize bytes for cycle (default: " << DEFAULT_BUFFER_SIZE << ")\n"
       << "-p port     : listen on this port (default: random)\n"
       << "-m mimetype : force MIME type (default: autodetect if possible, otherwise application/octet-stream)\n"
       << "-U url      : include this URL among the listed alternative URLs\n"
       << "-f filename : use 'filename' to build the request part of the URL (default: dynamically computed)\n"
       << "-v          : print client request headers\n"
       << "\n"
       << "'name' (mandatory argument) must exist in normal mode; in streaming mode it's only used to build the URL\n"
       << "\n";

    if (brief) {
        os << "Use -h for full help\n";
        return;
    }

    os << "Examples:\n"
       << "$ " << prog << " -p 1025 /path/to/file.zip\n"
       << "Listen for connections on port 1025; send file.zip upon client connection. The specified path must exist.\n"
       << "\n"
       << "$ " << prog << " -p 4444 -U 'publicname.example.com:5555' -f archive.zip '/path/to/funny file.zip'\n"
       << "Listen on port 4444, suggest http://publicname.example.com:5555/archive.zip as download URL"
       << " (presumably a port forwarding exists)\n"
       << "\n"
       << "$ tar -cjf - file1 file2 file3 | " << prog << " -m application/x-bzip2 result.tbz2\n"
       << "Listen on random port; upon connection, send the data coming from the pipe with the specified MIME type.\n"
       << "result.tbz2 need not exist; it's only used to build the URL\n";
}
