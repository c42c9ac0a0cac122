// ============================================================
// host_probe.cpp -- Local address, terminal and MIME probes
// ============================================================

#include "host_probe.hpp"
#include "../common/logger.hpp"
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <set>
#include <ifaddrs.h>
#include <net/if.h>
#include <sys/ioctl.h>
#include <sys/stat.h>

namespace host {

bool is_loopback_or_link_local(const std::string& addr, bool v6) {
    if (!v6) {
        return addr.compare(0, 4, "127.") == 0;
    }
    if (addr == "::1") return true;
    if (addr.size() >= 4) {
        std::string head = addr.substr(0, 4);
        for (auto& c : head) c = (char)std::tolower((unsigned char)c);
        // fe80::/10 covers fe80 .. febf
        if (head.compare(0, 2, "fe") == 0 &&
            (head[2] == '8' || head[2] == '9' || head[2] == 'a' || head[2] == 'b')) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> discover_addresses(bool include_all, bool resolve) {
    std::set<std::string> names;
    std::set<std::string> v4addrs;
    std::set<std::string> v6addrs;

    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        LOG_DEBUG("getifaddrs failed: " + socket_error_str(errno));
        return {};
    }

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr) continue;
        if (!(ifa->ifa_flags & IFF_UP)) continue;

        int family = ifa->ifa_addr->sa_family;
        if (family != AF_INET && family != AF_INET6) continue;

        socklen_t len = family == AF_INET ? sizeof(sockaddr_in) : sizeof(sockaddr_in6);
        char host_buf[NI_MAXHOST] = {0};
        if (getnameinfo(ifa->ifa_addr, len, host_buf, sizeof(host_buf),
                        nullptr, 0, NI_NUMERICHOST) != 0) {
            continue;
        }

        std::string addr = host_buf;
        size_t scope = addr.find('%');
        if (scope != std::string::npos) addr.resize(scope);

        bool v6 = family == AF_INET6;
        if (!include_all && is_loopback_or_link_local(addr, v6)) continue;

        if (resolve) {
            char name[NI_MAXHOST] = {0};
            if (getnameinfo(ifa->ifa_addr, len, name, sizeof(name),
                            nullptr, 0, NI_NAMEREQD) == 0) {
                names.insert(name);
            }
        }

        if (v6) {
            v6addrs.insert("[" + addr + "]");
        } else {
            v4addrs.insert(addr);
        }
    }
    freeifaddrs(ifaddr);

    std::vector<std::string> out(names.begin(), names.end());
    out.insert(out.end(), v4addrs.begin(), v4addrs.end());
    out.insert(out.end(), v6addrs.begin(), v6addrs.end());
    return out;
}

int terminal_width(int fd) {
    if (!isatty(fd)) return DEFAULT_TERM_WIDTH;
    struct winsize w{};
    if (ioctl(fd, TIOCGWINSZ, &w) == -1 || w.ws_col == 0) {
        return DEFAULT_TERM_WIDTH;
    }
    return (int)w.ws_col;
}

std::string find_in_path(const std::string& command) {
    const char* path_env = std::getenv("PATH");
    if (!path_env) return "";

    std::string path = path_env;
    size_t start = 0;
    while (start <= path.size()) {
        size_t colon = path.find(':', start);
        if (colon == std::string::npos) colon = path.size();
        std::string dir = path.substr(start, colon - start);
        if (!dir.empty()) {
            std::string candidate = dir + "/" + command;
            struct stat st{};
            if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
                access(candidate.c_str(), X_OK) == 0) {
                return candidate;
            }
        }
        start = colon + 1;
    }
    return "";
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

bool parse_mime_output(const std::string& output, std::string& mime) {
    std::string s = output;
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) {
        s.pop_back();
    }
    size_t slash = s.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 == s.size()) return false;
    if (s.find('/', slash + 1) != std::string::npos) return false;
    for (char c : s) {
        if (c == ' ' || c == '\t' || c == ':') return false;
    }
    mime = s;
    return true;
}

bool detect_mime(const std::string& path, std::string& mime) {
    std::string file_cmd = find_in_path("file");
    if (file_cmd.empty()) {
        LOG_DEBUG("'file' not found in PATH, using default MIME type");
        return false;
    }

    std::string cmd = shell_quote(file_cmd) + " --mime-type -b -- " +
                      shell_quote(path) + " 2>/dev/null";
    FILE* pipe = ::popen(cmd.c_str(), "r");
    if (!pipe) return false;

    std::string output;
    char buf[256];
    while (std::fgets(buf, sizeof(buf), pipe)) {
        output += buf;
        if (output.find('\n') != std::string::npos) break;
    }
    int status = ::pclose(pipe);
    if (status != 0) {
        LOG_DEBUG("'file --mime-type' exited with status " + std::to_string(status));
    }
    return parse_mime_output(output, mime);
}

std::string url_escape(const std::string& s) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                          (c >= '0' && c <= '9') ||
                          c == '-' || c == '.' || c == '_' || c == '~';
        if (unreserved) {
            out += (char)c;
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

} // namespace host
