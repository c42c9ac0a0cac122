#pragma once

// ============================================================
// host_probe.hpp -- Facts about the local host
//
// Everything here is best effort: a probe that cannot answer
// returns its documented default and never throws.
// ============================================================

#include "../common/platform.hpp"
#include <string>
#include <vector>

namespace host {

static constexpr int  DEFAULT_TERM_WIDTH = 80;
static constexpr const char* DEFAULT_MIME = "application/octet-stream";

// Addresses (and reverse-resolved names) that may reach this host.
// Order: names, IPv4 addresses, bracketed IPv6 addresses. Only
// interfaces that are up are considered. Loopback and link-local
// addresses are skipped unless 'include_all'. Empty on failure.
std::vector<std::string> discover_addresses(bool include_all, bool resolve);

// True for 127.0.0.0/8, ::1 and fe80::/10
bool is_loopback_or_link_local(const std::string& addr, bool v6);

// Columns of the terminal behind 'fd'; DEFAULT_TERM_WIDTH otherwise
int terminal_width(int fd = STDOUT_FILENO);

// Absolute path of an executable found on $PATH, empty if none
std::string find_in_path(const std::string& command);

// MIME type reported by `file --mime-type`. Returns false when the
// tool is missing or its answer is not "type/subtype".
bool detect_mime(const std::string& path, std::string& mime);

// Extract "type/subtype" from one line of `file --mime-type -b` output
bool parse_mime_output(const std::string& output, std::string& mime);

// Percent-encode everything outside A-Z a-z 0-9 - . _ ~
std::string url_escape(const std::string& s);

// Wrap in single quotes for /bin/sh
std::string shell_quote(const std::string& s);

} // namespace host
