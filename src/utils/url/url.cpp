#include "url.hpp"
#include <cctype>
#include <string_view>
#include "../text/string_utils.hpp"

namespace XRobots {
namespace Utils {

namespace {

bool is_unreserved_or_reserved(unsigned char c) {
    if (std::isalnum(c))
        return true;
    switch (c) {
        case '-': case '.': case '_': case '~':
        case ':': case '/': case '?': case '#': case '[': case ']': case '@':
        case '!': case '$': case '&': case '\'': case '(': case ')':
        case '*': case '+': case ',': case ';': case '=':
            return true;
        default:
            return false;
    }
}

bool is_hex_escape(const std::string& s, size_t i) {
    return i + 2 < s.size() && std::isxdigit(static_cast<unsigned char>(s[i + 1]))
           && std::isxdigit(static_cast<unsigned char>(s[i + 2]));
}

}  // namespace

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;
    if (url.empty()) {
        parsed.path = "/";
        return parsed;
    }

    std::string_view sv = url;

    size_t colon       = sv.find(':');
    size_t first_slash = sv.find('/');
    size_t first_q     = sv.find('?');
    size_t first_h     = sv.find('#');
    bool   has_scheme  = (colon != std::string_view::npos && colon > 0);
    if (has_scheme && first_slash != std::string_view::npos && colon > first_slash)
        has_scheme = false;
    if (has_scheme && first_q != std::string_view::npos && colon > first_q)
        has_scheme = false;
    if (has_scheme && first_h != std::string_view::npos && colon > first_h)
        has_scheme = false;

    if (has_scheme) {
        parsed.scheme = Text::to_lower(std::string(sv.substr(0, colon)));
        sv.remove_prefix(colon + 1);
    }

    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        sv.remove_prefix(2);
        size_t      end_auth  = sv.find_first_of("/?#");
        std::string authority = std::string(sv.substr(0, end_auth));
        if (end_auth != std::string_view::npos)
            sv.remove_prefix(end_auth);
        else
            sv = "";

        size_t      at        = authority.find_last_of('@');
        std::string host_port = (at != std::string::npos) ? authority.substr(at + 1) : authority;

        if (!host_port.empty() && host_port[0] == '[') {
            size_t end_bracket = host_port.find(']');
            if (end_bracket != std::string::npos) {
                parsed.host    = host_port.substr(0, end_bracket + 1);
                size_t p_colon = host_port.find(':', end_bracket + 1);
                if (p_colon != std::string::npos)
                    parsed.port = host_port.substr(p_colon + 1);
            }
            else {
                parsed.host = host_port;
            }
        }
        else {
            size_t p_colon = host_port.find_last_of(':');
            if (p_colon != std::string::npos) {
                parsed.host = host_port.substr(0, p_colon);
                parsed.port = host_port.substr(p_colon + 1);
            }
            else {
                parsed.host = host_port;
            }
        }
    }

    size_t h_pos = sv.find('#');
    if (h_pos != std::string_view::npos) {
        parsed.fragment = std::string(sv.substr(h_pos + 1));
        sv              = sv.substr(0, h_pos);
    }
    size_t q_pos = sv.find('?');
    if (q_pos != std::string_view::npos) {
        parsed.query = std::string(sv.substr(q_pos + 1));
        sv           = sv.substr(0, q_pos);
    }

    parsed.path = std::string(sv);
    if (parsed.path.empty())
        parsed.path = "/";
    return parsed;
}

bool Url::is_valid(const std::string& url) {
    if (url.empty())
        return false;
    for (unsigned char c : url) {
        if (std::iscntrl(c) || c == ' ')
            return false;
    }

    UrlParsed p = parse(url);
    if (p.scheme != "http" && p.scheme != "https")
        return false;
    if (p.host.empty())
        return false;
    if (!p.port.empty()) {
        if (p.port.size() > 5)
            return false;
        for (char c : p.port) {
            if (!std::isdigit(static_cast<unsigned char>(c)))
                return false;
        }
        int port = std::stoi(p.port);
        if (port <= 0 || port > 65535)
            return false;
    }
    return true;
}

std::string Url::encode(const std::string& url) {
    static const char* HEX = "0123456789ABCDEF";

    std::string out;
    out.reserve(url.size());
    for (size_t i = 0; i < url.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(url[i]);
        if (c == '%' && is_hex_escape(url, i)) {
            out += url[i];
        }
        else if (is_unreserved_or_reserved(c)) {
            out += url[i];
        }
        else {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0F];
        }
    }
    return out;
}

}  // namespace Utils
}  // namespace XRobots
