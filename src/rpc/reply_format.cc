// src/rpc/reply_format.cc
#include "rpc/reply_format.h"

#include <cstdio>

namespace idlease {

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                out += buf;
            } else {
                out += c;
            }
        }
    }
    return out;
}

std::string format_reply_json(const wire::LeaseReply& rsp) {
    char buf[128];
    if (rsp.has_grant()) {
        std::snprintf(buf, sizeof(buf), "{\"id\": %u, \"exp\": %lld}",
                      rsp.grant().id(), static_cast<long long>(rsp.grant().exp()));
        return buf;
    }
    if (rsp.has_error()) {
        std::snprintf(buf, sizeof(buf), "{\"error\": {\"code\": %d, \"msg\": \"",
                      rsp.error().code());
        return buf + json_escape(rsp.error().msg()) + "\"}}";
    }
    return std::string();
}

} // namespace idlease
