#include <rotator/query.hpp>
#include <algorithm>

namespace rotator {

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(const std::string& in) {
    std::string out;
    out.reserve(in.size());

    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < in.size()) {
            int hi = hex_value(in[i + 1]);
            int lo = hex_value(in[i + 2]);
            if (hi < 0 || lo < 0) {
                out += c;
                continue;
            }
            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

BannerQuery parse_target(const std::string& target) {
    BannerQuery query;

    size_t qpos = target.find('?');
    size_t end = target.find('#');
    query.path = url_decode(target.substr(0, std::min(qpos, end)));
    if (qpos == std::string::npos || (end != std::string::npos && end < qpos)) {
        return query;
    }

    std::string params = target.substr(qpos + 1, end == std::string::npos ? std::string::npos
                                                                           : end - qpos - 1);
    size_t start = 0;
    while (start <= params.size()) {
        size_t amp = params.find('&', start);
        if (amp == std::string::npos) amp = params.size();

        std::string pair = params.substr(start, amp - start);
        size_t eq = pair.find('=');
        std::string key = url_decode(pair.substr(0, eq));
        std::string value = eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));

        if ((key == "category" || key == "category[]") && !value.empty()) {
            query.categories.push_back(std::move(value));
        }
        start = amp + 1;
    }
    return query;
}

} // namespace rotator
