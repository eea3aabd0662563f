#include "taskmcp/uri_template.hpp"
#include "taskmcp/error.hpp"
#include <set>

namespace taskmcp {

namespace {

constexpr std::string_view SCHEME_SEPARATOR = "://";

bool is_placeholder(std::string_view segment) {
    return segment.size() >= 2 && segment.front() == '{' && segment.back() == '}';
}

} // anonymous namespace

std::optional<std::pair<std::string_view, std::string_view>>
split_scheme(std::string_view uri) {
    auto pos = uri.find(SCHEME_SEPARATOR);
    if (pos == std::string_view::npos) return std::nullopt;
    return std::make_pair(uri.substr(0, pos), uri.substr(pos + SCHEME_SEPARATOR.size()));
}

std::vector<std::string_view> split_path(std::string_view path) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        size_t slash = path.find('/', start);
        if (slash == std::string_view::npos) {
            parts.push_back(path.substr(start));
            break;
        }
        parts.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }
    return parts;
}

UriTemplate UriTemplate::parse(std::string_view pattern) {
    auto split = split_scheme(pattern);
    if (!split) {
        throw TemplateError("URI template has no scheme: " + std::string(pattern));
    }
    auto [scheme, rest] = *split;
    if (scheme.empty()) {
        throw TemplateError("URI template has an empty scheme: " + std::string(pattern));
    }
    if (scheme.find('{') != std::string_view::npos) {
        throw TemplateError("Placeholders are not allowed in the scheme: " + std::string(pattern));
    }

    UriTemplate tmpl;
    tmpl.pattern_ = std::string(pattern);
    tmpl.scheme_ = std::string(scheme);

    std::set<std::string> seen;
    for (auto part : split_path(rest)) {
        Segment seg;
        if (is_placeholder(part)) {
            seg.placeholder = true;
            seg.text = std::string(part.substr(1, part.size() - 2));
            if (seg.text.empty()) {
                throw TemplateError("Empty placeholder name in URI template: " + tmpl.pattern_);
            }
            if (!seen.insert(seg.text).second) {
                throw TemplateError("Duplicate placeholder '" + seg.text
                                    + "' in URI template: " + tmpl.pattern_);
            }
        } else {
            seg.text = std::string(part);
        }
        tmpl.segments_.push_back(std::move(seg));
    }
    return tmpl;
}

std::optional<UriParams> UriTemplate::match(std::string_view uri) const {
    auto split = split_scheme(uri);
    if (!split || split->first != scheme_) return std::nullopt;

    auto parts = split_path(split->second);
    if (parts.size() != segments_.size()) return std::nullopt;

    UriParams params;
    for (size_t i = 0; i < parts.size(); ++i) {
        const Segment& seg = segments_[i];
        if (seg.placeholder) {
            if (parts[i].empty()) return std::nullopt;
            params.emplace(seg.text, std::string(parts[i]));
        } else if (parts[i] != seg.text) {
            return std::nullopt;
        }
    }
    return params;
}

std::vector<std::string> UriTemplate::parameter_names() const {
    std::vector<std::string> names;
    for (const auto& seg : segments_) {
        if (seg.placeholder) names.push_back(seg.text);
    }
    return names;
}

std::optional<UriParams> match_uri(std::string_view uri, std::string_view pattern) {
    return UriTemplate::parse(pattern).match(uri);
}

} // namespace taskmcp
