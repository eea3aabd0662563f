#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace taskmcp {

/// Path parameters bound by a successful match, placeholder name -> raw value.
using UriParams = std::map<std::string, std::string>;

/// Resource address pattern of the form `scheme://seg/seg/{name}`.
///
/// The scheme is compared byte-for-byte. The remainder is split on '/' and
/// compared segment by segment: a literal segment must match exactly, a
/// `{name}` segment binds any non-empty value. Segment counts must be equal.
/// No percent-decoding and no host/authority interpretation is done.
class UriTemplate {
public:
    struct Segment {
        std::string text;       // literal text, or the placeholder name
        bool placeholder = false;

        bool operator==(const Segment& o) const {
            return text == o.text && placeholder == o.placeholder;
        }
    };

    /// Throws TemplateError if the pattern has no `://`, an empty scheme,
    /// an empty placeholder name or a duplicated placeholder name.
    [[nodiscard]] static UriTemplate parse(std::string_view pattern);

    /// Pure: same inputs always give the same result.
    [[nodiscard]] std::optional<UriParams> match(std::string_view uri) const;

    [[nodiscard]] const std::string& pattern() const noexcept { return pattern_; }
    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::vector<Segment>& segments() const noexcept { return segments_; }

    /// Placeholder names in template order.
    [[nodiscard]] std::vector<std::string> parameter_names() const;

private:
    std::string pattern_;
    std::string scheme_;
    std::vector<Segment> segments_;
};

/// Split `scheme://rest` into scheme and rest. std::nullopt without `://`.
[[nodiscard]] std::optional<std::pair<std::string_view, std::string_view>>
split_scheme(std::string_view uri);

/// Split on '/', keeping empty segments ("a//b" -> {"a", "", "b"}).
[[nodiscard]] std::vector<std::string_view> split_path(std::string_view path);

/// Convenience wrapper: parse(pattern).match(uri).
[[nodiscard]] std::optional<UriParams> match_uri(std::string_view uri, std::string_view pattern);

} // namespace taskmcp
