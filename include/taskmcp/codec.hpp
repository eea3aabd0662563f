#pragma once
#include "types.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace taskmcp {

class Codec {
public:
    /// Decode one line into a JSON value.
    /// Throws ParseError on empty input, invalid JSON or trailing content.
    [[nodiscard]] static nlohmann::json parse(std::string_view raw);

    /// Serialize a response to a single line (no trailing newline).
    [[nodiscard]] static std::string serialize(const Response& response);
};

} // namespace taskmcp
