#include "ooc/core/config.hpp"
#include "ooc/core/error.hpp"

namespace ooc {

Codec parse_codec(std::string_view name) {
    if (name == "none") return Codec::None;
    if (name == "zstd") return Codec::Zstd;
    throw ValueError("Unknown codec: '" + std::string(name) + "' (expected none|zstd)");
}

} // namespace ooc
