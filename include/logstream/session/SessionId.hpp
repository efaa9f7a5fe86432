#pragma once

#include <string>
#include <string_view>

namespace LS {

// Random version 4 UUID in canonical 8-4-4-4-12 lowercase hex form.
auto generate_session_id() -> std::string;

// Session ids name files under the logs directory, so only a conservative
// character set is accepted.
[[nodiscard]] auto is_valid_session_id(std::string_view value) -> bool;

} // namespace LS
