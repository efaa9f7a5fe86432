#include <logstream/session/SessionId.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

namespace LS {

auto generate_session_id() -> std::string {
    std::array<unsigned char, 16> buffer{};
    std::random_device            device;
    for (auto& byte : buffer) {
        byte = static_cast<unsigned char>(device());
    }
    buffer[6] = static_cast<unsigned char>((buffer[6] & 0x0F) | 0x40);
    buffer[8] = static_cast<unsigned char>((buffer[8] & 0x3F) | 0x80);

    std::ostringstream stream;
    stream << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < buffer.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            stream << '-';
        }
        stream << std::setw(2) << static_cast<int>(buffer[i]);
    }
    return stream.str();
}

auto is_valid_session_id(std::string_view value) -> bool {
    if (value.empty() || value.size() > 128) {
        return false;
    }
    return std::all_of(value.begin(), value.end(), [](unsigned char ch) {
        return std::isalnum(ch) != 0 || ch == '_' || ch == '-';
    });
}

} // namespace LS
