#include <pbi_scan/core/url.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace pbi_scan {

std::string UrlEncode(const std::string& value) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return encoded.str();
}

std::string WithQuery(const std::string& path,
                      const std::vector<std::pair<std::string, std::string>>& query) {
    if (query.empty()) {
        return path;
    }
    std::string out = path;
    char sep = path.find('?') == std::string::npos ? '?' : '&';
    for (const auto& [key, value] : query) {
        out += sep;
        out += key;
        out += '=';
        out += UrlEncode(value);
        sep = '&';
    }
    return out;
}

} // namespace pbi_scan
