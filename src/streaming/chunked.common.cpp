#include "macros.hh"
#include "chunked.common.hh"

#include <iomanip>
#include <sstream>

std::string
chunked::trim(std::string_view s)
{
    constexpr std::string_view whitespace = " \t\n\v\f\r";

    const auto first = s.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }

    const auto last = s.find_last_not_of(whitespace);
    return std::string(s.substr(first, last - first + 1));
}

bool
chunked::is_empty_string(std::string_view s, std::string_view err_on_empty)
{
    if (!trim(s).empty()) {
        return false;
    }

    LOG_ERROR(err_on_empty);
    return true;
}

uint64_t
chunked::megabytes_to_bytes(uint32_t megabytes) noexcept
{
    return static_cast<uint64_t>(megabytes) * 1024 * 1024;
}

std::string_view
chunked::chunk_file_suffix(const CompressionMode& mode) noexcept
{
    return std::holds_alternative<compression::Gzip>(mode) ? ".gz" : "";
}

std::string
chunked::chunk_file_name(std::string_view naming_scheme,
                         uint32_t chunk_index,
                         const CompressionMode& mode)
{
    std::ostringstream ss;
    ss << naming_scheme << '-' << std::setfill('0') << std::setw(5)
       << chunk_index << chunk_file_suffix(mode);

    return ss.str();
}
