#pragma once

#include <map>
#include <string>
#include <string_view>

namespace eio::utils {

    using QueryMap = std::map<std::string, std::string>;

    /**
     * @brief Percent-decode a URL component; '+' becomes a space.
     * Invalid escapes are kept literally.
     */
    std::string url_decode(std::string_view text);

    /**
     * @brief Decode "a=1&b=2" into a map. Later duplicates win,
     * and a key without '=' maps to an empty string.
     */
    QueryMap decode_query(std::string_view query);

}// namespace eio::utils
