#include <arbor/url.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace {
    auto hex_to_uint(char c) -> std::uint8_t {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;

        return 0;
    }

    auto is_hex(char c) -> bool {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    }
}

namespace arbor {
    auto split_target(std::string_view target) -> arbor::target {
        const auto fragment = target.find('#');
        if (fragment != std::string_view::npos) {
            target = target.substr(0, fragment);
        }

        if (!target.starts_with('/')) {
            const auto scheme = target.find("://");
            if (scheme != std::string_view::npos) {
                const auto path = target.find('/', scheme + 3);
                const auto query = target.find('?', scheme + 3);
                const auto start = std::min(path, query);

                target = start == std::string_view::npos ?
                    std::string_view() : target.substr(start);
            }
        }

        const auto query = target.find('?');
        if (query == std::string_view::npos) return {.path = target};

        return {
            .path = target.substr(0, query),
            .query = target.substr(query + 1)
        };
    }

    auto split_path(std::string_view path) -> std::vector<std::string> {
        auto segments = std::vector<std::string>();

        while (!path.empty()) {
            const auto slash = path.find('/');
            const auto segment = path.substr(0, slash);

            if (!segment.empty()) segments.emplace_back(segment);

            if (slash == std::string_view::npos) break;
            path.remove_prefix(slash + 1);
        }

        return segments;
    }

    auto percent_decode(std::string_view value, bool plus_as_space)
        -> std::string
    {
        auto result = std::string();
        result.reserve(value.size());

        for (std::size_t i = 0; i < value.size(); ++i) {
            const auto c = value[i];

            if (
                c == '%' &&
                i + 2 < value.size() &&
                is_hex(value[i + 1]) &&
                is_hex(value[i + 2])
            ) {
                result.push_back(static_cast<char>(
                    (hex_to_uint(value[i + 1]) << 4) +
                    hex_to_uint(value[i + 2])
                ));
                i += 2;
            }
            else if (c == '+' && plus_as_space) result.push_back(' ');
            else result.push_back(c);
        }

        return result;
    }

    auto parse_urlencoded(std::string_view data)
        -> std::vector<std::pair<std::string, std::string>>
    {
        auto pairs = std::vector<std::pair<std::string, std::string>>();

        while (!data.empty()) {
            const auto amp = data.find('&');
            const auto entry = data.substr(0, amp);

            if (!entry.empty()) {
                const auto delim = entry.find('=');

                if (delim == std::string_view::npos) {
                    pairs.emplace_back(percent_decode(entry, true), "");
                }
                else {
                    pairs.emplace_back(
                        percent_decode(entry.substr(0, delim), true),
                        percent_decode(entry.substr(delim + 1), true)
                    );
                }
            }

            if (amp == std::string_view::npos) break;
            data.remove_prefix(amp + 1);
        }

        return pairs;
    }
}
