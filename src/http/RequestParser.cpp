#include "http/RequestParser.hpp"

#include <cctype>
#include <charconv>
#include <string>

namespace {

std::string_view trim_view(std::string_view value) {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t' || value.back() == '\r')) {
        value.remove_suffix(1);
    }
    return value;
}

std::string to_lower_copy(std::string_view value) {
    std::string lowered;
    lowered.reserve(value.size());
    for (unsigned char ch : value) {
        lowered.push_back(static_cast<char>(std::tolower(ch)));
    }
    return lowered;
}

std::string_view next_line(std::string_view& remaining) {
    const auto pos = remaining.find('\n');
    std::string_view line = remaining.substr(0, pos);
    remaining = pos == std::string_view::npos ? std::string_view{} : remaining.substr(pos + 1);
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line;
}

}  // namespace

namespace tvh::http {

std::optional<tvh::api::Request> parse_request_head(std::string_view head) {
    std::string_view remaining = head;
    const auto requestLine = next_line(remaining);

    const auto firstSpace = requestLine.find(' ');
    if (firstSpace == std::string_view::npos || firstSpace == 0) {
        return std::nullopt;
    }
    const auto secondSpace = requestLine.find(' ', firstSpace + 1);
    if (secondSpace == std::string_view::npos || secondSpace == firstSpace + 1) {
        return std::nullopt;
    }

    tvh::api::Request request{};
    request.method = std::string{requestLine.substr(0, firstSpace)};
    request.target = std::string{requestLine.substr(firstSpace + 1, secondSpace - firstSpace - 1)};
    request.version = std::string{trim_view(requestLine.substr(secondSpace + 1))};
    if (request.version.rfind("HTTP/", 0) != 0 || request.target.empty()) {
        return std::nullopt;
    }

    const auto queryPos = request.target.find('?');
    if (queryPos != std::string::npos) {
        request.path = request.target.substr(0, queryPos);
        request.query = request.target.substr(queryPos + 1);
    } else {
        request.path = request.target;
    }

    while (!remaining.empty()) {
        const auto line = next_line(remaining);
        if (line.empty()) {
            break;
        }
        const auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            continue;
        }
        request.headers[to_lower_copy(trim_view(line.substr(0, colon)))] =
            std::string{trim_view(line.substr(colon + 1))};
    }

    return request;
}

std::optional<std::size_t> content_length(const tvh::api::Request& request) {
    const auto it = request.headers.find("content-length");
    if (it == request.headers.end()) {
        return std::size_t{0};
    }
    const auto& value = it->second;
    if (value.empty()) {
        return std::nullopt;
    }
    std::size_t length = 0;
    const auto* begin = value.data();
    const auto* end = begin + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, length);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return length;
}

}  // namespace tvh::http
