#include "framing.hpp"

#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <stdexcept>

#include <log4cplus/loggingmacros.h>

namespace sysmon::framing {

namespace {

constexpr const char* kContentLength = "content-length";

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t");
    return value.substr(begin, end - begin + 1);
}

/// Announced length of a Content-Length line; SIZE_MAX when it does not fit in a size_t.
std::optional<std::size_t> parse_content_length(const std::string& line) {
    auto colon = line.find(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }
    if (to_lower(trim(line.substr(0, colon))) != kContentLength) {
        return std::nullopt;
    }

    std::string value = trim(line.substr(colon + 1));
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        LOG4CPLUS_WARN(rpc_logger(), "Ignoring malformed Content-Length header: " << line);
        return std::nullopt;
    }
    try {
        return static_cast<std::size_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        return std::numeric_limits<std::size_t>::max();
    }
}

} // namespace

ReadStatus read_frame(std::istream& in, std::string& body) {
    while (true) {
        std::optional<std::size_t> content_length;

        std::string line;
        while (true) {
            if (!std::getline(in, line)) {
                if (in.bad()) {
                    return ReadStatus::StreamError;
                }
                return ReadStatus::EndOfStream;
            }
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty()) {
                break;
            }
            if (auto length = parse_content_length(line)) {
                content_length = length;
            }
        }

        if (!content_length) {
            LOG4CPLUS_WARN(rpc_logger(), "Header block without Content-Length discarded");
            continue;
        }
        if (*content_length > kMaxBodySize) {
            // the body cannot be skipped safely, so the stream is unusable from here on
            LOG4CPLUS_ERROR(rpc_logger(), "Content-Length " << *content_length << " exceeds the "
                                                            << kMaxBodySize << " byte limit");
            return ReadStatus::Oversized;
        }

        body.assign(*content_length, '\0');
        if (*content_length > 0) {
            in.read(&body[0], static_cast<std::streamsize>(*content_length));
        }
        auto received = static_cast<std::size_t>(in.gcount());
        if (*content_length > 0 && received != *content_length) {
            body.resize(received);
            if (in.bad()) {
                return ReadStatus::StreamError;
            }
            LOG4CPLUS_ERROR(rpc_logger(), "Stream ended after " << received << " of "
                                                                 << *content_length << " body bytes");
            return ReadStatus::Truncated;
        }
        return ReadStatus::Message;
    }
}

bool write_frame(std::ostream& out, const std::string& body) {
    out << "Content-Length: " << body.size() << "\r\n\r\n" << body;
    out.flush();
    return static_cast<bool>(out);
}

} // namespace sysmon::framing
