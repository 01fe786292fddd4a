#pragma once

#include "monitor_context.hpp"

#include <iostream>

namespace sysmon {

/**
 * JSON-RPC over a pair of byte streams with Content-Length framing.
 *
 * Strictly sequential: a message is read, dispatched and its reply flushed
 * before the next header block is read.
 */
class StdioServer {
public:
    explicit StdioServer(MonitorContext& context, std::istream& in = std::cin, std::ostream& out = std::cout);

    /**
     * Serve until the input ends.
     *
     * @return true on a clean end of input, false when the stream failed or
     *         ended in the middle of a message body, or a message announced a body
     *         above the size limit (that message gets no reply)
     */
    bool run();

    std::size_t messages_handled() const { return messages_handled_; }

private:
    MonitorContext& context_;
    std::istream& in_;
    std::ostream& out_;
    std::size_t messages_handled_ = 0;
};

} // namespace sysmon
