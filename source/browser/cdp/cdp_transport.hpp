#ifndef PAGEPILOT_CDP_TRANSPORT_HPP
#define PAGEPILOT_CDP_TRANSPORT_HPP

// Transport abstraction: the single duplex text channel to a browser.
// The connection layer only sees whole text frames; how they travel
// (WebSocket in production, an in-process fake in tests) is hidden here.

#include <functional>
#include <string>

namespace cdp {

class Transport {
public:
    // Called once per complete incoming frame, in arrival order, from the
    // transport's own delivery thread.
    using FrameHandler = std::function<void(const std::string &frame)>;
    // Called once when the channel goes down after a successful open().
    using ClosedHandler = std::function<void(const std::string &reason)>;

    virtual ~Transport() = default;

    // Establish the channel. Returns false and fills error_detail on failure.
    virtual bool open(FrameHandler on_frame, ClosedHandler on_closed, std::string &error_detail) = 0;

    // Queue one text frame for sending. Returns false if the channel is not open.
    virtual bool send_text(const std::string &payload) = 0;

    // Tear the channel down. Safe to call more than once.
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

} // namespace cdp

#endif // PAGEPILOT_CDP_TRANSPORT_HPP
