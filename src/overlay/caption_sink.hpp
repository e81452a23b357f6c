#pragma once

#include <string>

struct Caption {
    std::string text;
    bool final = false;
};

// Receives every caption the pipeline publishes, in order, on the capture
// thread. Implementations must not throw and must not block on the UI.
class CaptionSink {
public:
    virtual ~CaptionSink() = default;
    virtual void publish(const Caption& caption) = 0;
};
