#pragma once

// Receives the "block completed" notification.
// A false return is logged by the engine and not retried.
class ICompletionSink {
public:
    virtual ~ICompletionSink() = default;
    virtual bool notifyBlockCompleted() = 0;
};
