#pragma once

#include <optional>

#include <QString>

namespace kgnav {

// One-way channel from native code to the front-end.
class FrontendEventSink
{
public:
    virtual ~FrontendEventSink() = default;

    // Returns false when no listener received the event. Callers must not
    // treat that as an error.
    virtual bool emitEvent(const QString &name, const std::optional<QString> &payload) = 0;
};

} // namespace kgnav
