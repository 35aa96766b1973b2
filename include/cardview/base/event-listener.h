#pragma once

#include "object.h"
#include "event.h"
#include <cardview/result.hpp>

namespace cardview {
namespace base {

class EventListener : public virtual Object {
public:
    using Ptr = std::shared_ptr<EventListener>;

    virtual ~EventListener() = default;

    // Frames, connection changes and timer ticks arrive here on the loop thread.
    // Ok(true) stops the dispatch to lower-priority listeners.
    virtual Result<bool> onEvent(const Event& event) = 0;
};

} // namespace base
} // namespace cardview
