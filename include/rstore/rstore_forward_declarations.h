#ifndef RSTORE_FORWARD_DECLARATIONS_H
#define RSTORE_FORWARD_DECLARATIONS_H

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <rstore/util/date_time.h>

namespace rstore {
    // Returned by every subscription style call; idempotent.
    using Unsubscribe = std::function<void()>;
    using Notification = std::function<void()>;

    struct Value;
    using Args = std::vector<Value>;

    struct StateSchema;
    using state_schema_s_ptr = std::shared_ptr<const StateSchema>;

    struct StateRecord;
    using Snapshot = std::shared_ptr<const StateRecord>;

    struct Hooks;
    using hooks_ptr = Hooks *;

    struct Clock;
    using clock_s_ptr = std::shared_ptr<Clock>;

    struct StoreSpec;
    using spec_ptr = std::shared_ptr<const StoreSpec>;

    class StoreInstance;
    using instance_ptr = std::shared_ptr<StoreInstance>;

    class StoreContext;

    class Container;
    using container_ptr = std::shared_ptr<Container>;

    class EffectContext;
} // namespace rstore

#endif  // RSTORE_FORWARD_DECLARATIONS_H
