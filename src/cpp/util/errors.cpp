#include <rstore/util/errors.h>

namespace rstore {

    SetupPhaseError::SetupPhaseError(std::string_view method, std::string_view hint)
        : StoreError{fmt::format("{}() can only be called during setup phase. "
                                 "Do not call {}() inside actions or deferred callbacks.{}{}",
                                 method, method, hint.empty() ? "" : " ", hint)} {}

    CircularDependencyError::CircularDependencyError(std::string_view spec_name)
        : StoreError{fmt::format("Circular dependency detected: \"{}\" is being created while already in creation stack.",
                                 spec_name)},
          _spec_name{spec_name} {}

    LifetimeMismatchError::LifetimeMismatchError(std::string_view parent_name, std::string_view child_name,
                                                 std::string_view operation)
        : StoreError{fmt::format("Lifetime mismatch: Store \"{0}\" (keepAlive) cannot {2} store \"{1}\" (autoDispose). "
                                 "A long-lived store cannot {2} a store that may be disposed. "
                                 "Either change \"{0}\" to autoDispose, or change \"{1}\" to keepAlive.",
                                 parent_name, child_name, operation)},
          _parent_name{parent_name}, _child_name{child_name} {}

    DisposedInstanceError::DisposedInstanceError(std::string_view store_id)
        : StoreError{fmt::format("Cannot call action on disposed store: {}", store_id)} {}

    HooksContextError::HooksContextError(std::string_view method, std::string_view required_context)
        : StoreError{fmt::format("{}() must be called inside {}. It requires an active tracking context.", method,
                                 required_context)} {}

    AsyncFunctionError::AsyncFunctionError(std::string_view context, std::string_view hint)
        : StoreError{fmt::format("{} must be synchronous. {}", context, hint)} {}

    UnknownPropertyError::UnknownPropertyError(std::string_view store_id, std::string_view property)
        : StoreError{fmt::format("Store '{}' has no state property '{}'", store_id, property)} {}

    UnknownActionError::UnknownActionError(std::string_view store_id, std::string_view action)
        : StoreError{fmt::format("Store '{}' has no action '{}'", store_id, action)} {}

} // namespace rstore
