#include "runtime/FsmState.h"
#include "common/TypeNames.h"
#include <stdexcept>
#include <type_traits>

namespace PCE {

namespace {

template <typename T> const T &detailAs(const FsmState::Detail &detail, StateKind kind) {
    if (const T *value = std::get_if<T>(&detail)) {
        return *value;
    }
    throw std::logic_error(std::string("FsmState: state ") + toString(kind) + " has no such parameter");
}

}  // namespace

size_t FsmState::index() const {
    return detailAs<size_t>(detail_, kind_);
}

const std::string &FsmState::label() const {
    return detailAs<std::string>(detail_, kind_);
}

ReceiveMode FsmState::receiveMode() const {
    return detailAs<ReceiveMode>(detail_, kind_);
}

BundleMode FsmState::bundleMode() const {
    return detailAs<BundleMode>(detail_, kind_);
}

ReferenceMode FsmState::referenceMode() const {
    return detailAs<ReferenceMode>(detail_, kind_);
}

CollectionKind FsmState::collectionKind() const {
    return detailAs<CollectionKind>(detail_, kind_);
}

std::string FsmState::describe() const {
    std::string text = toString(kind_);
    std::visit(
        [&text](const auto &detail) {
            using T = std::decay_t<decltype(detail)>;
            if constexpr (std::is_same_v<T, size_t>) {
                text += "(" + std::to_string(detail) + ")";
            } else if constexpr (std::is_same_v<T, std::string>) {
                text += "(" + detail + ")";
            } else if constexpr (!std::is_same_v<T, std::monostate>) {
                text += std::string("(") + toString(detail) + ")";
            }
        },
        detail_);
    return text;
}

}  // namespace PCE
