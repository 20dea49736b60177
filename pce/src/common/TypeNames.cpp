#include "common/TypeNames.h"

namespace PCE {

const char *toString(StateKind kind) {
    switch (kind) {
    case StateKind::INITIAL:
        return "INITIAL";
    case StateKind::EVALUATING:
        return "EVALUATING";
    case StateKind::SENDING:
        return "SENDING";
    case StateKind::RECEIVING:
        return "RECEIVING";
    case StateKind::WAITING:
        return "WAITING";
    case StateKind::BRANCHING:
        return "BRANCHING";
    case StateKind::FORKING:
        return "FORKING";
    case StateKind::JOINING:
        return "JOINING";
    case StateKind::BINDING:
        return "BINDING";
    case StateKind::MATCHING:
        return "MATCHING";
    case StateKind::CONSTRUCTING:
        return "CONSTRUCTING";
    case StateKind::OPERATING:
        return "OPERATING";
    case StateKind::BUNDLING:
        return "BUNDLING";
    case StateKind::REFERENCING:
        return "REFERENCING";
    case StateKind::INTERPOLATING:
        return "INTERPOLATING";
    case StateKind::CONJOINING:
        return "CONJOINING";
    case StateKind::DISJOINING:
        return "DISJOINING";
    case StateKind::NEGATING:
        return "NEGATING";
    case StateKind::COLLECTING:
        return "COLLECTING";
    case StateKind::TERMINATING:
        return "TERMINATING";
    case StateKind::TERMINATED:
        return "TERMINATED";
    }
    return "UNKNOWN";
}

const char *toString(ReceiveMode mode) {
    switch (mode) {
    case ReceiveMode::ONE_SHOT:
        return "ONE_SHOT";
    case ReceiveMode::PERSISTENT:
        return "PERSISTENT";
    case ReceiveMode::PEEK:
        return "PEEK";
    case ReceiveMode::RACE:
        return "RACE";
    }
    return "UNKNOWN";
}

const char *toString(Persistence persistence) {
    return persistence == Persistence::PERSISTENT ? "PERSISTENT" : "ONCE";
}

const char *toString(BundleMode mode) {
    switch (mode) {
    case BundleMode::READ:
        return "READ";
    case BundleMode::WRITE:
        return "WRITE";
    case BundleMode::EQUIV:
        return "EQUIV";
    case BundleMode::RW:
        return "RW";
    }
    return "UNKNOWN";
}

const char *toString(ReferenceMode mode) {
    return mode == ReferenceMode::MOVE ? "MOVE" : "COPY";
}

const char *toString(CollectionKind kind) {
    switch (kind) {
    case CollectionKind::SET:
        return "SET";
    case CollectionKind::MAP:
        return "MAP";
    case CollectionKind::LIST:
        return "LIST";
    case CollectionKind::TUPLE:
        return "TUPLE";
    }
    return "UNKNOWN";
}

}  // namespace PCE
