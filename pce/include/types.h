#pragma once

#include <cstdint>

namespace PCE {

using InstanceId = uint64_t;
using EntryId = uint64_t;

// Reserved id for publishes that originate outside the process tree
constexpr InstanceId EXTERNAL_ORIGIN = 0;

enum class StateKind {
    INITIAL,        // Fresh instance, nothing evaluated yet
    EVALUATING,     // Waiting for an operand's sub-process to produce a value
    SENDING,        // Publishing the evaluated payload
    RECEIVING,      // Registered on the channel store, waiting for a message
    WAITING,        // Synchronous send waiting for its acknowledgement
    BRANCHING,      // Conditional picks exactly one branch
    FORKING,        // Parallel composition spawning its operands
    JOINING,        // Waiting for every pending child to terminate
    BINDING,        // Introducing one name into scope
    MATCHING,       // Trying one match case
    CONSTRUCTING,   // Building a composite value (channel names)
    OPERATING,      // Applying an operator or method
    BUNDLING,       // Installing a capability restriction
    REFERENCING,    // Reading a bound variable
    INTERPOLATING,  // String interpolation
    CONJOINING,     // Conjunction
    DISJOINING,     // Disjunction
    NEGATING,       // Negation
    COLLECTING,     // Building a collection literal
    TERMINATING,    // Failing; never held between steps since children are cancelled at once
    TERMINATED      // Absorbing final state
};

enum class ReceiveMode {
    ONE_SHOT,    // Linear receive, consumed by the first match
    PERSISTENT,  // Replicated receive (contract), survives matches
    PEEK,        // Reads without consuming the send entry
    RACE         // One arm of a select
};

enum class Persistence {
    ONCE,       // Consumed by the first match
    PERSISTENT  // Survives matches
};

enum class BundleMode {
    READ,   // bundle-: receive only
    WRITE,  // bundle+: send only
    EQUIV,  // bundle0: neither direction
    RW      // bundle: both directions
};

enum class ReferenceMode { COPY, MOVE };

enum class CollectionKind { SET, MAP, LIST, TUPLE };

}  // namespace PCE
