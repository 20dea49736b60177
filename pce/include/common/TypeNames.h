#pragma once

#include "types.h"

namespace PCE {

const char *toString(StateKind kind);
const char *toString(ReceiveMode mode);
const char *toString(Persistence persistence);
const char *toString(BundleMode mode);
const char *toString(ReferenceMode mode);
const char *toString(CollectionKind kind);

}  // namespace PCE
