#ifndef PUSHLINE_CONFIG_H_
#define PUSHLINE_CONFIG_H_

#include <cstdint>

namespace Pushline {

/// Process exit codes
/// Everything was pushed (or pre-pushed)
const int kExitSuccess = 0;
/// Command line or configuration could not be used
const int kExitUsage = 2;
/// A stage recorded a fatal error
const int kExitFatalError = 59;

/// Lifecycle labels reported to the item-state sink
/// Loaded, not yet known to be in the remote service
const char kStatePending[] = "PENDING";
/// Present in the remote service
const char kStateExists[] = "EXISTS";
/// Published
const char kStatePushed[] = "PUSHED";

/// Repositories whose id starts with this prefix are never published for errata.
const char kAllRpmContentPrefix[] = "all-rpm-content";

} // namespace Pushline

#endif // PUSHLINE_CONFIG_H_
