#pragma once

namespace coursedl::detail {

// Runs curl_global_init once per process; cleanup is registered with atexit.
void ensureCurlInitialized();

} // namespace coursedl::detail
