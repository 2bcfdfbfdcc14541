#pragma once

namespace wildfetch::cli {

// SIGINT/SIGTERM set a process-wide stop flag that worker threads poll through the
// orchestrator's cancel predicate. Handlers are one-shot: a second signal terminates.
void install_stop_handlers();

// Safe to call from any thread.
bool stop_requested() noexcept;

} // namespace wildfetch::cli
