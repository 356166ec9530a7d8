#pragma once

class ConsoleHistory;
namespace polltimer {
class ActionCatalog;
class TimerRegistry;
}

// Register the host's built-in actions in the default source:
//   print           args -> one console line (yellow)
//   start_timer     [name]          re-arm a timer (repeating timers)
//   stop_timer      [name]
//   trigger_timer   [name]
//   override_timer  [name, delta]
// The actions keep references to `registry` and `history`, which must
// outlive the catalog's use.
void registerBuiltinActions(polltimer::ActionCatalog& catalog,
                            polltimer::TimerRegistry& registry,
                            ConsoleHistory& history);
