#ifndef NUDGER_BUILTIN_ITEMS_HPP
#define NUDGER_BUILTIN_ITEMS_HPP

#include "../scheduling/item_registry.hpp"
#include "../scheduling/scheduler.hpp"
#include "console_prompter.hpp"

namespace nudger {

// Query items ask their prompt on the console and append the answer to
// their dataset; excursion items spawn their command and finish when it exits.
void registerBuiltinBodies(Scheduler& scheduler, const ItemRegistry& registry,
                           ConsolePrompter& prompter, Clock clock);

} // namespace nudger

#endif // NUDGER_BUILTIN_ITEMS_HPP
