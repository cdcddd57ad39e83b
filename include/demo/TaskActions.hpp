#pragma once
#include "state/Store.hpp"
#include <nlohmann/json.hpp>

// Store layout used by the demo:
//   tasks            [{id, title, done}]
//   next_id          int
//   filter.hide_done bool
//   stats.total      int
//   stats.done       int
nlohmann::json initialTaskState();

// state/reset {whole state}, task/add {title}, task/toggle {id},
// task/remove {id}, filter/toggle_done, stats/recount
void registerTaskActions(Store& store);
