#pragma once

#include <timeline_model/types.hpp>

namespace timeline_loaders {

// Built-in data set shown when no --data file is given or it fails to load.
timeline_model::TimelineData generate_demo_timeline();

} // namespace timeline_loaders
