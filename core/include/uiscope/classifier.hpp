#pragma once
#include "types.hpp"
#include <vector>

namespace uiscope {

// Pure; the same inputs always give the same tag.
//
// Priority: a scroll pattern with real range wins (Scrollable), then an
// enabled, onscreen control from the interactive set (Interactive), then
// anything carrying text (Informative). The rest is Ignored but still walked.
Classification classify(int control_type, const PatternFlags &patterns,
                        bool is_enabled, bool is_offscreen, bool has_text,
                        ClassifierProfile profile = ClassifierProfile::Desktop);

const std::vector<ControlType> &interactive_control_types();

bool is_interactive_type(int control_type, const PatternFlags &patterns,
                         ClassifierProfile profile);

} // namespace uiscope
