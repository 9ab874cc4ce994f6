#pragma once

namespace agui::core::config {

    // Knobs for the canonicalize -> verify -> reduce pipeline.
    struct PipelineOptions {
        bool canonicalize = true;
        bool verify = true;
        // When set, the first verification failure aborts the run.
        // Otherwise it is logged with the offending event and the event still applies.
        bool strict = false;
        bool debug = false;
    };

} // namespace agui::core::config
