#pragma once

#include <string>

enum class NettingTarget {
    Zero,   // settle every entity to a flat position
    Mean    // settle every entity to the group's average position
};

struct EngineConfig {
    std::string reporting_ccy = "USD";
    double netting_epsilon = 0.01;
    NettingTarget netting_target = NettingTarget::Zero;
    bool netting_exclude_pooled = false;
    int top_n_entities = 5;
    double efficiency_epsilon = 1e-6;
    bool parallel_rollups = true;
    int rollup_workers = 8;         // concurrent rollup tasks per batch
};
