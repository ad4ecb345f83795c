#pragma once

// Evaluation options. Defaults describe the mode-locked source the
// calculator was written for (59 MHz, 6 ps).

namespace smallspot {

struct PulseTrain {
    double repetition_rate_hz = 59e6;
    double pulse_duration_s = 6e-12;
};

struct EvaluationConfig {
    bool evaluate_single_pulse = false;   // 是否执行单脉冲能量检查
    PulseTrain pulse_train;
};

} // namespace smallspot
