#pragma once

#include <optional>

// 评估过程中的输入、中间量与结果记录
// 单位约定：波长 nm，时间 s，功率 W，辐照量 J/m²

namespace smallspot {

enum class HazardType {
    Thermal = 0,
    Photochemical = 1
};

inline const char* to_string(HazardType type) {
    return type == HazardType::Thermal ? "Thermal" : "Photochemical";
}

// 单次评估请求
struct ExposureRequest {
    double wavelength_nm = 450.0;   // [400, 500]
    double duration_s = 1.0;        // > 0
    double power_w = 0.0;           // >= 0
};

// 原始光谱加权值 R(λ), B(λ)
struct WeightingFactors {
    double r = 0.0;
    double b = 0.0;
};

// 时间替换规则之后的加权值
struct EffectiveWeighting {
    double r_eff = 0.0;
    double b_eff = 0.0;
};

// 两种危害机制的照射量与限值 (J/m²)
struct HazardLimits {
    double thermal_exposure = 0.0;
    double thermal_limit = 0.0;
    double photochemical_exposure = 0.0;
    double photochemical_limit = 0.0;
};

// 脉冲光源的单脉冲能量检查
struct SinglePulseCheck {
    double pulse_energy_j = 0.0;
    double r_pulse = 0.0;                   // R after substitution at the pulse duration
    double weighted_pulse_energy_j = 0.0;
    double limit_j = 0.0;
    double margin = 0.0;
};

// 评估结果
struct EvaluationResult {
    ExposureRequest request;
    WeightingFactors weighting;
    EffectiveWeighting effective;
    HazardLimits limits;

    double thermal_margin = 0.0;
    double photochemical_margin = 0.0;
    double thermal_safe_duration_s = 0.0;
    double photochemical_safe_duration_s = 0.0;

    HazardType governing_hazard = HazardType::Thermal;
    double margin = 0.0;            // min(thermal_margin, photochemical_margin)
    double safe_duration_s = 0.0;   // for the governing hazard

    std::optional<SinglePulseCheck> single_pulse;
};

} // namespace smallspot
