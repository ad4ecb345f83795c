#pragma once

#include "hazard/evaluation_result.h"
#include "config.h"

namespace smallspot {

/**
 * @brief 热危害与光化学 (蓝光) 危害的照射量、限值及其反解。
 *
 * 所有照射量均按固定 0.03 mm 视网膜光斑换算为辐照量 (J/m²)。
 * 调用方负责输入校验；这里只做数值计算。
 */
class HazardCalculator {
public:
    /**
     * @brief 光斑上的辐照量 H = P·t / A。
     * @param power_w 功率 (W)。
     * @param duration_s 照射时间 (s)。
     */
    static double radiant_exposure(double power_w, double duration_s);

    /**
     * @brief 热危害限值 H_T(t) = K_T · t^0.75 / R_eff (J/m²)。
     *
     * K_T 为 1.7 mJ·t^0.75 能量限值除以光斑面积。
     *
     * @param duration_s 照射时间 (s)。
     * @param r_eff 替换规则后的 R。
     */
    static double thermal_limit(double duration_s, double r_eff);

    /**
     * @brief 光化学危害限值 H_B / B_eff (J/m²)，H_B = 2.2 J/cm²。
     *
     * 剂量限值与照射时间无关，长时照射 (包括超过 1e4 s) 也使用同一有限值。
     */
    static double photochemical_limit(double b_eff);

    /**
     * @brief 计算两种危害的照射量与限值。
     * @throws DomainError(NumericOverflow) 任一结果不是有限值。
     */
    static HazardLimits calculate(const ExposureRequest& request, const EffectiveWeighting& effective);

    /**
     * @brief 安全裕度 = 限值 / 照射量；照射量为 0 时为 +∞。
     */
    static double safety_margin(double limit, double exposure);

    /**
     * @brief 在固定功率下，热危害照射量恰好等于限值的最早时间。
     *
     * R_eff 随时间分段变化 (t < 1e-11 s, [1e-11, 10] s, t > 10 s)，因此在每个
     * 区间内用该区间的 R_eff 反解 t = (1.7 mJ / (R_eff·P))^4，并取第一个落在
     * 自身区间内的解。
     *
     * @param raw_r 替换前的 R(λ)。
     * @param power_w 功率 (W)；为 0 时返回 +∞。
     */
    static double thermal_safe_duration(double raw_r, double power_w);

    /**
     * @brief 光化学照射量达到限值的时间 t = H_B·A / (B_eff·P)；功率为 0 时返回 +∞。
     */
    static double photochemical_safe_duration(double b_eff, double power_w);

    /**
     * @brief 脉冲光源的单脉冲能量检查 (限值 40 nJ)。
     *
     * 单脉冲的 R 按脉冲宽度应用替换规则。
     */
    static SinglePulseCheck single_pulse_check(double raw_r, double power_w, const PulseTrain& pulse_train);
};

} // namespace smallspot
