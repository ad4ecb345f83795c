#pragma once

#include "config.h"
#include "hazard/evaluation_result.h"

namespace smallspot {

/**
 * @brief 小光斑视网膜光危害评估器 (ISO 15004-2, 400–500 nm, 0.03 mm 光斑)。
 *
 * 对给定的波长、照射时间和功率，计算 R(λ)/B(λ)、时间替换后的加权值、
 * 两种危害机制的照射量与限值，并确定起主导作用的危害、安全裕度及最大安全照射时间。
 *
 * 评估器除了构造时传入的只读配置外不持有任何状态；相同输入总是得到相同结果。
 */
class ExposureEvaluator {
public:
    /**
     * @brief 使用默认配置构造 (不做单脉冲检查)。
     */
    ExposureEvaluator() = default;

    /**
     * @brief 使用给定配置构造。
     * @throws DomainError(InvalidPulseTrain) 启用单脉冲检查但脉冲参数无效。
     */
    explicit ExposureEvaluator(const EvaluationConfig& config);

    /**
     * @brief 评估一次照射。
     * @param request 波长 (nm)、照射时间 (s)、功率 (W)。
     * @return 完整的评估结果。
     * @throws DomainError 输入超出定义域，或计算结果不是有限值。
     */
    EvaluationResult evaluate(const ExposureRequest& request) const;

    EvaluationResult evaluate(double wavelength_nm, double duration_s, double power_w) const;

    const EvaluationConfig& config() const { return config_; }

    /**
     * @brief 按 波长 -> 时间 -> 功率 的顺序校验输入，第一个无效项抛出 DomainError。
     */
    static void validate(const ExposureRequest& request);

private:
    EvaluationConfig config_;
};

} // namespace smallspot
