#pragma once

#include <vector>
#include "hazard/evaluation_result.h"

namespace smallspot {

/**
 * @brief 光谱加权函数表中的一个节点 (λ, R(λ), B(λ))。
 */
struct WeightingKnot {
    double wavelength_nm;
    double r;   // 热危害加权 R(λ)
    double b;   // 蓝光危害加权 B(λ)
};

/**
 * @brief 返回 400–500 nm 范围内按波长升序排列的加权函数节点表 (5 nm 间隔)。
 *
 * 表中数值取自 ISO 15004-2 附录 A，可独立于插值代码进行核对。
 */
const std::vector<WeightingKnot>& weighting_table();

/**
 * @brief 计算给定波长处的 R(λ) 与 B(λ)。
 *
 * 在节点处精确返回表值；节点之间使用对数线性插值，保证连续。
 *
 * @param wavelength_nm 波长 (nm)，必须在 [400, 500] 内。
 * @return 原始加权值 (尚未应用时间替换规则)。
 * @throws DomainError(InvalidWavelength) 波长超出范围或为 NaN。
 */
WeightingFactors weighting_at(double wavelength_nm);

} // namespace smallspot
