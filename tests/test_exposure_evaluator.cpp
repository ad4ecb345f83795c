#include <gtest/gtest.h>
#include "exposure_evaluator.h"
#include "constants.h"
#include "errors.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

using namespace smallspot;

namespace {

DomainErrorKind error_kind_of(const ExposureEvaluator& evaluator, double wl, double t, double p) {
    try {
        evaluator.evaluate(wl, t, p);
    } catch (const DomainError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected DomainError for (" << wl << ", " << t << ", " << p << ")";
    return DomainErrorKind::NumericOverflow;
}

} // namespace

// 回归基准：450 nm, 0.1 s, 5 µW
TEST(ExposureEvaluatorTest, ReferenceScenario) {
    ExposureEvaluator evaluator;
    EvaluationResult result = evaluator.evaluate(450.0, 0.1, 5e-6);

    EXPECT_EQ(result.weighting.r, 9.4);
    EXPECT_EQ(result.weighting.b, 0.94);
    EXPECT_EQ(result.effective.r_eff, 9.4);
    EXPECT_EQ(result.effective.b_eff, 0.94);

    EXPECT_NEAR(result.limits.thermal_exposure, 707.3553026306461, 1e-9);
    EXPECT_NEAR(result.limits.photochemical_exposure, 707.3553026306461, 1e-9);
    EXPECT_NEAR(result.limits.thermal_limit, 45497.61977499742, 1e-6);
    EXPECT_NEAR(result.limits.photochemical_limit, 23404.25531914894, 1e-8);

    EXPECT_NEAR(result.thermal_margin, 64.32074461842912, 1e-9);
    EXPECT_NEAR(result.photochemical_margin, 33.086986458020164, 1e-9);

    EXPECT_EQ(result.governing_hazard, HazardType::Photochemical);
    EXPECT_NEAR(result.margin, 33.086986458020164, 1e-9);
    EXPECT_NEAR(result.safe_duration_s, 3.3086986458020164, 1e-12);
    EXPECT_FALSE(result.single_pulse.has_value());
}

// 高功率短时照射：热危害主导
TEST(ExposureEvaluatorTest, ThermalGoverningScenario) {
    ExposureEvaluator evaluator;
    EvaluationResult result = evaluator.evaluate(450.0, 1e-3, 1e-3);

    EXPECT_EQ(result.governing_hazard, HazardType::Thermal);
    EXPECT_NEAR(result.margin, 1.0170002689612696, 1e-12);
    EXPECT_NEAR(result.photochemical_margin, 16.543493229010082, 1e-9);
    EXPECT_NEAR(result.safe_duration_s, 0.0010697548671726692, 1e-15);
}

// 超过 10 s 时 R_eff = 1
TEST(ExposureEvaluatorTest, LongExposureUsesUnitThermalWeight) {
    ExposureEvaluator evaluator;
    EvaluationResult result = evaluator.evaluate(450.0, 20.0, 5e-6);

    EXPECT_EQ(result.weighting.r, 9.4);
    EXPECT_EQ(result.effective.r_eff, 1.0);
    EXPECT_NEAR(result.limits.thermal_limit, 22745161.629592407, 1e-4);
    EXPECT_NEAR(result.thermal_margin, 160.7760735305399, 1e-9);

    EXPECT_EQ(result.governing_hazard, HazardType::Photochemical);
    EXPECT_NEAR(result.margin, 0.1654349322901008, 1e-12);
    EXPECT_LT(result.safe_duration_s, 20.0);
}

// 安全时间是限值方程的解，而不是 margin × t
TEST(ExposureEvaluatorTest, SafeDurationSolvesThermalLimitEquation) {
    ExposureEvaluator evaluator;
    EvaluationResult result = evaluator.evaluate(450.0, 1e-3, 1e-3);
    ASSERT_EQ(result.governing_hazard, HazardType::Thermal);
    EXPECT_GT(std::abs(result.safe_duration_s - result.margin * 1e-3), 1e-6);

    EvaluationResult at_limit = evaluator.evaluate(450.0, result.safe_duration_s, 1e-3);
    EXPECT_NEAR(at_limit.thermal_margin, 1.0, 1e-9);
}

TEST(ExposureEvaluatorTest, ZeroPowerMeansNoHazard) {
    ExposureEvaluator evaluator;
    EvaluationResult result = evaluator.evaluate(450.0, 0.1, 0.0);

    EXPECT_EQ(result.limits.thermal_exposure, 0.0);
    EXPECT_EQ(result.limits.photochemical_exposure, 0.0);
    EXPECT_TRUE(std::isinf(result.margin));
    EXPECT_TRUE(std::isinf(result.safe_duration_s));
    EXPECT_EQ(result.governing_hazard, HazardType::Thermal);

    // 限值本身仍然是有限值
    EXPECT_TRUE(std::isfinite(result.limits.thermal_limit));
    EXPECT_TRUE(std::isfinite(result.limits.photochemical_limit));
}

// 极小功率是合法输入：光化学主导，热安全时间为 +∞
TEST(ExposureEvaluatorTest, VanishingPowerIsValid) {
    ExposureEvaluator evaluator;
    for (double p : {1e-60, 1e-80, 1e-200}) {
        EvaluationResult result = evaluator.evaluate(450.0, 1.0, p);
        EXPECT_EQ(result.governing_hazard, HazardType::Photochemical) << "P = " << p;
        EXPECT_TRUE(std::isfinite(result.margin));
        EXPECT_TRUE(std::isfinite(result.safe_duration_s));
    }
    EvaluationResult tiny = evaluator.evaluate(450.0, 1.0, 1e-80);
    EXPECT_TRUE(std::isinf(tiny.thermal_safe_duration_s));
}

TEST(ExposureEvaluatorTest, ErrorMessagesShowSmallValues) {
    ExposureEvaluator evaluator;
    try {
        evaluator.evaluate(450.0, 1.0, -1e-80);
        FAIL() << "expected InvalidPower";
    } catch (const DomainError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("-1e-80 W"), std::string::npos) << message;
        EXPECT_EQ(message.find("0.000000"), std::string::npos) << message;
    }

    EvaluationConfig config;
    config.evaluate_single_pulse = true;
    config.pulse_train.pulse_duration_s = -6e-12;
    try {
        ExposureEvaluator evaluator_with_pulses(config);
        FAIL() << "expected InvalidPulseTrain";
    } catch (const DomainError& e) {
        EXPECT_NE(std::string(e.what()).find("-6e-12 s"), std::string::npos) << e.what();
    }
}

TEST(ExposureEvaluatorTest, WavelengthBoundaries) {
    ExposureEvaluator evaluator;
    EXPECT_NO_THROW(evaluator.evaluate(400.0, 0.1, 5e-6));
    EXPECT_NO_THROW(evaluator.evaluate(500.0, 0.1, 5e-6));

    EXPECT_EQ(error_kind_of(evaluator, 399.999, 0.1, 5e-6), DomainErrorKind::InvalidWavelength);
    EXPECT_EQ(error_kind_of(evaluator, 500.001, 0.1, 5e-6), DomainErrorKind::InvalidWavelength);
}

TEST(ExposureEvaluatorTest, InvalidInputs) {
    ExposureEvaluator evaluator;
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    EXPECT_EQ(error_kind_of(evaluator, nan, 0.1, 5e-6), DomainErrorKind::InvalidWavelength);
    EXPECT_EQ(error_kind_of(evaluator, 450.0, 0.0, 5e-6), DomainErrorKind::InvalidDuration);
    EXPECT_EQ(error_kind_of(evaluator, 450.0, -1.0, 5e-6), DomainErrorKind::InvalidDuration);
    EXPECT_EQ(error_kind_of(evaluator, 450.0, inf, 5e-6), DomainErrorKind::InvalidDuration);
    EXPECT_EQ(error_kind_of(evaluator, 450.0, 0.1, -1e-9), DomainErrorKind::InvalidPower);
    EXPECT_EQ(error_kind_of(evaluator, 450.0, 0.1, nan), DomainErrorKind::InvalidPower);
    EXPECT_EQ(error_kind_of(evaluator, 450.0, 0.1, inf), DomainErrorKind::InvalidPower);
}

// 校验顺序：波长 -> 时间 -> 功率
TEST(ExposureEvaluatorTest, ValidationOrder) {
    ExposureEvaluator evaluator;
    EXPECT_EQ(error_kind_of(evaluator, 600.0, -1.0, -1.0), DomainErrorKind::InvalidWavelength);
    EXPECT_EQ(error_kind_of(evaluator, 450.0, -1.0, -1.0), DomainErrorKind::InvalidDuration);
}

TEST(ExposureEvaluatorTest, OverflowIsReported) {
    ExposureEvaluator evaluator;
    EXPECT_EQ(error_kind_of(evaluator, 450.0, 1e300, 1e300), DomainErrorKind::NumericOverflow);
}

TEST(ExposureEvaluatorTest, GoverningHazardHasSmallerMargin) {
    ExposureEvaluator evaluator;
    for (double wl : {400.0, 417.3, 437.5, 450.0, 472.0, 500.0}) {
        for (double t : {1e-12, 1e-6, 1e-3, 0.1, 10.0, 20.0, 1e5}) {
            for (double p : {1e-9, 5e-6, 1e-3, 0.1}) {
                EvaluationResult r = evaluator.evaluate(wl, t, p);
                double smallest = std::min(r.thermal_margin, r.photochemical_margin);
                EXPECT_EQ(r.margin, smallest);
                if (r.thermal_margin <= r.photochemical_margin) {
                    EXPECT_EQ(r.governing_hazard, HazardType::Thermal);
                    EXPECT_EQ(r.safe_duration_s, r.thermal_safe_duration_s);
                } else {
                    EXPECT_EQ(r.governing_hazard, HazardType::Photochemical);
                    EXPECT_EQ(r.safe_duration_s, r.photochemical_safe_duration_s);
                }
                EXPECT_GE(r.margin, 0.0);
            }
        }
    }
}

TEST(ExposureEvaluatorTest, MonotonicInDuration) {
    ExposureEvaluator evaluator;
    double previous_exposure = 0.0;
    double previous_limit = 0.0;
    for (double t : {1e-12, 1e-9, 1e-6, 1e-3, 1.0, 10.0, 20.0, 1e3, 1e5}) {
        EvaluationResult r = evaluator.evaluate(450.0, t, 5e-6);
        EXPECT_GT(r.limits.photochemical_exposure, previous_exposure);
        EXPECT_GT(r.limits.thermal_limit, previous_limit);
        previous_exposure = r.limits.photochemical_exposure;
        previous_limit = r.limits.thermal_limit;
    }
}

// 超过 1e4 s 时剂量限值不外推
TEST(ExposureEvaluatorTest, PhotochemicalLimitCappedBeyondCeiling) {
    ExposureEvaluator evaluator;
    EvaluationResult at_ceiling = evaluator.evaluate(450.0, 1e4, 1e-9);
    EvaluationResult beyond = evaluator.evaluate(450.0, 1e6, 1e-9);
    EXPECT_EQ(beyond.limits.photochemical_limit, at_ceiling.limits.photochemical_limit);
    EXPECT_TRUE(std::isfinite(beyond.limits.photochemical_limit));
}

TEST(ExposureEvaluatorTest, RequestOverloadMatches) {
    ExposureEvaluator evaluator;
    ExposureRequest request;
    request.wavelength_nm = 463.0;
    request.duration_s = 2.5;
    request.power_w = 2e-6;

    EvaluationResult a = evaluator.evaluate(request);
    EvaluationResult b = evaluator.evaluate(463.0, 2.5, 2e-6);
    EXPECT_EQ(a.margin, b.margin);
    EXPECT_EQ(a.safe_duration_s, b.safe_duration_s);
    EXPECT_EQ(a.request.wavelength_nm, 463.0);
}

// 纯函数：相同输入得到逐位相同的结果
TEST(ExposureEvaluatorTest, Idempotent) {
    ExposureEvaluator evaluator;
    EvaluationResult first = evaluator.evaluate(452.5, 0.37, 7.5e-6);
    EvaluationResult second = evaluator.evaluate(452.5, 0.37, 7.5e-6);

    EXPECT_EQ(first.weighting.r, second.weighting.r);
    EXPECT_EQ(first.weighting.b, second.weighting.b);
    EXPECT_EQ(first.limits.thermal_exposure, second.limits.thermal_exposure);
    EXPECT_EQ(first.limits.thermal_limit, second.limits.thermal_limit);
    EXPECT_EQ(first.limits.photochemical_limit, second.limits.photochemical_limit);
    EXPECT_EQ(first.governing_hazard, second.governing_hazard);
    EXPECT_EQ(first.margin, second.margin);
    EXPECT_EQ(first.safe_duration_s, second.safe_duration_s);
}

TEST(ExposureEvaluatorTest, SinglePulseCheckWhenEnabled) {
    EvaluationConfig config;
    config.evaluate_single_pulse = true;
    ExposureEvaluator evaluator(config);

    EvaluationResult result = evaluator.evaluate(450.0, 0.1, 5e-6);
    ASSERT_TRUE(result.single_pulse.has_value());
    EXPECT_NEAR(result.single_pulse->margin, 50212.765957446805, 1e-6);

    // 单脉冲检查不影响主导危害的判定
    EvaluationResult plain = ExposureEvaluator().evaluate(450.0, 0.1, 5e-6);
    EXPECT_EQ(result.governing_hazard, plain.governing_hazard);
    EXPECT_EQ(result.margin, plain.margin);
}

TEST(ExposureEvaluatorTest, InvalidPulseTrainRejected) {
    EvaluationConfig config;
    config.evaluate_single_pulse = true;
    config.pulse_train.repetition_rate_hz = 0.0;

    try {
        ExposureEvaluator evaluator(config);
        FAIL() << "expected InvalidPulseTrain";
    } catch (const DomainError& e) {
        EXPECT_EQ(e.kind(), DomainErrorKind::InvalidPulseTrain);
    }

    config.pulse_train.repetition_rate_hz = 59e6;
    config.pulse_train.pulse_duration_s = -1.0;
    EXPECT_THROW(ExposureEvaluator{config}, DomainError);

    // 未启用时不校验
    config.evaluate_single_pulse = false;
    EXPECT_NO_THROW(ExposureEvaluator{config});
}
