#pragma once

#include <stdexcept>
#include <string>

namespace smallspot {

/**
 * @brief 输入或计算超出模型定义域时的错误类别。
 */
enum class DomainErrorKind {
    InvalidWavelength,
    InvalidDuration,
    InvalidPower,
    NumericOverflow,
    InvalidPulseTrain
};

const char* to_string(DomainErrorKind kind);

/**
 * @brief 由评估引擎抛出的定义域错误。
 *
 * 所有定义域错误都在产生任何部分结果之前抛出，由调用方 (I/O 层) 负责捕获。
 */
class DomainError : public std::domain_error {
public:
    DomainError(DomainErrorKind kind, const std::string& message)
        : std::domain_error(std::string(to_string(kind)) + ": " + message), kind_(kind) {}

    DomainErrorKind kind() const { return kind_; }

private:
    DomainErrorKind kind_;
};

} // namespace smallspot
